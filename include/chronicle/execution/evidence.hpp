#pragma once

#include <chronicle/execution/types.hpp>
#include <chronicle/schema/evidence_package.hpp>
#include <nlohmann/json.hpp>

namespace chronicle::execution {

/// Maximum number of entries a single package may carry.
inline constexpr std::size_t kMaxPackageEntries = 100000;

/// Collect the entries of one chain inside the requested sequence and time
/// windows, optionally narrowed to one resource type or resource, in
/// sequence order, and seal them with a package hash.
chronicle::schema::evidence_package_t export_package(
    const store_t& storage,
    const chronicle::schema::evidence_request& request,
    chronicle::schema::timestamp_microseconds_t exported_at);

/// Package body without `package_hash`. Object keys serialize in sorted
/// order, so `dump()` of the body is canonical.
nlohmann::json package_body(const chronicle::schema::evidence_package_t& value);

/// Body plus `package_hash`.
nlohmann::json to_json(const chronicle::schema::evidence_package_t& value);

/// SHA-256 over the compact dump of `package_body`.
chronicle::schema::hash32_t compute_package_hash(
    const chronicle::schema::evidence_package_t& value);

}  // namespace chronicle::execution
