#pragma once

#include <chronicle/schema/audit_entry.hpp>
#include <chronicle/schema/error_code.hpp>
#include <chronicle/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Schema type: evidence package.
// Audit workflow: a self-contained export of a chain window handed to an
// auditor. `package_hash` is SHA-256 over the canonical package body.
namespace chronicle::schema {

struct evidence_request final {
  chain_id_t chain_id;
  std::optional<sequence_t> from_sequence;
  std::optional<sequence_t> to_sequence;
  std::optional<timestamp_microseconds_t> from_timestamp;
  std::optional<timestamp_microseconds_t> to_timestamp;
  /// Restrict the package to entries about one kind of resource, or one
  /// resource.
  std::optional<std::string> resource_type;
  std::optional<std::string> resource_id;
};

template <uint16_t Version>
struct evidence_package;

template <>
struct evidence_package<1> final {
  uint16_t version{1};
  error_code code{error_code::ok};
  std::string log;
  chain_id_t chain_id;
  timestamp_microseconds_t exported_at{};
  std::optional<timestamp_microseconds_t> from_timestamp;
  std::optional<timestamp_microseconds_t> to_timestamp;
  std::optional<std::string> resource_type;
  std::optional<std::string> resource_id;
  std::vector<audit_entry_t> entries;
  hash32_t package_hash{};
};

using evidence_package_t = evidence_package<1>;

}  // namespace chronicle::schema
