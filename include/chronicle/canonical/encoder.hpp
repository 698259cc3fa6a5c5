#pragma once

#include <chronicle/schema/audit_entry.hpp>
#include <chronicle/schema/primitives.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace chronicle::canonical {

/// Domain separation tag leading every canonical encoding.
inline constexpr std::string_view kDomainTag{"chronicle.audit.v1"};

/// Deepest payload nesting accepted by the encoder.
inline constexpr std::size_t kMaxPayloadDepth = 64;

/// Canonical bytes of an entry's logical fields, using `payload` in place of
/// the entry's stored payload text.
///
/// The layout is fixed: domain tag, chain id, sequence, timestamp, actor,
/// action, resource type, resource id, payload tree. Every variable-length
/// component is length prefixed. Returns std::nullopt and fills `error` when
/// a field cannot be encoded (invalid UTF-8, floating point, binary or
/// discarded payload values, nesting deeper than kMaxPayloadDepth).
std::optional<chronicle::schema::bytes_t> encode(
    const chronicle::schema::audit_entry_t& entry,
    const nlohmann::json& payload,
    std::string& error);

/// Canonical bytes of a stored entry. Its payload text is parsed and must
/// equal payload_text() of the parsed value byte for byte; any other spelling
/// of the same value is refused.
std::optional<chronicle::schema::bytes_t> encode(
    const chronicle::schema::audit_entry_t& entry,
    std::string& error);

/// Canonical bytes of a payload value alone.
std::optional<chronicle::schema::bytes_t> encode_payload(
    const nlohmann::json& payload,
    std::string& error);

/// Validated compact JSON text stored as `audit_entry::payload`.
std::optional<std::string> payload_text(const nlohmann::json& payload,
                                        std::string& error);

/// Recompute SHA-256(previous_hash || canonical(entry)).
std::optional<chronicle::schema::hash32_t> compute_entry_hash(
    const chronicle::schema::audit_entry_t& entry,
    std::string& error);

bool is_valid_utf8(const std::string_view& text);

}  // namespace chronicle::canonical
