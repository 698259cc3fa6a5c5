#pragma once

#include <chronicle/schema/enum_string.hpp>
#include <array>
#include <cstdint>
#include <string_view>
#include <utility>

// Schema type: error code.
// Audit workflow: failure taxonomy shared by the append, verification,
// checkpoint and query paths. Values are stable on the wire.
namespace chronicle::schema {

enum class error_code : uint32_t {
  ok = 0,
  serialization_error = 1,
  concurrent_append_conflict = 2,
  chain_integrity_error = 3,
  genesis_missing = 4,
  unknown_predecessor = 5,
  checkpoint_export_failure = 6,
  store_unavailable = 7,
  invalid_argument = 8,
  chain_empty = 9,
  not_found = 10,
};

inline constexpr auto kErrorCodeNames =
    std::array<std::pair<std::string_view, error_code>, 11>{{
        {"ok", error_code::ok},
        {"serialization_error", error_code::serialization_error},
        {"concurrent_append_conflict", error_code::concurrent_append_conflict},
        {"chain_integrity_error", error_code::chain_integrity_error},
        {"genesis_missing", error_code::genesis_missing},
        {"unknown_predecessor", error_code::unknown_predecessor},
        {"checkpoint_export_failure", error_code::checkpoint_export_failure},
        {"store_unavailable", error_code::store_unavailable},
        {"invalid_argument", error_code::invalid_argument},
        {"chain_empty", error_code::chain_empty},
        {"not_found", error_code::not_found},
    }};

constexpr std::string_view to_string(const error_code code) {
  return to_string(code, kErrorCodeNames).value_or("unknown");
}

}  // namespace chronicle::schema
