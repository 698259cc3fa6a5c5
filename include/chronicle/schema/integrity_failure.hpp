#pragma once

#include <chronicle/schema/enum_string.hpp>
#include <array>
#include <cstdint>
#include <string_view>
#include <utility>

// Schema type: integrity failure.
// Audit workflow: reason attached to a broken verification result.
// hash_mismatch means content changed without rehashing; the linkage family
// means entries were reordered, deleted, duplicated or grafted.
namespace chronicle::schema {

enum class integrity_failure : uint16_t {
  none = 0,
  hash_mismatch = 1,
  linkage_mismatch = 2,
  genesis_missing = 3,
  unknown_predecessor = 4,
  checkpoint_mismatch = 5,
};

inline constexpr auto kIntegrityFailureNames =
    std::array<std::pair<std::string_view, integrity_failure>, 6>{{
        {"none", integrity_failure::none},
        {"hash_mismatch", integrity_failure::hash_mismatch},
        {"linkage_mismatch", integrity_failure::linkage_mismatch},
        {"genesis_missing", integrity_failure::genesis_missing},
        {"unknown_predecessor", integrity_failure::unknown_predecessor},
        {"checkpoint_mismatch", integrity_failure::checkpoint_mismatch},
    }};

constexpr std::string_view to_string(const integrity_failure failure) {
  return to_string(failure, kIntegrityFailureNames).value_or("unknown");
}

}  // namespace chronicle::schema
