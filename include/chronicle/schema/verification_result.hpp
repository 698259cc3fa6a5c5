#pragma once

#include <chronicle/schema/error_code.hpp>
#include <chronicle/schema/integrity_failure.hpp>
#include <chronicle/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>

// Schema type: verification result.
// Audit workflow: verdict of a chain walk. `valid` results carry the covered
// range (absent for an empty chain); `broken` results carry the first bad
// sequence and the reason. Carries no wall-clock data so repeated runs on an
// unchanged chain compare equal.
namespace chronicle::schema {

enum class verification_status : uint8_t {
  valid = 0,
  broken = 1,
  error = 2,
};

template <uint16_t Version>
struct verification_result;

template <>
struct verification_result<1> final {
  uint16_t version{1};
  verification_status status{verification_status::valid};
  error_code code{error_code::ok};
  chain_id_t chain_id;
  std::optional<sequence_range> covered;
  uint64_t entries_checked{};
  std::optional<sequence_t> first_bad_sequence;
  integrity_failure reason{integrity_failure::none};
  hash32_t tip_hash{};
  bool cancelled{};
  std::string detail;

  bool valid() const { return status == verification_status::valid; }
  bool operator==(const verification_result&) const = default;
};

using verification_result_t = verification_result<1>;

}  // namespace chronicle::schema
