#pragma once

#include <chronicle/schema/checkpoint.hpp>
#include <chronicle/schema/error_code.hpp>
#include <chronicle/schema/primitives.hpp>
#include <chronicle/schema/verification_result.hpp>
#include <cstdint>
#include <optional>

// Schema type: chain status.
// Audit workflow: dashboard summary of one chain: length, tip, latest
// witness and the verdict of a full verification.
namespace chronicle::schema {

template <uint16_t Version>
struct chain_status;

template <>
struct chain_status<1> final {
  uint16_t version{1};
  error_code code{error_code::ok};
  chain_id_t chain_id;
  uint64_t length{};
  hash32_t tip_hash{};
  std::optional<timestamp_microseconds_t> created_at;
  std::optional<checkpoint_t> latest_checkpoint;
  verification_result_t verification;
};

using chain_status_t = chain_status<1>;

}  // namespace chronicle::schema
