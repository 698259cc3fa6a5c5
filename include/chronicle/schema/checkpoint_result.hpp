#pragma once

#include <chronicle/schema/checkpoint.hpp>
#include <chronicle/schema/error_code.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Schema type: checkpoint result.
// Audit workflow: outcome of a checkpoint run. `checkpoint` is the record
// created (or reused) by the run; `stale` lists unexported checkpoints past
// the staleness threshold, which turns `code` into
// checkpoint_export_failure even though the run itself persisted fine.
namespace chronicle::schema {

template <uint16_t Version>
struct checkpoint_result;

template <>
struct checkpoint_result<1> final {
  uint16_t version{1};
  error_code code{error_code::ok};
  std::string log;
  std::optional<checkpoint_t> checkpoint;
  bool created{};
  uint32_t retried_exports{};
  std::vector<checkpoint_t> stale;

  bool ok() const { return code == error_code::ok; }
};

using checkpoint_result_t = checkpoint_result<1>;

}  // namespace chronicle::schema
