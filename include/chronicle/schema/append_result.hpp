#pragma once

#include <chronicle/schema/audit_entry.hpp>
#include <chronicle/schema/error_code.hpp>
#include <cstdint>
#include <optional>
#include <string>

// Schema type: append result.
// Audit workflow: outcome of one append; `entry` is set only on success.
namespace chronicle::schema {

template <uint16_t Version>
struct append_result;

template <>
struct append_result<1> final {
  uint16_t version{1};
  error_code code{error_code::ok};
  std::string log;
  uint32_t attempts{};
  std::optional<audit_entry_t> entry;

  bool ok() const { return code == error_code::ok; }
};

using append_result_t = append_result<1>;

}  // namespace chronicle::schema
