#pragma once

#include <chronicle/schema/audit_entry.hpp>
#include <chronicle/schema/error_code.hpp>
#include <chronicle/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Schema type: query filter and page.
// Audit workflow: AND-combined read filters. Results are returned in
// ascending sequence order per chain, `page_size` at a time; an empty
// `next_page_token` marks the last page.
namespace chronicle::schema {

struct query_filter final {
  std::optional<chain_id_t> chain_id;
  std::optional<std::string> actor_id;
  std::optional<std::string> resource_type;
  std::optional<std::string> resource_id;
  std::optional<timestamp_microseconds_t> from_timestamp;
  std::optional<timestamp_microseconds_t> to_timestamp;
  uint32_t page_size{100};
  bytes_t page_token;
};

struct query_page final {
  error_code code{error_code::ok};
  std::string log;
  std::vector<audit_entry_t> entries;
  bytes_t next_page_token;
};

inline constexpr auto kMaxQueryPageSize = uint32_t{1000};

}  // namespace chronicle::schema
