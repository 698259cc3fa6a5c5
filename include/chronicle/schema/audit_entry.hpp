#pragma once

#include <chronicle/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: audit entry.
// Audit workflow: one committed, hash-linked action record. `payload` holds
// the compact JSON text of the event payload; the canonical encoder parses it
// back when recomputing `entry_hash`.
namespace chronicle::schema {

template <uint16_t Version>
struct audit_entry;

template <>
struct audit_entry<1> final {
  uint16_t version{1};
  chain_id_t chain_id;
  sequence_t sequence{};
  timestamp_microseconds_t timestamp{};
  std::string actor_id;
  std::string action;
  std::string resource_type;
  std::string resource_id;
  std::string payload;
  hash32_t previous_hash{};
  hash32_t entry_hash{};

  bool operator==(const audit_entry&) const = default;
};

using audit_entry_t = audit_entry<1>;

}  // namespace chronicle::schema
