#pragma once

#include <chronicle/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Schema type: checkpoint.
// Audit workflow: periodic witness of a chain tip and of the Merkle root over
// every entry hash up to it. Immutable except for the export bookkeeping
// fields, which the checkpoint manager updates once the witness reaches its
// external destination.
namespace chronicle::schema {

template <uint16_t Version>
struct checkpoint;

template <>
struct checkpoint<1> final {
  uint16_t version{1};
  chain_id_t chain_id;
  sequence_t sequence{};
  hash32_t root_hash{};
  hash32_t merkle_root{};
  /// Subtree roots the next checkpoint resumes the Merkle root from.
  std::vector<hash32_t> merkle_peaks;
  timestamp_microseconds_t created_at{};
  bool exported{};
  std::optional<timestamp_microseconds_t> exported_at;
  std::string export_destination;
  uint32_t export_attempts{};

  bool operator==(const checkpoint&) const = default;
};

using checkpoint_t = checkpoint<1>;

}  // namespace chronicle::schema
