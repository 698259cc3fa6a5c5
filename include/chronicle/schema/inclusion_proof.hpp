#pragma once

#include <chronicle/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <vector>

// Schema type: inclusion proof.
// Audit workflow: Merkle audit path from one entry hash to the root over the
// first `tree_size` entries of its chain. When `checkpoint_sequence` is set
// the root is the one that checkpoint witnessed; otherwise it covers the
// head at lookup time and nothing outside the store vouches for it yet.
namespace chronicle::schema {

template <uint16_t Version>
struct inclusion_proof;

template <>
struct inclusion_proof<1> final {
  uint16_t version{1};
  sequence_t leaf_index{};
  uint64_t tree_size{};
  hash32_t merkle_root{};
  std::vector<hash32_t> path;
  std::optional<sequence_t> checkpoint_sequence;

  bool operator==(const inclusion_proof&) const = default;
};

using inclusion_proof_t = inclusion_proof<1>;

}  // namespace chronicle::schema
