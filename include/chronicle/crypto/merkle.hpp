#pragma once

#include <chronicle/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

// Merkle tree over the entry hashes of a chain, in sequence order.
//
// leaf = SHA-256(0x00 || entry_hash), node = SHA-256(0x01 || left || right).
// A tree of n > 1 leaves splits at the largest power of two below n, so the
// root of the first n entries never changes as the chain grows.
namespace chronicle::crypto {

chronicle::schema::hash32_t merkle_leaf(
    const chronicle::schema::hash32_t& entry_hash);
chronicle::schema::hash32_t merkle_node(const chronicle::schema::hash32_t& left,
                                        const chronicle::schema::hash32_t& right);

/// Running Merkle root of a growing leaf sequence. Holds one subtree root
/// per set bit of `size()`, largest subtree first.
class merkle_accumulator final {
 public:
  merkle_accumulator() = default;

  /// Resume from the peaks of an earlier accumulator. Returns nullopt when
  /// the peak count does not match `size`.
  static std::optional<merkle_accumulator> resume(
      uint64_t size,
      std::vector<chronicle::schema::hash32_t> peaks);

  void append(const chronicle::schema::hash32_t& entry_hash);

  uint64_t size() const;
  const std::vector<chronicle::schema::hash32_t>& peaks() const;

  /// Root of every leaf appended so far. The empty tree hashes to
  /// SHA-256 of no bytes.
  chronicle::schema::hash32_t root() const;

 private:
  uint64_t size_{};
  std::vector<chronicle::schema::hash32_t> peaks_;
};

chronicle::schema::hash32_t merkle_root(
    std::span<const chronicle::schema::hash32_t> entry_hashes);

/// Sibling hashes from the leaf at `index` up to the root, bottom-up.
/// `index` must be below `entry_hashes.size()`.
std::vector<chronicle::schema::hash32_t> merkle_path(
    std::span<const chronicle::schema::hash32_t> entry_hashes,
    uint64_t index);

/// Fold an audit path back into the root it proves membership in. Returns
/// nullopt when the path cannot belong to a leaf at `index` of a tree of
/// `tree_size` leaves.
std::optional<chronicle::schema::hash32_t> root_from_path(
    const chronicle::schema::hash32_t& entry_hash,
    uint64_t index,
    uint64_t tree_size,
    std::span<const chronicle::schema::hash32_t> path);

bool verify_inclusion(const chronicle::schema::hash32_t& entry_hash,
                      uint64_t index,
                      uint64_t tree_size,
                      std::span<const chronicle::schema::hash32_t> path,
                      const chronicle::schema::hash32_t& root);

}  // namespace chronicle::crypto
