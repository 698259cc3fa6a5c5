#include <bit>
#include <chronicle/common/critical.hpp>
#include <chronicle/crypto/hash.hpp>
#include <chronicle/crypto/merkle.hpp>
#include <iterator>

using namespace chronicle::schema;

namespace chronicle::crypto {

namespace {

constexpr uint8_t kLeafPrefix = 0x00;
constexpr uint8_t kNodePrefix = 0x01;

void collect_path(const std::span<const hash32_t> hashes,
                  const uint64_t index,
                  std::vector<hash32_t>& path) {
  if (hashes.size() <= 1) {
    return;
  }
  const auto split = std::bit_floor(hashes.size() - 1);
  if (index < split) {
    collect_path(hashes.first(split), index, path);
    path.push_back(merkle_root(hashes.subspan(split)));
  } else {
    collect_path(hashes.subspan(split), index - split, path);
    path.push_back(merkle_root(hashes.first(split)));
  }
}

}  // namespace

hash32_t merkle_leaf(const hash32_t& entry_hash) {
  return sha256_hasher{}
      .update(bytes_view_t{&kLeafPrefix, 1})
      .update(entry_hash)
      .finalize();
}

hash32_t merkle_node(const hash32_t& left, const hash32_t& right) {
  return sha256_hasher{}
      .update(bytes_view_t{&kNodePrefix, 1})
      .update(left)
      .update(right)
      .finalize();
}

std::optional<merkle_accumulator> merkle_accumulator::resume(
    const uint64_t size,
    std::vector<hash32_t> peaks) {
  if (static_cast<std::size_t>(std::popcount(size)) != peaks.size()) {
    return std::nullopt;
  }
  auto accumulator = merkle_accumulator{};
  accumulator.size_ = size;
  accumulator.peaks_ = std::move(peaks);
  return accumulator;
}

void merkle_accumulator::append(const hash32_t& entry_hash) {
  auto node = merkle_leaf(entry_hash);
  for (auto pending = size_; pending & 1; pending >>= 1) {
    node = merkle_node(peaks_.back(), node);
    peaks_.pop_back();
  }
  peaks_.push_back(node);
  ++size_;
}

uint64_t merkle_accumulator::size() const {
  return size_;
}

const std::vector<hash32_t>& merkle_accumulator::peaks() const {
  return peaks_;
}

hash32_t merkle_accumulator::root() const {
  if (peaks_.empty()) {
    return sha256(bytes_view_t{});
  }
  auto root = peaks_.back();
  for (auto it = std::next(peaks_.rbegin()); it != peaks_.rend(); ++it) {
    root = merkle_node(*it, root);
  }
  return root;
}

hash32_t merkle_root(const std::span<const hash32_t> entry_hashes) {
  auto accumulator = merkle_accumulator{};
  for (const auto& hash : entry_hashes) {
    accumulator.append(hash);
  }
  return accumulator.root();
}

std::vector<hash32_t> merkle_path(const std::span<const hash32_t> entry_hashes,
                                  const uint64_t index) {
  if (index >= entry_hashes.size()) {
    chronicle::common::critical("merkle path index lies outside the tree");
  }
  auto path = std::vector<hash32_t>{};
  collect_path(entry_hashes, index, path);
  return path;
}

std::optional<hash32_t> root_from_path(const hash32_t& entry_hash,
                                       const uint64_t index,
                                       const uint64_t tree_size,
                                       const std::span<const hash32_t> path) {
  if (index >= tree_size) {
    return std::nullopt;
  }
  // fn walks the leaf's position up the tree, sn the last leaf's.
  auto fn = index;
  auto sn = tree_size - 1;
  auto root = merkle_leaf(entry_hash);
  for (const auto& sibling : path) {
    if (sn == 0) {
      return std::nullopt;
    }
    if ((fn & 1) != 0 || fn == sn) {
      root = merkle_node(sibling, root);
      // A rightmost node without a sibling is carried up unchanged.
      while ((fn & 1) == 0 && fn != 0) {
        fn >>= 1;
        sn >>= 1;
      }
    } else {
      root = merkle_node(root, sibling);
    }
    fn >>= 1;
    sn >>= 1;
  }
  if (sn != 0) {
    return std::nullopt;
  }
  return root;
}

bool verify_inclusion(const hash32_t& entry_hash,
                      const uint64_t index,
                      const uint64_t tree_size,
                      const std::span<const hash32_t> path,
                      const hash32_t& root) {
  auto computed = root_from_path(entry_hash, index, tree_size, path);
  return computed && *computed == root;
}

}  // namespace chronicle::crypto
