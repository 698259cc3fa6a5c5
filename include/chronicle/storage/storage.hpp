#pragma once
#include <chronicle/schema/audit_entry.hpp>
#include <chronicle/schema/checkpoint.hpp>
#include <chronicle/schema/primitives.hpp>
#include <chronicle/schema/query_filter.hpp>
#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace chronicle::storage {

enum class store_status : uint8_t {
  ok = 0,
  /// An entry already occupies (chain_id, sequence).
  duplicate_sequence = 1,
  /// Checkpoint sequence does not advance past the latest checkpoint.
  stale_checkpoint = 2,
  not_found = 3,
  /// A stored record failed to decode.
  corrupt_record = 4,
  /// The backend failed the I/O request.
  unavailable = 5,
  invalid_argument = 6,
};

template <typename T>
struct store_result final {
  store_status status{store_status::ok};
  T value{};
  std::string error;

  bool ok() const { return status == store_status::ok; }
};

/// Outcome of a streamed range scan. `corrupt_sequence` names the position
/// whose record failed to decode when `status` is corrupt_record.
struct scan_outcome final {
  store_status status{store_status::ok};
  std::optional<chronicle::schema::sequence_t> corrupt_sequence;
  std::string error;

  bool ok() const { return status == store_status::ok; }
};

/// Return false to stop the scan early.
using entry_visitor_t =
    std::function<bool(const chronicle::schema::audit_entry_t&)>;

inline constexpr auto kOpenEnded =
    std::numeric_limits<chronicle::schema::sequence_t>::max();

/// Chain store contract.
///
/// Append-only: the store never mutates or deletes an entry, and refuses a
/// second entry at an occupied (chain_id, sequence). It does not check hash
/// linkage; that belongs to the append engine.
template <typename Library>
struct storage {
  /// Durably persist an entry together with its head pointer and indexes.
  store_status append(const chronicle::schema::audit_entry_t& entry);

  /// Most recently committed entry of the chain, if any.
  store_result<std::optional<chronicle::schema::audit_entry_t>> get_head(
      const std::string_view& chain_id) const;

  store_result<std::optional<chronicle::schema::audit_entry_t>> get_entry(
      const std::string_view& chain_id,
      chronicle::schema::sequence_t sequence) const;

  /// Sequence of the entry whose entry_hash equals `hash`, if any.
  store_result<std::optional<chronicle::schema::sequence_t>> find_by_hash(
      const std::string_view& chain_id,
      const chronicle::schema::hash32_t& hash) const;

  /// Stream entries in [from, to] in ascending sequence order.
  scan_outcome for_each_in_range(const std::string_view& chain_id,
                                 chronicle::schema::sequence_t from,
                                 chronicle::schema::sequence_t to,
                                 const entry_visitor_t& visitor) const;

  /// Materialize at most `limit` entries of [from, to].
  store_result<std::vector<chronicle::schema::audit_entry_t>> get_range(
      const std::string_view& chain_id,
      chronicle::schema::sequence_t from,
      chronicle::schema::sequence_t to,
      std::size_t limit) const;

  /// AND-combined filtered, paginated read.
  chronicle::schema::query_page query(
      const chronicle::schema::query_filter& filter) const;

  store_result<std::vector<chronicle::schema::chain_id_t>> list_chains() const;

  /// Persist a new checkpoint; its sequence must exceed the latest one.
  store_status append_checkpoint(const chronicle::schema::checkpoint_t& value);

  /// Rewrite the export bookkeeping of an existing checkpoint.
  store_status update_checkpoint(const chronicle::schema::checkpoint_t& value);

  store_result<std::vector<chronicle::schema::checkpoint_t>> list_checkpoints(
      const std::string_view& chain_id) const;

  store_result<std::optional<chronicle::schema::checkpoint_t>>
  latest_checkpoint(const std::string_view& chain_id) const;
};

enum class open_mode : uint8_t {
  read_write = 0,
  read_only = 1,
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path,
                              open_mode mode = open_mode::read_write);

std::string_view to_string(store_status status);

}  // namespace chronicle::storage
