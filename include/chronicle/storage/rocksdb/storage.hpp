#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <chronicle/schema/encoding/scale/encoder.hpp>
#include <chronicle/storage/storage.hpp>
#include <memory>
#include <mutex>
#include <string_view>

namespace chronicle::storage {

namespace detail {

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const chronicle::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

inline chronicle::schema::bytes_view_t to_bytes_view(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()), slice.size()};
}

inline chronicle::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;
  /// Serializes the uniqueness check and batch write of appends.
  std::unique_ptr<std::mutex> write_mutex{std::make_unique<std::mutex>()};

  store_status append(const chronicle::schema::audit_entry_t& entry);
  store_result<std::optional<chronicle::schema::audit_entry_t>> get_head(
      const std::string_view& chain_id) const;
  store_result<std::optional<chronicle::schema::audit_entry_t>> get_entry(
      const std::string_view& chain_id,
      chronicle::schema::sequence_t sequence) const;
  store_result<std::optional<chronicle::schema::sequence_t>> find_by_hash(
      const std::string_view& chain_id,
      const chronicle::schema::hash32_t& hash) const;
  scan_outcome for_each_in_range(const std::string_view& chain_id,
                                 chronicle::schema::sequence_t from,
                                 chronicle::schema::sequence_t to,
                                 const entry_visitor_t& visitor) const;
  store_result<std::vector<chronicle::schema::audit_entry_t>> get_range(
      const std::string_view& chain_id,
      chronicle::schema::sequence_t from,
      chronicle::schema::sequence_t to,
      std::size_t limit) const;
  chronicle::schema::query_page query(
      const chronicle::schema::query_filter& filter) const;
  store_result<std::vector<chronicle::schema::chain_id_t>> list_chains() const;
  store_status append_checkpoint(const chronicle::schema::checkpoint_t& value);
  store_status update_checkpoint(const chronicle::schema::checkpoint_t& value);
  store_result<std::vector<chronicle::schema::checkpoint_t>> list_checkpoints(
      const std::string_view& chain_id) const;
  store_result<std::optional<chronicle::schema::checkpoint_t>>
  latest_checkpoint(const std::string_view& chain_id) const;

 private:
  void ensure_open() const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path,
    open_mode mode);

}  // namespace chronicle::storage
