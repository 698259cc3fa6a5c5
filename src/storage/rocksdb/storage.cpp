#include <chronicle/common/critical.hpp>
#include <chronicle/schema/key/audit_keys.hpp>
#include <chronicle/storage/rocksdb/storage.hpp>

#include <algorithm>
#include <iterator>
#include <limits>

using namespace chronicle::schema;

namespace chronicle::storage {

namespace {

using encoder_t = chronicle::schema::encoding::scale_encoder_t;

store_status classify(const ROCKSDB_NAMESPACE::Status& status) {
  if (status.ok()) {
    return store_status::ok;
  }
  if (status.IsNotFound()) {
    return store_status::not_found;
  }
  return store_status::unavailable;
}

bool starts_with(const ROCKSDB_NAMESPACE::Slice& key, const bytes_t& prefix) {
  return key.starts_with(detail::to_slice(bytes_view_t{prefix}));
}

template <typename T>
std::optional<T> decode_slice(const ROCKSDB_NAMESPACE::Slice& slice) {
  auto encoder = encoder_t{};
  return encoder.try_decode<T>(detail::to_bytes_view(slice));
}

template <typename T>
std::optional<T> decode_string(const std::string& raw) {
  auto encoder = encoder_t{};
  return encoder.try_decode<T>(
      bytes_view_t{reinterpret_cast<const uint8_t*>(raw.data()), raw.size()});
}

bool matches(const query_filter& filter, const audit_entry_t& entry) {
  if (filter.chain_id && entry.chain_id != *filter.chain_id) {
    return false;
  }
  if (filter.actor_id && entry.actor_id != *filter.actor_id) {
    return false;
  }
  if (filter.resource_type && entry.resource_type != *filter.resource_type) {
    return false;
  }
  if (filter.resource_id && entry.resource_id != *filter.resource_id) {
    return false;
  }
  if (filter.from_timestamp && entry.timestamp < *filter.from_timestamp) {
    return false;
  }
  if (filter.to_timestamp && entry.timestamp > *filter.to_timestamp) {
    return false;
  }
  return true;
}

/// Keyspace the query walks: the narrowest index the filter allows.
struct query_source final {
  bytes_t prefix;
  bool indexed{};
};

query_source select_source(const query_filter& filter) {
  auto chain = std::optional<std::string_view>{};
  if (filter.chain_id) {
    chain = std::string_view{*filter.chain_id};
  }
  if (filter.actor_id) {
    return {key::make_actor_index_prefix(*filter.actor_id, chain), true};
  }
  if (filter.resource_type) {
    return {key::make_resource_index_prefix(*filter.resource_type, chain),
            true};
  }
  if (chain) {
    return {key::make_entry_prefix(*chain), false};
  }
  return {make_bytes(key::kEntryPrefix), false};
}

}  // namespace

std::string_view to_string(const store_status status) {
  switch (status) {
    case store_status::ok:
      return "ok";
    case store_status::duplicate_sequence:
      return "duplicate_sequence";
    case store_status::stale_checkpoint:
      return "stale_checkpoint";
    case store_status::not_found:
      return "not_found";
    case store_status::corrupt_record:
      return "corrupt_record";
    case store_status::unavailable:
      return "unavailable";
    case store_status::invalid_argument:
      return "invalid_argument";
  }
  return "unknown";
}

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path,
    const open_mode mode) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = mode == open_mode::read_write;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status = mode == open_mode::read_only
                    ? ROCKSDB_NAMESPACE::DB::OpenForReadOnly(
                          options, std::string{path}, &database)
                    : ROCKSDB_NAMESPACE::DB::Open(options, std::string{path},
                                                  &database);
  if (!status.ok()) {
    spdlog::error("Failed to open RocksDB at {}: {}", path, status.ToString());
    chronicle::common::critical("Failed to open RocksDB");
  }
  spdlog::info("Successfully opened RocksDB at {}{}", path,
               mode == open_mode::read_only ? " (read-only)" : "");
  store.database.reset(database);

  return store;
}

void storage<rocksdb_storage_tag>::ensure_open() const {
  if (!database) {
    chronicle::common::critical("RocksDB database is not initialized");
  }
}

store_status storage<rocksdb_storage_tag>::append(const audit_entry_t& entry) {
  ensure_open();
  auto lock = std::scoped_lock{*write_mutex};

  auto entry_key = key::make_entry_key(entry.chain_id, entry.sequence);
  auto existing = std::string{};
  auto existing_status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                                       detail::to_slice(entry_key), &existing);
  if (existing_status.ok()) {
    return store_status::duplicate_sequence;
  }
  if (!existing_status.IsNotFound()) {
    spdlog::error("Failed reading entry slot for chain '{}' seq {}: {}",
                  entry.chain_id, entry.sequence, existing_status.ToString());
    return store_status::unavailable;
  }

  auto head_key = key::make_head_key(entry.chain_id);
  auto head_raw = std::string{};
  auto head_status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                                   detail::to_slice(head_key), &head_raw);
  if (!head_status.ok() && !head_status.IsNotFound()) {
    spdlog::error("Failed reading head of chain '{}': {}", entry.chain_id,
                  head_status.ToString());
    return store_status::unavailable;
  }
  auto advance_head = true;
  if (head_status.ok()) {
    auto head_sequence = decode_string<sequence_t>(head_raw);
    advance_head = !head_sequence || *head_sequence < entry.sequence;
  }

  auto encoder = encoder_t{};
  auto encoded_entry = encoder.encode(entry);
  auto encoded_sequence = encoder.encode(entry.sequence);
  auto encoded_chain = encoder.encode(entry.chain_id);
  auto empty = bytes_t{};

  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  auto put = [&](const bytes_t& k, const bytes_t& v) {
    auto put_status = batch.Put(detail::to_slice(bytes_view_t{k}),
                                detail::to_slice(bytes_view_t{v}));
    if (!put_status.ok()) {
      chronicle::common::critical("failed staging audit entry batch");
    }
  };
  put(entry_key, encoded_entry);
  if (advance_head) {
    put(head_key, encoded_sequence);
  }
  put(key::make_chain_key(entry.chain_id), encoded_chain);
  put(key::make_hash_index_key(entry.chain_id, entry.entry_hash),
      encoded_sequence);
  put(key::make_actor_index_key(entry.actor_id, entry.chain_id,
                                entry.sequence),
      empty);
  put(key::make_resource_index_key(entry.resource_type, entry.chain_id,
                                   entry.sequence),
      empty);

  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = true;
  auto write_status = database->Write(write_options, &batch);
  if (!write_status.ok()) {
    spdlog::error("Failed committing entry for chain '{}' seq {}: {}",
                  entry.chain_id, entry.sequence, write_status.ToString());
    return store_status::unavailable;
  }
  return store_status::ok;
}

store_result<std::optional<audit_entry_t>>
storage<rocksdb_storage_tag>::get_head(const std::string_view& chain_id) const {
  ensure_open();
  auto result = store_result<std::optional<audit_entry_t>>{};

  // One snapshot for both reads so the head pointer and entry agree.
  const auto* snapshot = database->GetSnapshot();
  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  read_options.snapshot = snapshot;

  auto head_raw = std::string{};
  auto head_status = database->Get(
      read_options, detail::to_slice(key::make_head_key(chain_id)), &head_raw);
  if (head_status.IsNotFound()) {
    database->ReleaseSnapshot(snapshot);
    return result;
  }
  if (!head_status.ok()) {
    database->ReleaseSnapshot(snapshot);
    result.status = store_status::unavailable;
    result.error = head_status.ToString();
    return result;
  }
  auto head_sequence = decode_string<sequence_t>(head_raw);
  if (!head_sequence) {
    database->ReleaseSnapshot(snapshot);
    result.status = store_status::corrupt_record;
    result.error = "head pointer failed to decode";
    return result;
  }

  auto entry_raw = std::string{};
  auto entry_status = database->Get(
      read_options,
      detail::to_slice(key::make_entry_key(chain_id, *head_sequence)),
      &entry_raw);
  database->ReleaseSnapshot(snapshot);
  if (!entry_status.ok()) {
    result.status = entry_status.IsNotFound() ? store_status::corrupt_record
                                              : store_status::unavailable;
    result.error = entry_status.IsNotFound()
                       ? "head pointer names a missing entry"
                       : entry_status.ToString();
    return result;
  }
  auto entry = decode_string<audit_entry_t>(entry_raw);
  if (!entry) {
    result.status = store_status::corrupt_record;
    result.error = "head entry failed to decode";
    return result;
  }
  result.value = std::move(*entry);
  return result;
}

store_result<std::optional<audit_entry_t>>
storage<rocksdb_storage_tag>::get_entry(const std::string_view& chain_id,
                                        const sequence_t sequence) const {
  ensure_open();
  auto result = store_result<std::optional<audit_entry_t>>{};
  auto raw = std::string{};
  auto status = database->Get(
      ROCKSDB_NAMESPACE::ReadOptions{},
      detail::to_slice(key::make_entry_key(chain_id, sequence)), &raw);
  if (status.IsNotFound()) {
    return result;
  }
  if (!status.ok()) {
    result.status = store_status::unavailable;
    result.error = status.ToString();
    return result;
  }
  auto entry = decode_string<audit_entry_t>(raw);
  if (!entry) {
    result.status = store_status::corrupt_record;
    result.error = "entry failed to decode";
    return result;
  }
  result.value = std::move(*entry);
  return result;
}

store_result<std::optional<sequence_t>>
storage<rocksdb_storage_tag>::find_by_hash(const std::string_view& chain_id,
                                           const hash32_t& hash) const {
  ensure_open();
  auto result = store_result<std::optional<sequence_t>>{};
  auto raw = std::string{};
  auto status = database->Get(
      ROCKSDB_NAMESPACE::ReadOptions{},
      detail::to_slice(key::make_hash_index_key(chain_id, hash)), &raw);
  if (status.IsNotFound()) {
    return result;
  }
  if (!status.ok()) {
    result.status = store_status::unavailable;
    result.error = status.ToString();
    return result;
  }
  auto sequence = decode_string<sequence_t>(raw);
  if (!sequence) {
    result.status = store_status::corrupt_record;
    result.error = "hash index entry failed to decode";
    return result;
  }
  result.value = *sequence;
  return result;
}

scan_outcome storage<rocksdb_storage_tag>::for_each_in_range(
    const std::string_view& chain_id,
    const sequence_t from,
    const sequence_t to,
    const entry_visitor_t& visitor) const {
  ensure_open();
  auto outcome = scan_outcome{};
  if (from > to) {
    return outcome;
  }

  auto prefix = key::make_entry_prefix(chain_id);
  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  iterator->Seek(detail::to_slice(key::make_entry_key(chain_id, from)));

  while (iterator->Valid()) {
    if (!starts_with(iterator->key(), prefix)) {
      break;
    }
    auto locator = key::parse_entry_locator(detail::to_bytes_view(
        iterator->key()));
    if (!locator || locator->sequence > to) {
      break;
    }
    auto entry = decode_slice<audit_entry_t>(iterator->value());
    if (!entry) {
      outcome.status = store_status::corrupt_record;
      outcome.corrupt_sequence = locator->sequence;
      outcome.error = "entry failed to decode";
      return outcome;
    }
    if (!visitor(*entry)) {
      return outcome;
    }
    iterator->Next();
  }

  if (!iterator->status().ok()) {
    outcome.status = store_status::unavailable;
    outcome.error = iterator->status().ToString();
  }
  return outcome;
}

store_result<std::vector<audit_entry_t>>
storage<rocksdb_storage_tag>::get_range(const std::string_view& chain_id,
                                        const sequence_t from,
                                        const sequence_t to,
                                        const std::size_t limit) const {
  auto result = store_result<std::vector<audit_entry_t>>{};
  auto outcome = for_each_in_range(
      chain_id, from, to, [&](const audit_entry_t& entry) {
        result.value.push_back(entry);
        return result.value.size() < limit;
      });
  result.status = outcome.status;
  result.error = outcome.error;
  return result;
}

query_page storage<rocksdb_storage_tag>::query(
    const query_filter& filter) const {
  ensure_open();
  auto page = query_page{};
  auto page_size = filter.page_size == 0
                       ? uint32_t{100}
                       : std::min(filter.page_size, kMaxQueryPageSize);

  auto source = select_source(filter);
  if (!filter.page_token.empty() &&
      !std::equal(std::begin(source.prefix), std::end(source.prefix),
                  std::begin(filter.page_token),
                  std::begin(filter.page_token) +
                      std::min(filter.page_token.size(),
                               source.prefix.size()))) {
    page.code = error_code::invalid_argument;
    page.log = "page token does not belong to this query";
    return page;
  }

  // A single snapshot keeps index reads and entry lookups consistent.
  const auto* snapshot = database->GetSnapshot();
  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  read_options.snapshot = snapshot;
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};

  if (filter.page_token.empty()) {
    iterator->Seek(detail::to_slice(bytes_view_t{source.prefix}));
  } else {
    auto token_slice = detail::to_slice(bytes_view_t{filter.page_token});
    iterator->Seek(token_slice);
    if (iterator->Valid() && iterator->key() == token_slice) {
      iterator->Next();
    }
  }

  auto last_key = bytes_t{};
  auto has_more = false;
  while (iterator->Valid()) {
    if (!starts_with(iterator->key(), source.prefix)) {
      break;
    }

    auto locator =
        key::parse_entry_locator(detail::to_bytes_view(iterator->key()));
    if (!locator) {
      page.code = error_code::chain_integrity_error;
      page.log = "unreadable key under " +
                 std::string{source.indexed ? "index" : "entry"} + " prefix";
      break;
    }

    auto entry = std::optional<audit_entry_t>{};
    if (source.indexed) {
      auto raw = std::string{};
      auto status = database->Get(
          read_options, detail::to_slice(key::make_entry_key(*locator)), &raw);
      if (status.IsNotFound()) {
        page.code = error_code::chain_integrity_error;
        page.log = fmt::format("index names missing entry (chain {}, seq {})",
                               to_hex(locator->chain_digest),
                               locator->sequence);
        break;
      }
      if (!status.ok()) {
        page.code = error_code::store_unavailable;
        page.log = status.ToString();
        break;
      }
      entry = decode_string<audit_entry_t>(raw);
    } else {
      entry = decode_slice<audit_entry_t>(iterator->value());
    }

    if (!entry) {
      page.code = error_code::chain_integrity_error;
      page.log = fmt::format("entry failed to decode (chain {}, seq {})",
                             to_hex(locator->chain_digest), locator->sequence);
      break;
    }
    if (matches(filter, *entry)) {
      if (page.entries.size() == page_size) {
        has_more = true;
        break;
      }
      page.entries.push_back(std::move(*entry));
      last_key = detail::to_bytes(iterator->key());
    }
    iterator->Next();
  }

  if (page.code == error_code::ok && !iterator->status().ok()) {
    page.code = error_code::store_unavailable;
    page.log = iterator->status().ToString();
  }
  iterator.reset();
  database->ReleaseSnapshot(snapshot);

  if (page.code != error_code::ok) {
    if (page.code == error_code::chain_integrity_error) {
      spdlog::error("Query stopped on an integrity anomaly: {}", page.log);
    }
    page.entries.clear();
    return page;
  }
  if (has_more) {
    page.next_page_token = std::move(last_key);
  }
  return page;
}

store_result<std::vector<chain_id_t>>
storage<rocksdb_storage_tag>::list_chains() const {
  ensure_open();
  auto result = store_result<std::vector<chain_id_t>>{};
  auto prefix = make_bytes(key::kChainPrefix);
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  iterator->Seek(detail::to_slice(bytes_view_t{prefix}));
  while (iterator->Valid() && starts_with(iterator->key(), prefix)) {
    auto chain_id = decode_slice<std::string>(iterator->value());
    if (chain_id) {
      result.value.push_back(std::move(*chain_id));
    } else {
      spdlog::warn("Skipping undecodable chain registry record");
    }
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    result.status = store_status::unavailable;
    result.error = iterator->status().ToString();
  }
  std::sort(std::begin(result.value), std::end(result.value));
  return result;
}

store_status storage<rocksdb_storage_tag>::append_checkpoint(
    const checkpoint_t& value) {
  ensure_open();
  auto lock = std::scoped_lock{*write_mutex};

  auto latest = latest_checkpoint(value.chain_id);
  if (!latest.ok()) {
    return latest.status;
  }
  if (latest.value && latest.value->sequence >= value.sequence) {
    return store_status::stale_checkpoint;
  }

  auto encoder = encoder_t{};
  auto encoded = encoder.encode(value);
  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = true;
  auto status = database->Put(
      write_options,
      detail::to_slice(key::make_checkpoint_key(value.chain_id,
                                                value.sequence)),
      detail::to_slice(bytes_view_t{encoded}));
  if (!status.ok()) {
    spdlog::error("Failed persisting checkpoint for chain '{}' seq {}: {}",
                  value.chain_id, value.sequence, status.ToString());
    return store_status::unavailable;
  }
  return store_status::ok;
}

store_status storage<rocksdb_storage_tag>::update_checkpoint(
    const checkpoint_t& value) {
  ensure_open();
  auto lock = std::scoped_lock{*write_mutex};

  auto checkpoint_key = key::make_checkpoint_key(value.chain_id, value.sequence);
  auto raw = std::string{};
  auto read_status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                                   detail::to_slice(checkpoint_key), &raw);
  if (!read_status.ok()) {
    return classify(read_status);
  }
  auto stored = decode_string<checkpoint_t>(raw);
  if (!stored) {
    return store_status::corrupt_record;
  }
  if (stored->root_hash != value.root_hash ||
      stored->merkle_root != value.merkle_root ||
      stored->merkle_peaks != value.merkle_peaks ||
      stored->created_at != value.created_at) {
    return store_status::invalid_argument;
  }

  auto encoder = encoder_t{};
  auto encoded = encoder.encode(value);
  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = true;
  auto status = database->Put(write_options, detail::to_slice(checkpoint_key),
                              detail::to_slice(bytes_view_t{encoded}));
  if (!status.ok()) {
    spdlog::error("Failed updating checkpoint for chain '{}' seq {}: {}",
                  value.chain_id, value.sequence, status.ToString());
    return store_status::unavailable;
  }
  return store_status::ok;
}

store_result<std::vector<checkpoint_t>>
storage<rocksdb_storage_tag>::list_checkpoints(
    const std::string_view& chain_id) const {
  ensure_open();
  auto result = store_result<std::vector<checkpoint_t>>{};
  auto prefix = key::make_checkpoint_prefix(chain_id);
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  iterator->Seek(detail::to_slice(bytes_view_t{prefix}));
  while (iterator->Valid() && starts_with(iterator->key(), prefix)) {
    auto value = decode_slice<checkpoint_t>(iterator->value());
    if (!value) {
      result.status = store_status::corrupt_record;
      result.error = "checkpoint failed to decode";
      return result;
    }
    result.value.push_back(std::move(*value));
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    result.status = store_status::unavailable;
    result.error = iterator->status().ToString();
  }
  return result;
}

store_result<std::optional<checkpoint_t>>
storage<rocksdb_storage_tag>::latest_checkpoint(
    const std::string_view& chain_id) const {
  ensure_open();
  auto result = store_result<std::optional<checkpoint_t>>{};
  auto prefix = key::make_checkpoint_prefix(chain_id);
  auto upper = key::make_checkpoint_key(chain_id,
                                        std::numeric_limits<sequence_t>::max());
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  iterator->SeekForPrev(detail::to_slice(bytes_view_t{upper}));
  if (iterator->Valid() && starts_with(iterator->key(), prefix)) {
    auto value = decode_slice<checkpoint_t>(iterator->value());
    if (!value) {
      result.status = store_status::corrupt_record;
      result.error = "checkpoint failed to decode";
      return result;
    }
    result.value = std::move(*value);
    return result;
  }
  if (!iterator->status().ok()) {
    result.status = store_status::unavailable;
    result.error = iterator->status().ToString();
  }
  return result;
}

}  // namespace chronicle::storage
