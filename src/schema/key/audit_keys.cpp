#include <boost/endian/buffers.hpp>
#include <chronicle/blake3/hash.hpp>
#include <chronicle/schema/key/audit_keys.hpp>
#include <chronicle/schema/key/builder.hpp>

#include <algorithm>
#include <cstring>

namespace chronicle::schema::key {

namespace {

constexpr auto kLocatorSize = sizeof(hash32_t) + sizeof(uint64_t);

}  // namespace

hash32_t make_chain_digest(const std::string_view& chain_id) {
  return chronicle::blake3::hash(chain_id);
}

bytes_t make_entry_prefix(const std::string_view& chain_id) {
  return builder{}.write(kEntryPrefix).hash(chain_id).data;
}

bytes_t make_entry_key(const std::string_view& chain_id,
                       const sequence_t sequence) {
  return builder{}
      .write(kEntryPrefix)
      .hash(chain_id)
      .write_ordered(sequence)
      .data;
}

bytes_t make_entry_key(const entry_locator& locator) {
  return builder{}
      .write(kEntryPrefix)
      .write(std::span<const uint8_t>{locator.chain_digest})
      .write_ordered(locator.sequence)
      .data;
}

bytes_t make_head_key(const std::string_view& chain_id) {
  return builder{}.write(kHeadPrefix).hash(chain_id).data;
}

bytes_t make_chain_key(const std::string_view& chain_id) {
  return builder{}.write(kChainPrefix).hash(chain_id).data;
}

bytes_t make_hash_index_key(const std::string_view& chain_id,
                            const hash32_t& entry_hash) {
  return builder{}
      .write(kHashIndexPrefix)
      .hash(chain_id)
      .write(std::span<const uint8_t>{entry_hash})
      .data;
}

bytes_t make_actor_index_prefix(
    const std::string_view& actor_id,
    const std::optional<std::string_view>& chain_id) {
  auto key = builder{};
  key.write(kActorIndexPrefix).hash(actor_id);
  if (chain_id.has_value()) {
    key.hash(*chain_id);
  }
  return key.data;
}

bytes_t make_actor_index_key(const std::string_view& actor_id,
                             const std::string_view& chain_id,
                             const sequence_t sequence) {
  return builder{}
      .write(kActorIndexPrefix)
      .hash(actor_id)
      .hash(chain_id)
      .write_ordered(sequence)
      .data;
}

bytes_t make_resource_index_prefix(
    const std::string_view& resource_type,
    const std::optional<std::string_view>& chain_id) {
  auto key = builder{};
  key.write(kResourceIndexPrefix).hash(resource_type);
  if (chain_id.has_value()) {
    key.hash(*chain_id);
  }
  return key.data;
}

bytes_t make_resource_index_key(const std::string_view& resource_type,
                                const std::string_view& chain_id,
                                const sequence_t sequence) {
  return builder{}
      .write(kResourceIndexPrefix)
      .hash(resource_type)
      .hash(chain_id)
      .write_ordered(sequence)
      .data;
}

bytes_t make_checkpoint_prefix(const std::string_view& chain_id) {
  return builder{}.write(kCheckpointPrefix).hash(chain_id).data;
}

bytes_t make_checkpoint_key(const std::string_view& chain_id,
                            const sequence_t sequence) {
  return builder{}
      .write(kCheckpointPrefix)
      .hash(chain_id)
      .write_ordered(sequence)
      .data;
}

std::optional<entry_locator> parse_entry_locator(const bytes_view_t& key) {
  if (key.size() < kLocatorSize) {
    return std::nullopt;
  }
  auto tail = key.subspan(key.size() - kLocatorSize);
  auto locator = entry_locator{};
  std::copy_n(tail.data(), locator.chain_digest.size(),
              locator.chain_digest.data());
  auto buffer = boost::endian::big_uint64_buf_t{};
  std::memcpy(buffer.data(), tail.data() + locator.chain_digest.size(),
              sizeof(uint64_t));
  locator.sequence = buffer.value();
  return locator;
}

}  // namespace chronicle::schema::key
