#pragma once

#include <chronicle/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema key type: audit keys.
// Audit workflow: key layout of the chain store. Identifiers are folded to
// BLAKE3 digests so every keyspace has fixed-width components; sequences are
// big-endian so iteration order equals chain order.
//
//   AUD|ENTRY|H(chain)|seq                 -> audit_entry
//   AUD|HEAD|H(chain)                      -> head sequence
//   AUD|CHAIN|H(chain)                     -> chain id
//   AUD|IDX|HASH|H(chain)|entry_hash       -> sequence
//   AUD|IDX|ACTOR|H(actor)|H(chain)|seq    -> (empty)
//   AUD|IDX|RTYPE|H(type)|H(chain)|seq     -> (empty)
//   AUD|CKPT|H(chain)|seq                  -> checkpoint
namespace chronicle::schema::key {

inline constexpr std::string_view kEntryPrefix{"AUD|ENTRY|"};
inline constexpr std::string_view kHeadPrefix{"AUD|HEAD|"};
inline constexpr std::string_view kChainPrefix{"AUD|CHAIN|"};
inline constexpr std::string_view kHashIndexPrefix{"AUD|IDX|HASH|"};
inline constexpr std::string_view kActorIndexPrefix{"AUD|IDX|ACTOR|"};
inline constexpr std::string_view kResourceIndexPrefix{"AUD|IDX|RTYPE|"};
inline constexpr std::string_view kCheckpointPrefix{"AUD|CKPT|"};

/// Chain digest and sequence recovered from the tail of an entry or index key.
struct entry_locator final {
  hash32_t chain_digest{};
  sequence_t sequence{};
};

hash32_t make_chain_digest(const std::string_view& chain_id);

bytes_t make_entry_prefix(const std::string_view& chain_id);
bytes_t make_entry_key(const std::string_view& chain_id, sequence_t sequence);
bytes_t make_entry_key(const entry_locator& locator);
bytes_t make_head_key(const std::string_view& chain_id);
bytes_t make_chain_key(const std::string_view& chain_id);
bytes_t make_hash_index_key(const std::string_view& chain_id,
                            const hash32_t& entry_hash);

/// Without a chain id the prefix spans every chain.
bytes_t make_actor_index_prefix(const std::string_view& actor_id,
                                const std::optional<std::string_view>& chain_id);
bytes_t make_actor_index_key(const std::string_view& actor_id,
                             const std::string_view& chain_id,
                             sequence_t sequence);
bytes_t make_resource_index_prefix(
    const std::string_view& resource_type,
    const std::optional<std::string_view>& chain_id);
bytes_t make_resource_index_key(const std::string_view& resource_type,
                                const std::string_view& chain_id,
                                sequence_t sequence);

bytes_t make_checkpoint_prefix(const std::string_view& chain_id);
bytes_t make_checkpoint_key(const std::string_view& chain_id,
                            sequence_t sequence);

std::optional<entry_locator> parse_entry_locator(const bytes_view_t& key);

}  // namespace chronicle::schema::key
