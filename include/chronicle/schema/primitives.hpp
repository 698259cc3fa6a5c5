#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace chronicle::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using chain_id_t = std::string;
using sequence_t = uint64_t;
using timestamp_microseconds_t = uint64_t;

bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);

std::string make_string(const bytes_t& bytes);
std::string make_string(const bytes_view_t& bytes);

/// Parse 64 hex digits, with or without a 0x prefix.
std::optional<hash32_t> try_make_hash32(const std::string_view& hex);

std::string to_hex(const bytes_view_t& bytes);
std::string to_hex(const hash32_t& hash);

/// Predecessor hash recorded by the first entry of every chain.
inline constexpr auto kGenesisSentinel = hash32_t{};

/// Inclusive sequence window.
struct sequence_range final {
  sequence_t first{};
  sequence_t last{};

  bool operator==(const sequence_range&) const = default;
};

}  // namespace chronicle::schema
