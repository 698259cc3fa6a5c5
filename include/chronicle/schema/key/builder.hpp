#pragma once
#include <chronicle/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace chronicle::schema::key {

struct builder final {
  chronicle::schema::bytes_t data;

  builder& write(const std::string_view& str);
  builder& write(const std::span<const uint8_t>& bytes);

  /// Append the BLAKE3 digest of the input, giving variable-length
  /// identifiers a fixed-width, prefix-free key component.
  builder& hash(const std::string_view& str);
  builder& hash(const std::span<const uint8_t>& bytes);

  /// Big-endian so that RocksDB's bytewise order matches numeric order.
  builder& write_ordered(uint64_t value);
};

}  // namespace chronicle::schema::key
