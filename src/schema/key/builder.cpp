#include <boost/endian/buffers.hpp>
#include <algorithm>
#include <chronicle/blake3/hash.hpp>
#include <chronicle/schema/key/builder.hpp>
#include <iterator>
#include <ranges>

using namespace chronicle::schema::key;

builder& builder::write(const std::string_view& str) {
  std::ranges::copy_n(str.data(), str.size(), std::back_inserter(data));
  return *this;
}

builder& builder::write(const std::span<const uint8_t>& bytes) {
  std::ranges::copy_n(bytes.data(), bytes.size(), std::back_inserter(data));
  return *this;
}

builder& builder::hash(const std::string_view& str) {
  auto digest = chronicle::blake3::hash(str);
  std::ranges::copy(digest, std::back_inserter(data));
  return *this;
}

builder& builder::hash(const std::span<const uint8_t>& bytes) {
  auto digest = chronicle::blake3::hash(bytes);
  std::ranges::copy(digest, std::back_inserter(data));
  return *this;
}

builder& builder::write_ordered(uint64_t value) {
  auto buffer = boost::endian::big_uint64_buf_t{value};
  std::ranges::copy_n(buffer.data(), sizeof(uint64_t),
                      std::back_inserter(data));
  return *this;
}
