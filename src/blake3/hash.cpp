#include <chronicle/blake3/hash.hpp>

namespace chronicle::blake3 {

hasher::hasher() {
  blake3_hasher_init(&state_);
}

hasher& hasher::update(const std::string_view& str) {
  blake3_hasher_update(&state_, str.data(), str.size());
  return *this;
}

hasher& hasher::update(const std::span<const uint8_t>& bytes) {
  blake3_hasher_update(&state_, bytes.data(), bytes.size());
  return *this;
}

chronicle::schema::hash32_t hasher::finalize() const {
  static_assert(BLAKE3_OUT_LEN == 32);
  auto output = chronicle::schema::hash32_t{};
  blake3_hasher_finalize(&state_, output.data(), output.size());
  return output;
}

chronicle::schema::hash32_t hash(const std::string_view& str) {
  return hasher{}.update(str).finalize();
}

chronicle::schema::hash32_t hash(const std::span<const uint8_t>& bytes) {
  return hasher{}.update(bytes).finalize();
}

}  // namespace chronicle::blake3
