#pragma once
#include <blake3.h>
#include <chronicle/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace chronicle::blake3 {

/// RAII wrapper around the reference BLAKE3 hasher.
class hasher final {
 public:
  hasher();

  hasher& update(const std::string_view& str);
  hasher& update(const std::span<const uint8_t>& bytes);

  chronicle::schema::hash32_t finalize() const;

 private:
  blake3_hasher state_{};
};

chronicle::schema::hash32_t hash(const std::string_view& str);
chronicle::schema::hash32_t hash(const std::span<const uint8_t>& bytes);

}  // namespace chronicle::blake3
