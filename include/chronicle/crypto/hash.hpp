#pragma once

#include <chronicle/schema/primitives.hpp>
#include <memory>
#include <openssl/evp.h>

namespace chronicle::crypto {

/// Incremental SHA-256 over OpenSSL EVP.
class sha256_hasher final {
 public:
  sha256_hasher();

  sha256_hasher& update(const chronicle::schema::bytes_view_t& bytes);
  sha256_hasher& update(const chronicle::schema::hash32_t& hash);

  /// Produce the digest. The hasher must not be updated afterwards.
  chronicle::schema::hash32_t finalize();

 private:
  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> context_;
};

chronicle::schema::hash32_t sha256(const chronicle::schema::bytes_view_t& bytes);

/// entry_hash = SHA-256(previous_hash || canonical bytes).
chronicle::schema::hash32_t entry_hash(
    const chronicle::schema::hash32_t& previous_hash,
    const chronicle::schema::bytes_view_t& canonical);

}  // namespace chronicle::crypto
