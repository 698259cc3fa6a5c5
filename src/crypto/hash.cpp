#include <chronicle/common/critical.hpp>
#include <chronicle/crypto/hash.hpp>

namespace chronicle::crypto {

sha256_hasher::sha256_hasher() : context_{EVP_MD_CTX_new(), EVP_MD_CTX_free} {
  if (!context_) {
    chronicle::common::critical("failed to allocate EVP_MD_CTX");
  }
  if (EVP_DigestInit_ex(context_.get(), EVP_sha256(), nullptr) != 1) {
    chronicle::common::critical("failed to initialise SHA-256 digest");
  }
}

sha256_hasher& sha256_hasher::update(
    const chronicle::schema::bytes_view_t& bytes) {
  if (bytes.empty()) {
    return *this;
  }
  if (EVP_DigestUpdate(context_.get(), bytes.data(), bytes.size()) != 1) {
    chronicle::common::critical("failed to update SHA-256 digest");
  }
  return *this;
}

sha256_hasher& sha256_hasher::update(const chronicle::schema::hash32_t& hash) {
  return update(chronicle::schema::bytes_view_t{hash.data(), hash.size()});
}

chronicle::schema::hash32_t sha256_hasher::finalize() {
  auto digest = chronicle::schema::hash32_t{};
  auto length = 0u;
  if (EVP_DigestFinal_ex(context_.get(), digest.data(), &length) != 1 ||
      length != digest.size()) {
    chronicle::common::critical("failed to finalise SHA-256 digest");
  }
  return digest;
}

chronicle::schema::hash32_t sha256(
    const chronicle::schema::bytes_view_t& bytes) {
  return sha256_hasher{}.update(bytes).finalize();
}

chronicle::schema::hash32_t entry_hash(
    const chronicle::schema::hash32_t& previous_hash,
    const chronicle::schema::bytes_view_t& canonical) {
  return sha256_hasher{}.update(previous_hash).update(canonical).finalize();
}

}  // namespace chronicle::crypto
