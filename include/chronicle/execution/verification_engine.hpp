#pragma once

#include <chronicle/execution/types.hpp>
#include <chronicle/schema/chain_status.hpp>
#include <chronicle/schema/checkpoint.hpp>
#include <chronicle/schema/inclusion_proof.hpp>
#include <chronicle/schema/verification_result.hpp>
#include <cstddef>
#include <functional>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace chronicle::execution {

/// Result of looking an entry up by its hash.
///
/// `hash_verified` is true when the stored entry recomputes to the hash it
/// was found under. `proof` ties the hash to the Merkle root of the earliest
/// checkpoint covering it, or of the whole chain when none does yet.
struct entry_lookup final {
  chronicle::schema::error_code code{chronicle::schema::error_code::ok};
  std::string log;
  std::optional<chronicle::schema::audit_entry_t> entry;
  bool hash_verified{};
  std::optional<chronicle::schema::inclusion_proof_t> proof;
};

/// Called with each sequence once its entry has passed every check.
using progress_fn_t = std::function<void(chronicle::schema::sequence_t)>;

/// Read-only chain walker. Never takes sequencing locks; every method may
/// run concurrently with appends and sees only committed entries up to the
/// head observed when the walk starts.
class verification_engine final {
 public:
  explicit verification_engine(const store_t& storage);

  /// Walk `chain_id` from genesis, or from `anchor` when given, recomputing
  /// every hash and checking linkage. The first divergence wins.
  ///
  /// A stop request ends the walk early with `cancelled` set and the range
  /// verified so far in `covered`.
  chronicle::schema::verification_result_t verify(
      const std::string_view& chain_id,
      const std::optional<chronicle::schema::checkpoint_t>& anchor =
          std::nullopt,
      std::stop_token stop = {},
      const progress_fn_t& progress = {}) const;

  /// Full verification split at checkpoint boundaries and run on up to
  /// `parallelism` threads. Each segment's tip must match the checkpoint
  /// that closes it.
  chronicle::schema::verification_result_t verify_segments(
      const std::string_view& chain_id,
      std::vector<chronicle::schema::checkpoint_t> checkpoints,
      std::size_t parallelism) const;

  /// Length, tip, latest checkpoint and full verification verdict.
  chronicle::schema::chain_status_t chain_status(
      const std::string_view& chain_id) const;

  /// Inclusion check for an entry hash. Fails with `chain_integrity_error`
  /// when the stored entry hashes no longer reproduce the Merkle root their
  /// checkpoint witnessed.
  entry_lookup lookup(const std::string_view& chain_id,
                      const chronicle::schema::hash32_t& entry_hash) const;

 private:
  const store_t& storage_;
};

}  // namespace chronicle::execution
