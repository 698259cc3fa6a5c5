#include <spdlog/spdlog.h>
#include <algorithm>
#include <chronicle/canonical/encoder.hpp>
#include <chronicle/crypto/merkle.hpp>
#include <chronicle/execution/verification_engine.hpp>
#include <future>
#include <iterator>

using namespace chronicle::schema;

namespace chronicle::execution {

namespace {

/// Contiguous stretch of a chain walked as one unit. `expected_previous` is
/// the hash the entry at `first` must link to.
struct segment final {
  sequence_t first{};
  sequence_t last{};
  hash32_t expected_previous{};
};

void mark_broken(verification_result_t& result,
                 const sequence_t sequence,
                 const integrity_failure reason,
                 std::string detail) {
  result.status = verification_status::broken;
  result.code = error_code::chain_integrity_error;
  result.first_bad_sequence = sequence;
  result.reason = reason;
  result.detail = std::move(detail);
}

void mark_error(verification_result_t& result,
                const error_code code,
                std::string detail) {
  result.status = verification_status::error;
  result.code = code;
  result.detail = std::move(detail);
}

integrity_failure classify_missing(const sequence_t sequence) {
  return sequence == 0 ? integrity_failure::genesis_missing
                       : integrity_failure::linkage_mismatch;
}

void extend_covered(verification_result_t& result, const sequence_t sequence) {
  if (!result.covered) {
    result.covered = sequence_range{sequence, sequence};
  } else {
    result.covered->last = sequence;
  }
}

verification_result_t walk_segment(const store_t& storage,
                                   const std::string& chain_id,
                                   const segment& bounds,
                                   const std::stop_token& stop,
                                   const progress_fn_t& progress) {
  auto result = verification_result_t{};
  result.chain_id = chain_id;
  result.tip_hash = bounds.expected_previous;

  auto expected_sequence = bounds.first;
  auto expected_previous = bounds.expected_previous;
  auto error = std::string{};

  auto outcome = storage.for_each_in_range(
      chain_id, bounds.first, bounds.last, [&](const audit_entry_t& entry) {
        if (stop.stop_requested()) {
          result.cancelled = true;
          return false;
        }
        if (entry.sequence != expected_sequence) {
          mark_broken(result, expected_sequence,
                      classify_missing(expected_sequence),
                      fmt::format("entry {} is missing", expected_sequence));
          return false;
        }
        if (entry.chain_id != chain_id) {
          mark_broken(result, entry.sequence,
                      integrity_failure::linkage_mismatch,
                      "entry is filed under another chain");
          return false;
        }

        auto recomputed = canonical::compute_entry_hash(entry, error);
        if (!recomputed) {
          mark_broken(result, entry.sequence, integrity_failure::hash_mismatch,
                      "entry no longer encodes: " + error);
          return false;
        }
        if (*recomputed != entry.entry_hash) {
          mark_broken(result, entry.sequence, integrity_failure::hash_mismatch,
                      "stored hash differs from recomputed hash");
          return false;
        }

        if (entry.previous_hash != expected_previous) {
          if (entry.sequence == 0) {
            mark_broken(result, entry.sequence,
                        integrity_failure::genesis_missing,
                        "first entry does not link to the genesis sentinel");
            return false;
          }
          auto located = storage.find_by_hash(chain_id, entry.previous_hash);
          if (located.ok() && located.value) {
            mark_broken(
                result, entry.sequence, integrity_failure::linkage_mismatch,
                fmt::format("previous hash names entry {}", *located.value));
          } else {
            mark_broken(result, entry.sequence,
                        integrity_failure::unknown_predecessor,
                        "previous hash names no entry of the chain");
          }
          return false;
        }

        expected_previous = entry.entry_hash;
        ++expected_sequence;
        ++result.entries_checked;
        extend_covered(result, entry.sequence);
        result.tip_hash = entry.entry_hash;
        if (progress) {
          progress(entry.sequence);
        }
        return true;
      });

  if (result.status == verification_status::broken || result.cancelled) {
    return result;
  }
  if (outcome.status == storage::store_status::corrupt_record) {
    auto at = outcome.corrupt_sequence.value_or(expected_sequence);
    if (at != expected_sequence) {
      mark_broken(result, expected_sequence,
                  classify_missing(expected_sequence),
                  fmt::format("entry {} is missing", expected_sequence));
    } else {
      mark_broken(result, at, integrity_failure::hash_mismatch,
                  "stored record failed to decode");
    }
    return result;
  }
  if (!outcome.ok()) {
    mark_error(result, error_code::store_unavailable, outcome.error);
    return result;
  }
  if (expected_sequence <= bounds.last && bounds.first <= bounds.last) {
    mark_broken(result, expected_sequence, classify_missing(expected_sequence),
                fmt::format("entry {} is missing", expected_sequence));
  }
  return result;
}

error_code lookup_error(const storage::store_status status) {
  return status == storage::store_status::corrupt_record
             ? error_code::chain_integrity_error
             : error_code::store_unavailable;
}

/// Audit path for `sequence` against the earliest checkpoint at or past it,
/// or against the current head. Leaves `found.proof` empty on failure.
void prove_inclusion(const store_t& storage,
                     const std::string_view& chain_id,
                     const sequence_t sequence,
                     const hash32_t& entry_hash,
                     entry_lookup& found) {
  auto checkpoints = storage.list_checkpoints(chain_id);
  if (!checkpoints.ok()) {
    found.code = lookup_error(checkpoints.status);
    found.log = checkpoints.error;
    return;
  }
  auto witness = std::ranges::find_if(
      checkpoints.value,
      [&](const checkpoint_t& value) { return value.sequence >= sequence; });
  const auto witnessed = witness != std::end(checkpoints.value);

  auto last = sequence;
  if (witnessed) {
    last = witness->sequence;
  } else {
    auto head = storage.get_head(chain_id);
    if (!head.ok() || !head.value) {
      found.code = head.ok() ? error_code::chain_integrity_error
                             : lookup_error(head.status);
      found.log = head.ok() ? "chain has no head" : head.error;
      return;
    }
    last = std::max(last, head.value->sequence);
  }

  auto hashes = std::vector<hash32_t>{};
  auto outcome = storage.for_each_in_range(
      chain_id, 0, last, [&](const audit_entry_t& entry) {
        if (entry.sequence != hashes.size()) {
          return false;
        }
        hashes.push_back(entry.entry_hash);
        return true;
      });
  if (!outcome.ok()) {
    found.code = lookup_error(outcome.status);
    found.log = outcome.error;
    return;
  }
  if (hashes.size() != last + 1) {
    found.code = error_code::chain_integrity_error;
    found.log = fmt::format("entry {} is missing", hashes.size());
    return;
  }
  if (hashes[sequence] != entry_hash) {
    found.code = error_code::chain_integrity_error;
    found.log = fmt::format("hash index disagrees with entry {}", sequence);
    return;
  }

  auto proof = inclusion_proof_t{};
  proof.leaf_index = sequence;
  proof.tree_size = hashes.size();
  proof.merkle_root = crypto::merkle_root(hashes);
  proof.path = crypto::merkle_path(hashes, sequence);
  if (witnessed) {
    proof.checkpoint_sequence = witness->sequence;
    if (proof.merkle_root != witness->merkle_root) {
      spdlog::error("Chain '{}' entries no longer reproduce the Merkle root "
                    "witnessed at seq {}",
                    chain_id, witness->sequence);
      found.code = error_code::chain_integrity_error;
      found.log = fmt::format(
          "entry hashes differ from the Merkle root witnessed at seq {}",
          witness->sequence);
      return;
    }
  }
  found.proof = std::move(proof);
}

/// Fold a later segment's outcome into the running total.
void merge_segment(verification_result_t& total,
                   const verification_result_t& part) {
  total.entries_checked += part.entries_checked;
  if (part.covered) {
    if (!total.covered) {
      total.covered = part.covered;
    } else {
      total.covered->last = part.covered->last;
    }
  }
  total.tip_hash = part.tip_hash;
}

}  // namespace

verification_engine::verification_engine(const store_t& storage)
    : storage_{storage} {}

verification_result_t verification_engine::verify(
    const std::string_view& chain_id,
    const std::optional<checkpoint_t>& anchor,
    std::stop_token stop,
    const progress_fn_t& progress) const {
  auto result = verification_result_t{};
  result.chain_id = std::string{chain_id};
  if (chain_id.empty()) {
    mark_error(result, error_code::invalid_argument, "chain_id is required");
    return result;
  }

  auto bounds = segment{0, storage::kOpenEnded, kGenesisSentinel};
  auto head = storage_.get_head(chain_id);
  if (!head.ok()) {
    if (head.status != storage::store_status::corrupt_record) {
      mark_error(result, error_code::store_unavailable, head.error);
      return result;
    }
    // The walk stops at the first entry the head pointer cannot account for.
    spdlog::warn("Head pointer of chain '{}' is inconsistent: {}", chain_id,
                 head.error);
  } else if (!head.value) {
    if (anchor) {
      mark_broken(result, anchor->sequence,
                  integrity_failure::checkpoint_mismatch,
                  "chain has no entries");
    }
    return result;
  } else {
    bounds.last = head.value->sequence;
  }

  if (!anchor) {
    auto walked =
        walk_segment(storage_, result.chain_id, bounds, stop, progress);
    spdlog::debug("Verified chain '{}': {} ({} entries)", chain_id,
                  walked.valid() ? "valid" : to_string(walked.reason),
                  walked.entries_checked);
    return walked;
  }

  if (anchor->chain_id != chain_id) {
    mark_error(result, error_code::invalid_argument,
               "checkpoint belongs to another chain");
    return result;
  }
  const auto k = anchor->sequence;
  if (k > bounds.last) {
    mark_broken(result, k, integrity_failure::checkpoint_mismatch,
                "checkpoint lies beyond the chain tip");
    return result;
  }

  auto stored = storage_.get_entry(chain_id, k);
  if (!stored.ok()) {
    if (stored.status == storage::store_status::corrupt_record) {
      mark_broken(result, k, integrity_failure::hash_mismatch,
                  "stored record failed to decode");
    } else {
      mark_error(result, error_code::store_unavailable, stored.error);
    }
    return result;
  }
  if (!stored.value) {
    mark_broken(result, k, integrity_failure::checkpoint_mismatch,
                "checkpointed entry is missing");
    return result;
  }
  auto error = std::string{};
  auto recomputed = canonical::compute_entry_hash(*stored.value, error);
  if (!recomputed || *recomputed != stored.value->entry_hash) {
    mark_broken(result, k, integrity_failure::hash_mismatch,
                recomputed ? "stored hash differs from recomputed hash"
                           : "entry no longer encodes: " + error);
    return result;
  }
  if (stored.value->entry_hash != anchor->root_hash) {
    mark_broken(result, k, integrity_failure::checkpoint_mismatch,
                "checkpointed entry hash differs from the witnessed root");
    return result;
  }

  result.entries_checked = 1;
  result.covered = sequence_range{k, k};
  result.tip_hash = anchor->root_hash;
  if (progress) {
    progress(k);
  }
  if (stop.stop_requested()) {
    result.cancelled = true;
    return result;
  }

  bounds.first = k + 1;
  bounds.expected_previous = anchor->root_hash;
  auto walked =
      walk_segment(storage_, result.chain_id, bounds, stop, progress);
  merge_segment(result, walked);
  result.status = walked.status;
  result.code = walked.code;
  result.first_bad_sequence = walked.first_bad_sequence;
  result.reason = walked.reason;
  result.cancelled = walked.cancelled;
  result.detail = walked.detail;
  return result;
}

verification_result_t verification_engine::verify_segments(
    const std::string_view& chain_id,
    std::vector<checkpoint_t> checkpoints,
    std::size_t parallelism) const {
  auto head = storage_.get_head(chain_id);
  if (!head.ok() || !head.value) {
    return verify(chain_id);
  }
  const auto last = head.value->sequence;

  std::erase_if(checkpoints, [&](const checkpoint_t& value) {
    return value.chain_id != chain_id || value.sequence > last;
  });
  std::ranges::sort(checkpoints, {}, &checkpoint_t::sequence);
  auto duplicates = std::ranges::unique(checkpoints, {}, &checkpoint_t::sequence);
  checkpoints.erase(std::begin(duplicates), std::end(duplicates));

  auto segments = std::vector<segment>{};
  auto first = sequence_t{0};
  auto previous = kGenesisSentinel;
  for (const auto& value : checkpoints) {
    segments.push_back({first, value.sequence, previous});
    first = value.sequence + 1;
    previous = value.root_hash;
  }
  if (first <= last) {
    segments.push_back({first, last, previous});
  }

  parallelism = std::max<std::size_t>(parallelism, 1);
  const auto owned_chain_id = std::string{chain_id};
  auto parts = std::vector<verification_result_t>{};
  parts.reserve(segments.size());
  for (std::size_t wave = 0; wave < segments.size(); wave += parallelism) {
    auto pending = std::vector<std::future<verification_result_t>>{};
    const auto wave_end = std::min(segments.size(), wave + parallelism);
    for (auto i = wave; i < wave_end; ++i) {
      pending.push_back(std::async(std::launch::async, [&, i] {
        return walk_segment(storage_, owned_chain_id, segments[i],
                            std::stop_token{}, progress_fn_t{});
      }));
    }
    for (auto& future : pending) {
      parts.push_back(future.get());
    }
  }

  auto total = verification_result_t{};
  total.chain_id = owned_chain_id;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    const auto& part = parts[i];
    if (part.status == verification_status::error) {
      return part;
    }
    merge_segment(total, part);
    if (part.status == verification_status::broken) {
      mark_broken(total, *part.first_bad_sequence, part.reason, part.detail);
      return total;
    }
    if (i < checkpoints.size() && part.tip_hash != checkpoints[i].root_hash) {
      mark_broken(total, checkpoints[i].sequence,
                  integrity_failure::checkpoint_mismatch,
                  "segment tip differs from the witnessed root");
      return total;
    }
  }
  spdlog::debug("Verified chain '{}' in {} segments ({} entries)", chain_id,
                segments.size(), total.entries_checked);
  return total;
}

chain_status_t verification_engine::chain_status(
    const std::string_view& chain_id) const {
  auto status = chain_status_t{};
  status.chain_id = std::string{chain_id};

  auto head = storage_.get_head(chain_id);
  if (!head.ok() &&
      head.status != storage::store_status::corrupt_record) {
    status.code = error_code::store_unavailable;
    return status;
  }
  if (head.value) {
    status.length = head.value->sequence + 1;
    status.tip_hash = head.value->entry_hash;
  }

  auto genesis = storage_.get_entry(chain_id, 0);
  if (genesis.ok() && genesis.value) {
    status.created_at = genesis.value->timestamp;
  }
  auto latest = storage_.latest_checkpoint(chain_id);
  if (latest.ok()) {
    status.latest_checkpoint = latest.value;
  }

  status.verification = verify(chain_id);
  status.code = status.verification.code;
  return status;
}

entry_lookup verification_engine::lookup(const std::string_view& chain_id,
                                         const hash32_t& entry_hash) const {
  auto found = entry_lookup{};
  auto located = storage_.find_by_hash(chain_id, entry_hash);
  if (!located.ok()) {
    found.code = lookup_error(located.status);
    found.log = located.error;
    return found;
  }
  if (!located.value) {
    found.code = error_code::not_found;
    found.log = "no entry with that hash";
    return found;
  }

  auto stored = storage_.get_entry(chain_id, *located.value);
  if (!stored.ok() || !stored.value) {
    found.code = stored.status == storage::store_status::unavailable
                     ? error_code::store_unavailable
                     : error_code::chain_integrity_error;
    found.log = stored.ok() ? "hash index names a missing entry" : stored.error;
    return found;
  }

  auto error = std::string{};
  auto recomputed = canonical::compute_entry_hash(*stored.value, error);
  found.hash_verified = recomputed && *recomputed == entry_hash &&
                        stored.value->entry_hash == entry_hash;
  found.entry = std::move(stored.value);
  prove_inclusion(storage_, chain_id, *located.value, entry_hash, found);
  return found;
}

}  // namespace chronicle::execution
