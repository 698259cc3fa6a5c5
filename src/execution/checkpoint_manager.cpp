#include <spdlog/spdlog.h>
#include <chronicle/canonical/encoder.hpp>
#include <chronicle/crypto/merkle.hpp>
#include <chronicle/execution/checkpoint_manager.hpp>

using namespace chronicle::schema;

namespace chronicle::execution {

namespace {

error_code to_error_code(const storage::store_status status) {
  switch (status) {
    case storage::store_status::ok:
      return error_code::ok;
    case storage::store_status::corrupt_record:
      return error_code::chain_integrity_error;
    case storage::store_status::invalid_argument:
      return error_code::invalid_argument;
    case storage::store_status::not_found:
      return error_code::not_found;
    case storage::store_status::duplicate_sequence:
    case storage::store_status::stale_checkpoint:
    case storage::store_status::unavailable:
    default:
      return error_code::store_unavailable;
  }
}

void fail(checkpoint_result_t& result, const error_code code, std::string log) {
  result.code = code;
  result.log = std::move(log);
}

}  // namespace

checkpoint_manager::checkpoint_manager(store_t& storage,
                                       checkpoint_exporter& exporter,
                                       checkpoint_policy policy,
                                       time_source_t clock)
    : storage_{storage},
      exporter_{exporter},
      policy_{policy},
      clock_{std::move(clock)} {}

const checkpoint_policy& checkpoint_manager::policy() const {
  return policy_;
}

checkpoint_result_t checkpoint_manager::checkpoint(
    const std::string_view& chain_id) {
  return run(chain_id, false);
}

checkpoint_result_t checkpoint_manager::checkpoint_if_due(
    const std::string_view& chain_id) {
  return run(chain_id, true);
}

storage::store_result<std::vector<checkpoint_t>>
checkpoint_manager::list_checkpoints(const std::string_view& chain_id) const {
  return storage_.list_checkpoints(chain_id);
}

checkpoint_result_t checkpoint_manager::run(const std::string_view& chain_id,
                                            const bool only_when_due) {
  auto lock = std::scoped_lock{mutex_};
  auto result = checkpoint_result_t{};
  if (chain_id.empty()) {
    fail(result, error_code::invalid_argument, "chain_id is required");
    return result;
  }

  if (!retry_pending_exports(chain_id, result)) {
    return result;
  }

  auto head = storage_.get_head(chain_id);
  if (!head.ok()) {
    fail(result, to_error_code(head.status), head.error);
    return result;
  }
  if (!head.value) {
    if (!only_when_due) {
      fail(result, error_code::chain_empty, "chain has no entries");
    }
    return result;
  }

  auto latest = storage_.latest_checkpoint(chain_id);
  if (!latest.ok()) {
    fail(result, to_error_code(latest.status), latest.error);
    return result;
  }

  if (only_when_due) {
    // Entries past the latest checkpoint, or the chain length without one.
    const auto head_sequence = head.value->sequence;
    const auto due =
        latest.value
            ? head_sequence > latest.value->sequence &&
                  head_sequence - latest.value->sequence >=
                      policy_.interval_entries
            : policy_.interval_entries == 0 ||
                  head_sequence >= policy_.interval_entries - 1;
    if (!due) {
      result.checkpoint = latest.value;
      report_stale(chain_id, result);
      return result;
    }
  }

  // Never witness a tip that no longer matches its own content.
  auto error = std::string{};
  auto recomputed = canonical::compute_entry_hash(*head.value, error);
  if (!recomputed || *recomputed != head.value->entry_hash) {
    spdlog::error("Refusing to checkpoint chain '{}': head seq {} fails hash "
                  "re-verification",
                  chain_id, head.value->sequence);
    fail(result, error_code::chain_integrity_error,
         "head entry fails hash re-verification");
    return result;
  }

  auto export_error = std::string{};
  if (latest.value && latest.value->sequence >= head.value->sequence) {
    if (latest.value->sequence != head.value->sequence ||
        latest.value->root_hash != head.value->entry_hash) {
      fail(result, error_code::chain_integrity_error,
           "latest checkpoint disagrees with the chain head");
      return result;
    }
    result.checkpoint = latest.value;
  } else {
    auto value = checkpoint_t{};
    value.chain_id = std::string{chain_id};
    value.sequence = head.value->sequence;
    value.root_hash = head.value->entry_hash;
    if (!witness_merkle_root(chain_id, latest.value, value, result)) {
      return result;
    }
    value.created_at = clock_();

    auto status = storage_.append_checkpoint(value);
    if (status == storage::store_status::stale_checkpoint) {
      // Another manager instance got there first.
      auto current = storage_.latest_checkpoint(chain_id);
      if (!current.ok() || !current.value) {
        fail(result, error_code::store_unavailable, current.error);
        return result;
      }
      result.checkpoint = current.value;
    } else if (status != storage::store_status::ok) {
      fail(result, to_error_code(status),
           std::string{storage::to_string(status)});
      return result;
    } else {
      result.created = true;
      spdlog::info("Checkpointed chain '{}' at seq {} root {} merkle root {}",
                   chain_id, value.sequence, to_hex(value.root_hash),
                   to_hex(value.merkle_root));
      if (!export_checkpoint(value, export_error)) {
        spdlog::warn("Export of checkpoint chain '{}' seq {} failed: {}",
                     chain_id, value.sequence, export_error);
      }
      result.checkpoint = std::move(value);
    }
  }

  if (result.checkpoint && !result.checkpoint->exported) {
    fail(result, error_code::checkpoint_export_failure,
         export_error.empty() ? "checkpoint is pending export" : export_error);
  }
  report_stale(chain_id, result);
  return result;
}

bool checkpoint_manager::witness_merkle_root(
    const std::string_view& chain_id,
    const std::optional<checkpoint_t>& latest,
    checkpoint_t& value,
    checkpoint_result_t& result) {
  auto accumulator = crypto::merkle_accumulator{};
  if (latest) {
    auto resumed = crypto::merkle_accumulator::resume(latest->sequence + 1,
                                                      latest->merkle_peaks);
    if (!resumed || resumed->root() != latest->merkle_root) {
      spdlog::error("Checkpoint of chain '{}' at seq {} carries Merkle peaks "
                    "that do not reproduce its root",
                    chain_id, latest->sequence);
      fail(result, error_code::chain_integrity_error,
           "latest checkpoint Merkle state is inconsistent");
      return false;
    }
    accumulator = std::move(*resumed);
  }

  // Only entries past the latest checkpoint are folded in.
  auto outcome = storage_.for_each_in_range(
      chain_id, accumulator.size(), value.sequence,
      [&](const audit_entry_t& entry) {
        if (entry.sequence != accumulator.size()) {
          return false;
        }
        accumulator.append(entry.entry_hash);
        return true;
      });
  if (!outcome.ok()) {
    fail(result, to_error_code(outcome.status), outcome.error);
    return false;
  }
  if (accumulator.size() != value.sequence + 1) {
    fail(result, error_code::chain_integrity_error,
         fmt::format("entry {} is missing", accumulator.size()));
    return false;
  }
  value.merkle_root = accumulator.root();
  value.merkle_peaks = accumulator.peaks();
  return true;
}

bool checkpoint_manager::retry_pending_exports(const std::string_view& chain_id,
                                               checkpoint_result_t& result) {
  auto listing = storage_.list_checkpoints(chain_id);
  if (!listing.ok()) {
    fail(result, to_error_code(listing.status), listing.error);
    return false;
  }
  for (auto& value : listing.value) {
    if (value.exported) {
      continue;
    }
    auto error = std::string{};
    if (export_checkpoint(value, error)) {
      ++result.retried_exports;
    } else {
      spdlog::warn("Retry export of checkpoint chain '{}' seq {} failed "
                   "(attempt {}): {}",
                   chain_id, value.sequence, value.export_attempts, error);
    }
  }
  return true;
}

bool checkpoint_manager::export_checkpoint(checkpoint_t& value,
                                           std::string& error) {
  ++value.export_attempts;
  auto exported = exporter_.export_checkpoint(value, error);
  if (exported) {
    value.exported = true;
    value.exported_at = clock_();
    value.export_destination = exporter_.destination();
  }
  auto status = storage_.update_checkpoint(value);
  if (status != storage::store_status::ok) {
    spdlog::error("Failed recording export state of checkpoint chain '{}' "
                  "seq {}: {}",
                  value.chain_id, value.sequence, storage::to_string(status));
    if (exported) {
      error = "export bookkeeping update failed";
    }
    return false;
  }
  return exported;
}

void checkpoint_manager::report_stale(const std::string_view& chain_id,
                                      checkpoint_result_t& result) {
  auto listing = storage_.list_checkpoints(chain_id);
  if (!listing.ok()) {
    return;
  }
  const auto now = clock_();
  const auto threshold = static_cast<timestamp_microseconds_t>(
      std::chrono::duration_cast<std::chrono::microseconds>(policy_.stale_after)
          .count());
  for (auto& value : listing.value) {
    if (!value.exported && now >= value.created_at &&
        now - value.created_at >= threshold) {
      result.stale.push_back(std::move(value));
    }
  }
  if (result.stale.empty()) {
    return;
  }
  spdlog::error("{} checkpoint(s) of chain '{}' unexported for more than {}s",
                result.stale.size(), chain_id, policy_.stale_after.count());
  if (result.ok()) {
    fail(result, error_code::checkpoint_export_failure,
         std::to_string(result.stale.size()) +
             " checkpoint(s) unexported past the staleness threshold");
  }
}

}  // namespace chronicle::execution
