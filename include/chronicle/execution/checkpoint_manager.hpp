#pragma once

#include <chronicle/execution/checkpoint_exporter.hpp>
#include <chronicle/execution/types.hpp>
#include <chronicle/schema/checkpoint_result.hpp>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace chronicle::execution {

struct checkpoint_policy final {
  /// Entries past the latest checkpoint before `checkpoint_if_due` fires.
  uint64_t interval_entries{1000};
  /// Age after which an unexported checkpoint is reported as failed.
  std::chrono::seconds stale_after{3600};
};

/// Witnesses chain tips outside the store.
///
/// Each run first retries pending exports, then persists a checkpoint of the
/// current head (reusing the latest one when the head has not advanced) and
/// hands it to the exporter. A new checkpoint also carries the Merkle root
/// over every entry hash up to the head, extended from the latest one. An export failure never loses the checkpoint:
/// it stays persisted with `exported = false` until a later run succeeds.
class checkpoint_manager final {
 public:
  checkpoint_manager(store_t& storage,
                     checkpoint_exporter& exporter,
                     checkpoint_policy policy = {},
                     time_source_t clock = system_now);

  chronicle::schema::checkpoint_result_t checkpoint(
      const std::string_view& chain_id);

  /// Checkpoint only when the head is at least `interval_entries` past the
  /// latest checkpoint; otherwise just retry pending exports.
  chronicle::schema::checkpoint_result_t checkpoint_if_due(
      const std::string_view& chain_id);

  chronicle::storage::store_result<std::vector<chronicle::schema::checkpoint_t>>
  list_checkpoints(const std::string_view& chain_id) const;

  const checkpoint_policy& policy() const;

 private:
  chronicle::schema::checkpoint_result_t run(const std::string_view& chain_id,
                                             bool only_when_due);
  bool witness_merkle_root(
      const std::string_view& chain_id,
      const std::optional<chronicle::schema::checkpoint_t>& latest,
      chronicle::schema::checkpoint_t& value,
      chronicle::schema::checkpoint_result_t& result);
  bool retry_pending_exports(const std::string_view& chain_id,
                             chronicle::schema::checkpoint_result_t& result);
  bool export_checkpoint(chronicle::schema::checkpoint_t& value,
                         std::string& error);
  void report_stale(const std::string_view& chain_id,
                    chronicle::schema::checkpoint_result_t& result);

  store_t& storage_;
  checkpoint_exporter& exporter_;
  checkpoint_policy policy_;
  time_source_t clock_;
  std::mutex mutex_;
};

}  // namespace chronicle::execution
