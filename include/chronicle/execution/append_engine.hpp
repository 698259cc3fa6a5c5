#pragma once

#include <chronicle/execution/types.hpp>
#include <chronicle/schema/append_result.hpp>
#include <chronicle/schema/audit_event.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace chronicle::execution {

/// Bounded exponential backoff applied when the store reports that another
/// writer took the sequence this engine computed.
struct retry_policy final {
  uint32_t max_attempts{5};
  std::chrono::milliseconds initial_backoff{5};
  std::chrono::milliseconds max_backoff{200};
};

/// Sequencer for hash-linked chains.
///
/// Appends to one chain are serialized by a per-chain mutex created on
/// demand; appends to different chains never contend. Writers outside this
/// engine (another engine instance, another process) are caught by the
/// store's uniqueness check and retried under `retry_policy`.
class append_engine final {
 public:
  explicit append_engine(store_t& storage,
                         retry_policy policy = {},
                         time_source_t clock = system_now);

  /// Link `event` onto the tip of `chain_id` and commit it.
  ///
  /// Serialization errors and store failures are returned immediately;
  /// only sequence conflicts are retried.
  chronicle::schema::append_result_t append(
      const std::string_view& chain_id,
      const chronicle::schema::audit_event& event);

  const retry_policy& policy() const;

 private:
  std::shared_ptr<std::mutex> chain_mutex(const std::string_view& chain_id);

  store_t& storage_;
  retry_policy policy_;
  time_source_t clock_;
  std::mutex registry_mutex_;
  std::map<std::string, std::shared_ptr<std::mutex>, std::less<>>
      chain_mutexes_;
};

}  // namespace chronicle::execution
