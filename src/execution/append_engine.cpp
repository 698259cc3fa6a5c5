#include <spdlog/spdlog.h>
#include <algorithm>
#include <chronicle/canonical/encoder.hpp>
#include <chronicle/crypto/hash.hpp>
#include <chronicle/execution/append_engine.hpp>
#include <limits>
#include <thread>

using namespace chronicle::schema;

namespace chronicle::execution {

namespace {

append_result_t make_error(const error_code code,
                           std::string log,
                           const uint32_t attempts) {
  auto result = append_result_t{};
  result.code = code;
  result.log = std::move(log);
  result.attempts = attempts;
  return result;
}

}  // namespace

append_engine::append_engine(store_t& storage,
                             retry_policy policy,
                             time_source_t clock)
    : storage_{storage}, policy_{policy}, clock_{std::move(clock)} {
  if (policy_.max_attempts == 0) {
    policy_.max_attempts = 1;
  }
  if (policy_.max_backoff < policy_.initial_backoff) {
    policy_.max_backoff = policy_.initial_backoff;
  }
}

const retry_policy& append_engine::policy() const {
  return policy_;
}

std::shared_ptr<std::mutex> append_engine::chain_mutex(
    const std::string_view& chain_id) {
  auto lock = std::scoped_lock{registry_mutex_};
  auto it = chain_mutexes_.find(chain_id);
  if (it == std::end(chain_mutexes_)) {
    it = chain_mutexes_
             .emplace(std::string{chain_id}, std::make_shared<std::mutex>())
             .first;
  }
  return it->second;
}

append_result_t append_engine::append(const std::string_view& chain_id,
                                      const audit_event& event) {
  if (chain_id.empty()) {
    return make_error(error_code::invalid_argument, "chain_id is required", 0);
  }

  auto error = std::string{};
  auto payload = canonical::payload_text(event.payload, error);
  if (!payload) {
    spdlog::warn("Rejected append to chain '{}': {}", chain_id, error);
    return make_error(error_code::serialization_error, error, 0);
  }

  auto entry = audit_entry_t{};
  entry.chain_id = std::string{chain_id};
  entry.timestamp = event.timestamp.value_or(clock_());
  entry.actor_id = event.actor_id;
  entry.action = event.action;
  entry.resource_type = event.resource_type;
  entry.resource_id = event.resource_id;
  entry.payload = std::move(*payload);

  auto mutex = chain_mutex(chain_id);
  auto lock = std::scoped_lock{*mutex};

  auto backoff = policy_.initial_backoff;
  for (uint32_t attempt = 1; attempt <= policy_.max_attempts; ++attempt) {
    auto head = storage_.get_head(chain_id);
    if (!head.ok()) {
      spdlog::error("Failed reading head of chain '{}': {} ({})", chain_id,
                    storage::to_string(head.status), head.error);
      auto code = head.status == storage::store_status::corrupt_record
                      ? error_code::chain_integrity_error
                      : error_code::store_unavailable;
      return make_error(code, head.error, attempt);
    }

    if (head.value) {
      if (head.value->sequence == std::numeric_limits<sequence_t>::max()) {
        return make_error(error_code::invalid_argument,
                          "chain sequence space exhausted", attempt);
      }
      entry.sequence = head.value->sequence + 1;
      entry.previous_hash = head.value->entry_hash;
    } else {
      entry.sequence = 0;
      entry.previous_hash = kGenesisSentinel;
    }

    auto canonical = canonical::encode(entry, event.payload, error);
    if (!canonical) {
      spdlog::warn("Rejected append to chain '{}': {}", chain_id, error);
      return make_error(error_code::serialization_error, error, attempt);
    }
    entry.entry_hash = crypto::entry_hash(entry.previous_hash,
                                          bytes_view_t{*canonical});

    auto status = storage_.append(entry);
    if (status == storage::store_status::ok) {
      spdlog::debug("Appended chain '{}' seq {} actor '{}' hash {}", chain_id,
                    entry.sequence, entry.actor_id, to_hex(entry.entry_hash));
      auto result = append_result_t{};
      result.attempts = attempt;
      result.entry = std::move(entry);
      return result;
    }

    if (status != storage::store_status::duplicate_sequence) {
      spdlog::error("Store rejected append to chain '{}' seq {}: {}", chain_id,
                    entry.sequence, storage::to_string(status));
      return make_error(error_code::store_unavailable,
                        std::string{storage::to_string(status)}, attempt);
    }

    spdlog::warn(
        "Sequence {} of chain '{}' taken by another writer (attempt {}/{})",
        entry.sequence, chain_id, attempt, policy_.max_attempts);
    if (attempt < policy_.max_attempts) {
      std::this_thread::sleep_for(backoff);
      backoff = std::min(backoff * 2, policy_.max_backoff);
    }
  }

  spdlog::error("Giving up append to chain '{}' after {} attempts", chain_id,
                policy_.max_attempts);
  return make_error(error_code::concurrent_append_conflict,
                    "sequence conflict persisted after retries",
                    policy_.max_attempts);
}

}  // namespace chronicle::execution
