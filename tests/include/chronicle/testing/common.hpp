#pragma once

#include <chronicle/execution/types.hpp>
#include <chronicle/schema/audit_event.hpp>
#include <chronicle/schema/primitives.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>

namespace chronicle::testing {

inline constexpr auto kEpoch =
    chronicle::schema::timestamp_microseconds_t{1'700'000'000'000'000};

inline chronicle::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = chronicle::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline std::string make_db_path(const std::string_view prefix) {
  static auto counter = std::atomic<uint64_t>{};
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path =
      std::filesystem::temp_directory_path() /
      (std::string{prefix} + "_" +
       std::to_string(static_cast<unsigned long long>(now)) + "_" +
       std::to_string(counter.fetch_add(1)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

/// Clock that advances one second per reading, starting at kEpoch.
inline chronicle::execution::time_source_t make_step_clock(
    const chronicle::schema::timestamp_microseconds_t start = kEpoch,
    const chronicle::schema::timestamp_microseconds_t step = 1'000'000) {
  auto next = std::make_shared<std::atomic<uint64_t>>(start);
  return [next, step] { return next->fetch_add(step); };
}

/// Clock whose reading only moves when the test sets it.
struct manual_clock final {
  std::shared_ptr<std::atomic<uint64_t>> now{
      std::make_shared<std::atomic<uint64_t>>(kEpoch)};

  chronicle::execution::time_source_t source() const {
    return [now = now] { return now->load(); };
  }

  void advance(const std::chrono::microseconds by) {
    now->fetch_add(static_cast<uint64_t>(by.count()));
  }
};

inline chronicle::schema::audit_event make_event(
    std::string actor_id,
    std::string action,
    nlohmann::json payload = nlohmann::json::object(),
    std::string resource_type = "document",
    std::string resource_id = "doc-1") {
  auto event = chronicle::schema::audit_event{};
  event.actor_id = std::move(actor_id);
  event.action = std::move(action);
  event.resource_type = std::move(resource_type);
  event.resource_id = std::move(resource_id);
  event.payload = std::move(payload);
  return event;
}

}  // namespace chronicle::testing
