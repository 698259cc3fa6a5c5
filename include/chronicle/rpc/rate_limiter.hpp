#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <string_view>

namespace chronicle::rpc {

struct rate_limit final {
  /// Sustained requests per second per key; zero or less disables limiting.
  double per_second{2.0};
  /// Requests a key may spend at once after being idle.
  uint32_t burst{4};
};

/// Token bucket per key (the chain id for Verify).
class rate_limiter final {
 public:
  using now_source_t = std::function<std::chrono::steady_clock::time_point()>;

  explicit rate_limiter(rate_limit limit,
                        now_source_t clock = std::chrono::steady_clock::now);

  /// Spend one token of `key`; false when the bucket is empty.
  bool try_acquire(const std::string_view& key);

  const rate_limit& limit() const;

 private:
  struct bucket final {
    double tokens{};
    std::chrono::steady_clock::time_point last_refill;
  };

  void refill(bucket& state, std::chrono::steady_clock::time_point now) const;

  rate_limit limit_;
  now_source_t clock_;
  std::mutex mutex_;
  std::map<std::string, bucket, std::less<>> buckets_;
};

}  // namespace chronicle::rpc
