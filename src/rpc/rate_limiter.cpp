#include <algorithm>
#include <chronicle/rpc/rate_limiter.hpp>

namespace chronicle::rpc {

rate_limiter::rate_limiter(rate_limit limit, now_source_t clock)
    : limit_{limit}, clock_{std::move(clock)} {
  if (limit_.burst == 0) {
    limit_.burst = 1;
  }
}

const rate_limit& rate_limiter::limit() const {
  return limit_;
}

void rate_limiter::refill(bucket& state,
                          const std::chrono::steady_clock::time_point now) const {
  if (now <= state.last_refill) {
    return;
  }
  const auto elapsed =
      std::chrono::duration<double>(now - state.last_refill).count();
  state.tokens = std::min(state.tokens + (elapsed * limit_.per_second),
                          static_cast<double>(limit_.burst));
  state.last_refill = now;
}

bool rate_limiter::try_acquire(const std::string_view& key) {
  if (limit_.per_second <= 0.0) {
    return true;
  }
  const auto now = clock_();
  auto lock = std::scoped_lock{mutex_};
  auto it = buckets_.find(key);
  if (it == std::end(buckets_)) {
    it = buckets_
             .emplace(std::string{key},
                      bucket{static_cast<double>(limit_.burst), now})
             .first;
  }
  refill(it->second, now);
  if (it->second.tokens < 1.0) {
    return false;
  }
  it->second.tokens -= 1.0;
  return true;
}

}  // namespace chronicle::rpc
