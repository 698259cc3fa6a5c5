#include <chronicle/execution/types.hpp>

#include <chrono>

namespace chronicle::execution {

chronicle::schema::timestamp_microseconds_t system_now() {
  const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<chronicle::schema::timestamp_microseconds_t>(
      std::chrono::duration_cast<std::chrono::microseconds>(since_epoch)
          .count());
}

}  // namespace chronicle::execution
