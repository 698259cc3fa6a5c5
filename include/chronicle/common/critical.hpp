#pragma once

#include <csignal>
#include <exception>
#include <string_view>

#include <spdlog/spdlog.h>

namespace chronicle::common {

/// Report a broken internal invariant and terminate.
///
/// Reserved for programmer errors (uninitialized store, fixed-shape encode
/// failures). Caller-visible failures travel as `error_code` values instead.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace chronicle::common
