#pragma once

#include <chronicle/execution/append_engine.hpp>
#include <chronicle/execution/checkpoint_manager.hpp>
#include <chronicle/rpc/rate_limiter.hpp>
#include <chrono>
#include <string>
#include <vector>

namespace chronicle::config {

/// Runtime settings of the chronicled daemon.
struct options final {
  std::string db_path{"chronicle-data"};
  std::string listen{"0.0.0.0:50051"};
  std::string log_level{"info"};
  std::string log_file{"chronicled.log"};
  chronicle::execution::retry_policy append_retry;
  chronicle::execution::checkpoint_policy checkpoint;
  std::chrono::seconds checkpoint_period{60};
  std::string checkpoint_export_path{"chronicle-checkpoints.jsonl"};
  chronicle::rpc::rate_limit verify_limit;
};

enum class parse_status : uint8_t {
  ok = 0,
  /// `--help` was requested; `message` holds the usage text.
  help = 1,
  error = 2,
};

struct parse_result final {
  parse_status status{parse_status::ok};
  options values;
  std::string message;
};

/// Parse the command line, then the optional `--config` file. Values given on
/// the command line take precedence over the file.
parse_result parse_options(int argc, const char* const argv[]);

/// Semantic checks applied after parsing. Returns one message per problem.
std::vector<std::string> validate(const options& values);

}  // namespace chronicle::config
