#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <chronicle/config/options.hpp>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace po = boost::program_options;

namespace chronicle::config {

namespace {

bool is_within(const std::filesystem::path& candidate,
               const std::filesystem::path& directory) {
  auto error = std::error_code{};
  auto child = std::filesystem::weakly_canonical(
      std::filesystem::absolute(candidate, error), error);
  auto parent = std::filesystem::weakly_canonical(
      std::filesystem::absolute(directory, error), error);
  if (error) {
    return false;
  }
  auto [parent_end, child_it] = std::mismatch(
      std::begin(parent), std::end(parent), std::begin(child), std::end(child));
  return parent_end == std::end(parent);
}

}  // namespace

parse_result parse_options(const int argc, const char* const argv[]) {
  auto result = parse_result{};
  auto& values = result.values;

  auto config_path = std::string{};
  auto max_attempts = values.append_retry.max_attempts;
  auto initial_backoff_ms =
      static_cast<uint32_t>(values.append_retry.initial_backoff.count());
  auto max_backoff_ms =
      static_cast<uint32_t>(values.append_retry.max_backoff.count());
  auto period_seconds = static_cast<uint64_t>(values.checkpoint_period.count());
  auto stale_seconds =
      static_cast<uint64_t>(values.checkpoint.stale_after.count());

  auto description = po::options_description{"Chronicle"};
  description.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(&config_path),
      "INI-style configuration file")(
      "db-path,d",
      po::value<std::string>(&values.db_path)->default_value(values.db_path),
      "RocksDB directory of the chain store")(
      "listen,l",
      po::value<std::string>(&values.listen)->default_value(values.listen),
      "IP:Port for the AuditTrail gRPC service")(
      "log-level",
      po::value<std::string>(&values.log_level)->default_value(values.log_level),
      "trace, debug, info, warn, error, critical or off")(
      "log-file",
      po::value<std::string>(&values.log_file)->default_value(values.log_file),
      "Log file path; empty logs to the console only")(
      "append-max-attempts",
      po::value<uint32_t>(&max_attempts)->default_value(max_attempts),
      "Attempts before an append reports a concurrent conflict")(
      "append-initial-backoff-ms",
      po::value<uint32_t>(&initial_backoff_ms)->default_value(initial_backoff_ms),
      "First retry delay after a sequence conflict")(
      "append-max-backoff-ms",
      po::value<uint32_t>(&max_backoff_ms)->default_value(max_backoff_ms),
      "Upper bound of the retry delay")(
      "checkpoint-interval-entries",
      po::value<uint64_t>(&values.checkpoint.interval_entries)
          ->default_value(values.checkpoint.interval_entries),
      "Entries past the latest checkpoint before a new one is due")(
      "checkpoint-period-seconds",
      po::value<uint64_t>(&period_seconds)->default_value(period_seconds),
      "Interval of the background checkpoint scheduler; 0 disables it")(
      "checkpoint-export-path",
      po::value<std::string>(&values.checkpoint_export_path)
          ->default_value(values.checkpoint_export_path),
      "File receiving exported checkpoint lines")(
      "checkpoint-stale-seconds",
      po::value<uint64_t>(&stale_seconds)->default_value(stale_seconds),
      "Age at which an unexported checkpoint is reported")(
      "verify-rate",
      po::value<double>(&values.verify_limit.per_second)
          ->default_value(values.verify_limit.per_second),
      "Verify requests per second per chain; 0 disables throttling")(
      "verify-burst",
      po::value<uint32_t>(&values.verify_limit.burst)
          ->default_value(values.verify_limit.burst),
      "Verify requests a chain may issue at once");

  try {
    auto vm = po::variables_map{};
    po::store(po::parse_command_line(argc, argv, description), vm);
    if (vm.contains("help")) {
      auto usage = std::ostringstream{};
      usage << description;
      result.status = parse_status::help;
      result.message = usage.str();
      return result;
    }
    if (vm.contains("config")) {
      auto path = vm["config"].as<std::string>();
      auto input = std::ifstream{path};
      if (!input.good()) {
        result.status = parse_status::error;
        result.message = "cannot open config file '" + path + "'";
        return result;
      }
      po::store(po::parse_config_file(input, description), vm);
    }
    po::notify(vm);
  } catch (const po::error& ex) {
    result.status = parse_status::error;
    result.message = ex.what();
    return result;
  }

  values.append_retry.max_attempts = max_attempts;
  values.append_retry.initial_backoff =
      std::chrono::milliseconds{initial_backoff_ms};
  values.append_retry.max_backoff = std::chrono::milliseconds{max_backoff_ms};
  values.checkpoint_period = std::chrono::seconds{period_seconds};
  values.checkpoint.stale_after = std::chrono::seconds{stale_seconds};

  auto problems = validate(values);
  if (!problems.empty()) {
    result.status = parse_status::error;
    for (const auto& problem : problems) {
      if (!result.message.empty()) {
        result.message += "; ";
      }
      result.message += problem;
    }
  }
  return result;
}

std::vector<std::string> validate(const options& values) {
  auto problems = std::vector<std::string>{};
  if (values.db_path.empty()) {
    problems.emplace_back("db-path must not be empty");
  }
  if (values.listen.empty()) {
    problems.emplace_back("listen must not be empty");
  }
  if (spdlog::level::from_str(values.log_level) == spdlog::level::off &&
      values.log_level != "off") {
    problems.emplace_back("unknown log-level '" + values.log_level + "'");
  }
  if (values.append_retry.max_attempts == 0) {
    problems.emplace_back("append-max-attempts must be at least 1");
  }
  if (values.append_retry.max_backoff < values.append_retry.initial_backoff) {
    problems.emplace_back(
        "append-max-backoff-ms must not be below append-initial-backoff-ms");
  }
  if (values.checkpoint_export_path.empty()) {
    problems.emplace_back("checkpoint-export-path must not be empty");
  } else if (!values.db_path.empty() &&
             is_within(values.checkpoint_export_path, values.db_path)) {
    problems.emplace_back(
        "checkpoint-export-path must lie outside the store directory");
  }
  if (values.verify_limit.per_second < 0.0) {
    problems.emplace_back("verify-rate must not be negative");
  }
  if (values.verify_limit.burst == 0) {
    problems.emplace_back("verify-burst must be at least 1");
  }
  return problems;
}

}  // namespace chronicle::config
