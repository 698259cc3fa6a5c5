#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <chronicle/execution/checkpoint_exporter.hpp>
#include <chronicle/execution/verification_engine.hpp>

#include <cstdint>
#include <fstream>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace {

namespace po = boost::program_options;

constexpr int kExitValid = 0;
constexpr int kExitBroken = 1;
constexpr int kExitError = 2;
constexpr uint64_t kProgressInterval = 1'000'000;

/// Latest exported checkpoint per chain found in a JSON-lines export file.
std::optional<std::map<std::string, chronicle::schema::checkpoint_t>>
load_anchors(const std::string& path) {
  auto input = std::ifstream{path};
  if (!input.good()) {
    std::cerr << "cannot open checkpoint file '" << path << "'" << std::endl;
    return std::nullopt;
  }
  auto anchors = std::map<std::string, chronicle::schema::checkpoint_t>{};
  auto line = std::string{};
  auto line_number = std::size_t{0};
  while (std::getline(input, line)) {
    ++line_number;
    if (line.empty()) {
      continue;
    }
    auto error = std::string{};
    auto anchor = chronicle::execution::parse_artifact(line, error);
    if (!anchor) {
      std::cerr << path << ":" << line_number << ": " << error << std::endl;
      return std::nullopt;
    }
    auto it = anchors.find(anchor->chain_id);
    if (it == std::end(anchors) || it->second.sequence < anchor->sequence) {
      anchors[anchor->chain_id] = *anchor;
    }
  }
  return anchors;
}

void print(const chronicle::schema::verification_result_t& result) {
  using enum chronicle::schema::verification_status;
  std::cout << result.chain_id << ": ";
  switch (result.status) {
    case valid:
      std::cout << "VALID";
      if (result.covered) {
        std::cout << " [" << result.covered->first << ", "
                  << result.covered->last << "]";
      }
      std::cout << " entries=" << result.entries_checked
                << " tip=" << chronicle::schema::to_hex(result.tip_hash);
      break;
    case broken:
      std::cout << "BROKEN at seq " << result.first_bad_sequence.value_or(0)
                << ": " << chronicle::schema::to_string(result.reason) << " ("
                << result.detail << ")";
      break;
    case error:
      std::cout << "ERROR " << chronicle::schema::to_string(result.code) << " ("
                << result.detail << ")";
      break;
  }
  std::cout << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto db_path = std::string{};
  auto chain_ids = std::vector<std::string>{};
  auto checkpoint_file = std::string{};
  auto parallelism = std::size_t{1};
  auto log_level = std::string{"warn"};

  auto description =
      po::options_description{"chronicle-verify: offline chain auditor"};
  description.add_options()("help,h", "Show the help message")(
      "db-path,d", po::value<std::string>(&db_path)->required(),
      "RocksDB directory of the chain store (opened read-only)")(
      "chain-id,c", po::value<std::vector<std::string>>(&chain_ids),
      "Chain to verify; repeatable. Defaults to every chain in the store")(
      "checkpoint-file,k", po::value<std::string>(&checkpoint_file),
      "Exported checkpoint lines; each chain is verified from its latest one")(
      "parallelism,p",
      po::value<std::size_t>(&parallelism)->default_value(parallelism),
      "Verify stored checkpoint segments on this many threads")(
      "log-level", po::value<std::string>(&log_level)->default_value(log_level),
      "spdlog level for diagnostics");

  try {
    auto vm = po::variables_map{};
    po::store(po::parse_command_line(argc, argv, description), vm);
    if (vm.contains("help")) {
      std::cout << description << std::endl;
      return kExitValid;
    }
    po::notify(vm);
  } catch (const po::error& ex) {
    std::cerr << "chronicle-verify: " << ex.what() << std::endl;
    return kExitError;
  }

  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::from_str(log_level));

  auto anchors = std::map<std::string, chronicle::schema::checkpoint_t>{};
  if (!checkpoint_file.empty()) {
    auto loaded = load_anchors(checkpoint_file);
    if (!loaded) {
      return kExitError;
    }
    anchors = std::move(*loaded);
  }

  auto storage =
      chronicle::storage::make_storage<chronicle::storage::rocksdb_storage_tag>(
          db_path, chronicle::storage::open_mode::read_only);
  auto engine = chronicle::execution::verification_engine{storage};

  if (chain_ids.empty()) {
    auto chains = storage.list_chains();
    if (!chains.ok()) {
      std::cerr << "cannot list chains: " << chains.error << std::endl;
      return kExitError;
    }
    chain_ids = std::move(chains.value);
  }

  auto exit_code = kExitValid;
  for (const auto& chain_id : chain_ids) {
    auto progress = [&chain_id](const chronicle::schema::sequence_t sequence) {
      if (sequence > 0 && sequence % kProgressInterval == 0) {
        spdlog::info("Chain '{}' verified through seq {}", chain_id, sequence);
      }
    };
    auto result = chronicle::schema::verification_result_t{};
    auto anchor = anchors.find(chain_id);
    if (anchor != std::end(anchors)) {
      result = engine.verify(chain_id, anchor->second, {}, progress);
    } else if (parallelism > 1) {
      auto stored = storage.list_checkpoints(chain_id);
      result = stored.ok()
                   ? engine.verify_segments(chain_id, std::move(stored.value),
                                            parallelism)
                   : engine.verify(chain_id, std::nullopt, {}, progress);
    } else {
      result = engine.verify(chain_id, std::nullopt, {}, progress);
    }
    print(result);

    if (result.status == chronicle::schema::verification_status::error) {
      exit_code = kExitError;
    } else if (result.status ==
                   chronicle::schema::verification_status::broken &&
               exit_code == kExitValid) {
      exit_code = kExitBroken;
    }
  }
  return exit_code;
}
