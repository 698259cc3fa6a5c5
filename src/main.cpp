#include <csignal>
#include <grpcpp/ext/proto_server_reflection_plugin.h>
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <atomic>
#include <chronicle/config/options.hpp>
#include <chronicle/execution/append_engine.hpp>
#include <chronicle/execution/checkpoint_exporter.hpp>
#include <chronicle/execution/checkpoint_manager.hpp>
#include <chronicle/execution/verification_engine.hpp>
#include <chronicle/rpc/server.hpp>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

std::atomic<bool>& shutdown_requested() {
  static std::atomic<bool> requested{};
  return requested;
}

void signal_handler(int) {
  shutdown_requested() = true;
}

void configure_logging(const chronicle::config::options& options) {
  spdlog::init_thread_pool(8192, 1);

  auto sinks = std::vector<spdlog::sink_ptr>{
      std::make_shared<spdlog::sinks::stdout_color_sink_mt>()};
  if (!options.log_file.empty()) {
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
        options.log_file, false));
  }

  auto logger = std::make_shared<spdlog::async_logger>(
      "chronicled", std::begin(sinks), std::end(sinks), spdlog::thread_pool(),
      spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::from_str(options.log_level));
}

/// Run checkpoint_if_due over every chain each period until shutdown.
void run_checkpoint_scheduler(
    chronicle::execution::checkpoint_manager& manager,
    const chronicle::execution::store_t& storage,
    const std::chrono::seconds period) {
  auto next_run = std::chrono::steady_clock::now() + period;
  while (!shutdown_requested()) {
    std::this_thread::sleep_for(std::chrono::seconds(1));
    if (std::chrono::steady_clock::now() < next_run) {
      continue;
    }
    next_run = std::chrono::steady_clock::now() + period;

    auto chains = storage.list_chains();
    if (!chains.ok()) {
      spdlog::error("Checkpoint scheduler could not list chains: {}",
                    chains.error);
      continue;
    }
    for (const auto& chain_id : chains.value) {
      if (shutdown_requested()) {
        break;
      }
      auto result = manager.checkpoint_if_due(chain_id);
      if (!result.ok()) {
        spdlog::warn("Scheduled checkpoint of chain '{}' reported {}: {}",
                     chain_id, chronicle::schema::to_string(result.code),
                     result.log);
      }
    }
  }
}

int main(int argc, char* argv[]) {
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  auto parsed = chronicle::config::parse_options(argc, argv);
  if (parsed.status == chronicle::config::parse_status::help) {
    std::cout << parsed.message << std::endl;
    return 0;
  }
  if (parsed.status == chronicle::config::parse_status::error) {
    std::cerr << "chronicled: " << parsed.message << std::endl;
    return 2;
  }
  const auto& options = parsed.values;

  configure_logging(options);

  auto storage = chronicle::storage::make_storage<
      chronicle::storage::rocksdb_storage_tag>(options.db_path);
  auto exporter =
      chronicle::execution::file_exporter{options.checkpoint_export_path};
  auto append_engine =
      chronicle::execution::append_engine{storage, options.append_retry};
  auto verification_engine = chronicle::execution::verification_engine{storage};
  auto checkpoint_manager = chronicle::execution::checkpoint_manager{
      storage, exporter, options.checkpoint};
  auto verify_limiter = chronicle::rpc::rate_limiter{options.verify_limit};

  spdlog::info("gRPC service listening on {}", options.listen);

  grpc::EnableDefaultHealthCheckService(true);
  grpc::reflection::InitProtoReflectionServerBuilderPlugin();

  auto grpc_listener =
      chronicle::rpc::listener{append_engine, verification_engine,
                               checkpoint_manager, storage, verify_limiter};
  auto grpc_builder = grpc::ServerBuilder();
  grpc_builder.AddListeningPort(options.listen,
                                grpc::InsecureServerCredentials());
  grpc_builder.RegisterService(&grpc_listener);
  auto grpc_server = std::unique_ptr<grpc::Server>(grpc_builder.BuildAndStart());
  if (!grpc_server) {
    spdlog::critical("Failed to start gRPC server on {}", options.listen);
    spdlog::shutdown();
    return 1;
  }
  grpc_server->GetHealthCheckService()->SetServingStatus(false);

  auto threads = std::vector<std::thread>{};
  threads.emplace_back([&] { grpc_server->Wait(); });
  threads.emplace_back([&] {
    while (!shutdown_requested()) {
      grpc_server->GetHealthCheckService()->SetServingStatus(true);
      std::this_thread::sleep_for(std::chrono::seconds(1));
    }
    spdlog::info("Shutdown requested");
    grpc_server->GetHealthCheckService()->SetServingStatus(false);
    grpc_listener.stop();
    grpc_server->Shutdown();
  });
  if (options.checkpoint_period.count() > 0) {
    threads.emplace_back([&] {
      run_checkpoint_scheduler(checkpoint_manager, storage,
                               options.checkpoint_period);
    });
  }

  for (auto& t : threads) {
    t.join();
  }

  spdlog::shutdown();
  return 0;
}
