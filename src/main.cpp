#include <atomic>
#include <chrono>
#include <csignal>
#include <grpcpp/ext/proto_server_reflection_plugin.h>
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <corridor/execution/engine.hpp>
#include <corridor/rpc/server.hpp>
#include <iostream>
#include <memory>
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

int main(int argc, char* argv[]) {
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  auto grpc_address = std::string{};
  auto db_path = std::string{};
  auto admin_hex = std::string{};
  auto per_intent_cost = uint64_t{};
  auto log_file = std::string{};
  auto log_level = std::string{};
  auto config_path = std::string{};
  auto sync_writes = false;

  auto vm = boost::program_options::variables_map{};
  auto description = boost::program_options::options_description{"Corridor"};
  description.add_options()("help,h", "Show the help message")(
      "config,c", boost::program_options::value<std::string>(&config_path),
      "INI file with any of the options below")(
      "grpc-address,g",
      boost::program_options::value<std::string>(&grpc_address)
          ->default_value("0.0.0.0:26670"),
      "IP:Port for the settlement service")(
      "db-path,d",
      boost::program_options::value<std::string>(&db_path)->default_value(
          "corridor-data"),
      "RocksDB directory")(
      "sync-writes",
      boost::program_options::bool_switch(&sync_writes),
      "fsync every committed batch")(
      "admin,a", boost::program_options::value<std::string>(&admin_hex),
      "Administrator identity, 64 hex characters")(
      "per-intent-cost",
      boost::program_options::value<uint64_t>(&per_intent_cost)
          ->default_value(corridor::execution::kDefaultPerIntentProcessingCost),
      "Processing cost attributed to each netted intent")(
      "log-file",
      boost::program_options::value<std::string>(&log_file)->default_value(
          "corridor.log"),
      "Log file path")(
      "log-level",
      boost::program_options::value<std::string>(&log_level)->default_value(
          "info"),
      "trace, debug, info, warn, error or critical");

  try {
    boost::program_options::store(
        boost::program_options::parse_command_line(argc, argv, description),
        vm);
    if (vm.contains("config")) {
      boost::program_options::store(
          boost::program_options::parse_config_file<char>(
              vm["config"].as<std::string>().c_str(), description),
          vm);
    }
    boost::program_options::notify(vm);
  } catch (const boost::program_options::error& ex) {
    std::cerr << ex.what() << std::endl << description << std::endl;
    return 1;
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    return 0;
  }

  spdlog::init_thread_pool(8192, 1);
  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);
  auto logger = std::make_shared<spdlog::async_logger>(
      "corridor", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::from_str(log_level));

  auto admin_bytes = corridor::schema::try_from_hex(admin_hex);
  if (!admin_bytes || admin_bytes->size() != 32) {
    spdlog::error("--admin must be a 32-byte identity in hex");
    spdlog::shutdown();
    return 1;
  }

  auto config = corridor::execution::engine_config{};
  config.administrator = corridor::schema::make_hash32(*admin_bytes);
  config.per_intent_processing_cost = per_intent_cost;

  auto encoder = corridor::execution::encoder_t{};
  auto storage = corridor::storage::make_storage<
      corridor::storage::rocksdb_storage_tag>(
      db_path, corridor::storage::storage_options{.sync_writes = sync_writes});
  auto engine = corridor::execution::engine{encoder, storage, config};

  grpc::EnableDefaultHealthCheckService(true);
  grpc::reflection::InitProtoReflectionServerBuilderPlugin();

  auto grpc_listener = corridor::rpc::listener{engine};
  auto grpc_builder = grpc::ServerBuilder();
  grpc_builder.AddListeningPort(grpc_address,
                                grpc::InsecureServerCredentials());
  grpc_builder.RegisterService(&grpc_listener);
  auto grpc_server = std::unique_ptr<grpc::Server>(grpc_builder.BuildAndStart());
  if (!grpc_server) {
    spdlog::error("Failed to start gRPC server on {}", grpc_address);
    spdlog::shutdown();
    return 1;
  }
  spdlog::info("Settlement service listening on {}", grpc_address);

  auto threads = std::vector<std::thread>{};
  threads.emplace_back([&] { grpc_server->Wait(); });
  threads.emplace_back([&] {
    grpc_server->GetHealthCheckService()->SetServingStatus(true);
    while (!shutdown_requested()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(250));
    }
    spdlog::info("Shutting down settlement service");
    grpc_server->GetHealthCheckService()->SetServingStatus(false);
    grpc_server->Shutdown();
  });

  for (auto& t : threads) {
    t.join();
  }

  spdlog::shutdown();
  return 0;
}
