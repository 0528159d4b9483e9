#include <grpcpp/ext/proto_server_reflection_plugin.h>
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <atomic>
#include <boost/program_options.hpp>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <timelock/abci/server.hpp>
#include <timelock/execution/engine.hpp>
#include <timelock/schema/encoding/scale/encoder.hpp>
#include <timelock/storage/rocksdb/storage.hpp>
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

  auto grpc_port = std::string{};
  auto db_path = std::string{};
  auto chain_name = std::string{};
  auto log_file = std::string{};

  auto vm = boost::program_options::variables_map{};
  auto description = boost::program_options::options_description{"Timelock"};
  description.add_options()("help,h", "Show the help message")(
      "grpc-port,g",
      boost::program_options::value<std::string>(&grpc_port)
          ->default_value("0.0.0.0:26658"),
      "IP:Port for the ABCI server")(
      "db-path,d",
      boost::program_options::value<std::string>(&db_path)->default_value(
          "timelock.db"),
      "RocksDB directory")(
      "chain-id,c",
      boost::program_options::value<std::string>(&chain_name)
          ->default_value(std::string{timelock::execution::kDefaultChainName}),
      "Chain name hashed into the transaction chain id")(
      "log-file,l",
      boost::program_options::value<std::string>(&log_file)->default_value(
          "timelock.log"),
      "Log file path")("insecure-skip-signatures",
                       "Accept every signature (test networks only)")(
      "verbose,v", "Enable verbose output");
  boost::program_options::store(
      boost::program_options::parse_command_line(argc, argv, description), vm);
  boost::program_options::notify(vm);

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    return 0;
  }

  spdlog::init_thread_pool(8192, 1);
  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);
  auto logger = std::make_shared<spdlog::async_logger>(
      "timelockd", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(vm.contains("verbose") ? spdlog::level::debug
                                           : spdlog::level::info);

  auto encoder = timelock::schema::encoding::encoder<
      timelock::schema::encoding::scale_encoder_tag>{};
  auto storage =
      timelock::storage::make_storage<timelock::storage::rocksdb_storage_tag>(
          db_path);
  auto engine = timelock::execution::engine{
      encoder, storage, chain_name, !vm.contains("insecure-skip-signatures")};

  spdlog::info("gRPC service listening on {}", grpc_port);

  grpc::EnableDefaultHealthCheckService(true);
  grpc::reflection::InitProtoReflectionServerBuilderPlugin();

  auto grpc_listener = timelock::abci::listener{engine};
  auto grpc_builder = grpc::ServerBuilder();
  grpc_builder.AddListeningPort(grpc_port, grpc::InsecureServerCredentials());
  grpc_builder.RegisterService(&grpc_listener);
  auto grpc_server = std::unique_ptr<grpc::Server>(grpc_builder.BuildAndStart());
  if (!grpc_server) {
    spdlog::critical("Failed to start gRPC server on {}", grpc_port);
    spdlog::shutdown();
    return 1;
  }

  auto threads = std::vector<std::thread>{};
  threads.emplace_back([&] { grpc_server->Wait(); });
  threads.emplace_back([&] {
    while (!shutdown_requested()) {
      grpc_server->GetHealthCheckService()->SetServingStatus(true);
      std::this_thread::sleep_for(std::chrono::seconds(1));
    }
    spdlog::info("Shutdown requested");
    grpc_server->GetHealthCheckService()->SetServingStatus(false);
    grpc_server->Shutdown();
  });

  for (auto& t : threads) {
    t.join();
  }

  spdlog::shutdown();
  return 0;
}
