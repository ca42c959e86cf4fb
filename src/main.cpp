#include <csignal>
#include <grpcpp/ext/proto_server_reflection_plugin.h>
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <bounty/arbitration/dispute_arbitration.hpp>
#include <bounty/config/options.hpp>
#include <bounty/escrow/escrow_ledger.hpp>
#include <bounty/escrow/memory_wallet.hpp>
#include <bounty/execution/state_machine.hpp>
#include <bounty/rpc/server.hpp>
#include <bounty/store/wager_store.hpp>
#include <bounty/sweeper/expiry_sweeper.hpp>
#include <atomic>
#include <chrono>
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

int main(int argc, char* argv[]) {
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  auto parsed = bounty::config::parse_options(argc, argv);
  if (parsed.help) {
    std::cout << *parsed.help << std::endl;
    return 0;
  }
  if (!parsed.config) {
    std::cerr << "Invalid configuration: " << parsed.error << std::endl;
    return 1;
  }
  const auto& config = *parsed.config;

  spdlog::init_thread_pool(8192, 1);
  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
      config.log_file, false);
  auto logger = std::make_shared<spdlog::async_logger>(
      "main", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(config.verbose ? spdlog::level::debug
                                   : spdlog::level::info);

  auto encoder = bounty::store::wager_store::encoder_t{};
  auto storage =
      bounty::storage::make_storage<bounty::storage::rocksdb_storage_tag>(
          config.db_path);
  auto store = bounty::store::wager_store{encoder, storage};

  auto wallet = bounty::escrow::memory_wallet{};
  for (const auto& funding : config.funding) {
    wallet.deposit(funding.account, funding.amount);
    spdlog::info("Funded {} with {}", bounty::schema::to_hex(funding.account),
                 funding.amount);
  }
  auto ledger = bounty::escrow::escrow_ledger{wallet, store};

  auto machine = bounty::execution::state_machine{
      store, ledger, config.engine, bounty::common::system_now,
      [](const bounty::schema::wager_event_t& event) {
        spdlog::debug("event {} for wager {}", to_string(event.type),
                      bounty::schema::to_hex(event.wager_id));
      }};
  auto arbitration =
      bounty::arbitration::dispute_arbitration{machine, config.moderators};
  auto sweeper = bounty::sweeper::expiry_sweeper{
      store, machine,
      bounty::sweeper::sweeper_config{
          .interval = bounty::common::seconds(config.sweep_interval_seconds),
          .batch_size = config.sweep_batch_size}};

  spdlog::info("gRPC service listening on {}", config.grpc_port);

  grpc::EnableDefaultHealthCheckService(true);
  grpc::reflection::InitProtoReflectionServerBuilderPlugin();

  auto grpc_listener = bounty::rpc::listener{machine, arbitration};
  auto grpc_builder = grpc::ServerBuilder();
  grpc_builder.AddListeningPort(config.grpc_port,
                                grpc::InsecureServerCredentials());
  grpc_builder.RegisterService(&grpc_listener);
  auto grpc_server =
      std::unique_ptr<grpc::Server>(grpc_builder.BuildAndStart());
  if (!grpc_server) {
    spdlog::error("Failed to start gRPC server on {}", config.grpc_port);
    spdlog::shutdown();
    return 1;
  }
  grpc_server->GetHealthCheckService()->SetServingStatus(false);

  sweeper.start();

  auto threads = std::vector<std::thread>{};
  threads.emplace_back([&] { grpc_server->Wait(); });
  threads.emplace_back([&] {
    while (!shutdown_requested()) {
      grpc_server->GetHealthCheckService()->SetServingStatus(true);
      std::this_thread::sleep_for(std::chrono::seconds(1));
    }
    grpc_server->GetHealthCheckService()->SetServingStatus(false);
    sweeper.stop();
    grpc_server->Shutdown();
  });

  for (auto& t : threads) {
    t.join();
  }

  spdlog::info("bountyd stopped");
  spdlog::shutdown();
  return 0;
}
