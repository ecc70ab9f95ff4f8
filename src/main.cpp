#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <grpcpp/ext/proto_server_reflection_plugin.h>
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <leasehold/common/critical.hpp>
#include <leasehold/router/access_router.hpp>
#include <leasehold/rpc/server.hpp>
#include <leasehold/schema/encoding/scale/encoder.hpp>
#include <leasehold/storage/rocksdb/storage.hpp>
#include <leasehold/vault/call_executor.hpp>
#include <iostream>
#include <iterator>
#include <string>
#include <thread>
#include <vector>

constexpr auto kCodespace = "leasehold.node";

std::atomic<bool>& shutdown_requested() {
  static std::atomic<bool> requested{};
  return requested;
}

void signal_handler(int) {
  shutdown_requested() = true;
}

leasehold::schema::address_t parse_address(const std::string& name,
                                           const std::string& hex) {
  auto address = leasehold::schema::try_make_address(hex);
  if (!address) {
    leasehold::common::critical(kCodespace,
                                "--" + name + " must be a 20-byte hex address");
  }
  return *address;
}

std::string read_file(const std::string& name, const std::string& path) {
  auto input = std::ifstream{path};
  if (!input.good()) {
    leasehold::common::critical(kCodespace,
                                "--" + name + ": cannot open " + path);
  }
  return std::string{std::istreambuf_iterator<char>{input},
                     std::istreambuf_iterator<char>{}};
}

int main(int argc, char* argv[]) {
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  auto grpc_address = std::string{};
  auto db_path = std::string{};
  auto log_file = std::string{};
  auto log_level = std::string{};
  auto config_path = std::string{};
  auto administrator = std::string{};
  auto lease_manager = std::string{};
  auto network_id = std::string{};
  auto tls_cert = std::string{};
  auto tls_key = std::string{};
  auto approved = std::vector<std::string>{};

  auto vm = boost::program_options::variables_map{};
  auto description = boost::program_options::options_description{"Leasehold"};
  description.add_options()("help,h", "Show the help message")(
      "config,c", boost::program_options::value<std::string>(&config_path),
      "Optional INI style configuration file")(
      "grpc-address,g",
      boost::program_options::value<std::string>(&grpc_address)
          ->default_value("0.0.0.0:26670"),
      "IP:Port for the router gRPC service")(
      "db-path,d",
      boost::program_options::value<std::string>(&db_path)->default_value(
          "leasehold.db"),
      "RocksDB directory")(
      "log-file",
      boost::program_options::value<std::string>(&log_file)->default_value(
          "leasehold.log"),
      "Log file")("log-level",
                  boost::program_options::value<std::string>(&log_level)
                      ->default_value("info"),
                  "trace|debug|info|warn|error")(
      "admin", boost::program_options::value<std::string>(&administrator),
      "Plugin registry administrator address")(
      "lease-manager",
      boost::program_options::value<std::string>(&lease_manager),
      "Marketplace address allowed to assign leases and mint instances")(
      "network-id", boost::program_options::value<std::string>(&network_id),
      "32-byte network id hex used in the request and permit signing "
      "domain")(
      "tls-cert", boost::program_options::value<std::string>(&tls_cert),
      "PEM certificate chain; serves TLS together with --tls-key")(
      "tls-key", boost::program_options::value<std::string>(&tls_key),
      "PEM private key for --tls-cert")(
      "approve-plugin",
      boost::program_options::value<std::vector<std::string>>(&approved)
          ->multitoken(),
      "Plugin types approved by the administrator at startup");
  boost::program_options::store(
      boost::program_options::parse_command_line(argc, argv, description), vm);
  if (vm.contains("config")) {
    auto input = std::ifstream{vm["config"].as<std::string>()};
    if (!input.good()) {
      std::cerr << "cannot open config file " << vm["config"].as<std::string>()
                << std::endl;
      return 1;
    }
    boost::program_options::store(
        boost::program_options::parse_config_file(input, description), vm);
  }
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
      "leasehold", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::from_str(log_level));

  if (administrator.empty() || lease_manager.empty()) {
    leasehold::common::critical(kCodespace,
                                "--admin and --lease-manager are required");
  }
  auto options = leasehold::router::router_options{
      .administrator = parse_address("admin", administrator),
      .lease_manager = parse_address("lease-manager", lease_manager)};
  if (!network_id.empty()) {
    auto parsed = leasehold::schema::try_make_hash32(network_id);
    if (!parsed) {
      leasehold::common::critical(kCodespace,
                                  "--network-id must be 32-byte hex");
    }
    options.network_id = *parsed;
  }

  auto encoder = leasehold::schema::encoding::encoder<
      leasehold::schema::encoding::scale_encoder_tag>{};
  auto storage =
      leasehold::storage::make_storage<leasehold::storage::rocksdb_storage_tag>(
          db_path);
  auto executor = leasehold::vault::journal_call_executor{};
  auto router =
      leasehold::router::access_router{encoder, storage, executor, options};

  for (const auto& name : approved) {
    auto type =
        leasehold::schema::try_from_string<leasehold::schema::policy_type_t>(
            name);
    if (!type) {
      leasehold::common::critical(kCodespace, "unknown plugin type " + name);
    }
    auto result = router.approve_plugin(options.administrator, *type);
    if (!result.ok()) {
      leasehold::common::critical(kCodespace,
                                  "approving " + name + " failed: " +
                                  result.log);
    }
  }

  spdlog::info("gRPC service listening on {}", grpc_address);

  grpc::EnableDefaultHealthCheckService(true);
  grpc::reflection::InitProtoReflectionServerBuilderPlugin();

  auto grpc_listener = leasehold::rpc::listener{router};
  auto grpc_builder = grpc::ServerBuilder();
  // Requests authenticate by signature; TLS only protects the channel.
  auto credentials = grpc::InsecureServerCredentials();
  if (!tls_cert.empty() || !tls_key.empty()) {
    if (tls_cert.empty() || tls_key.empty()) {
      leasehold::common::critical(kCodespace,
                                  "--tls-cert and --tls-key go together");
    }
    auto ssl = grpc::SslServerCredentialsOptions{};
    ssl.pem_key_cert_pairs.push_back(
        grpc::SslServerCredentialsOptions::PemKeyCertPair{
            read_file("tls-key", tls_key), read_file("tls-cert", tls_cert)});
    credentials = grpc::SslServerCredentials(ssl);
  }
  grpc_builder.AddListeningPort(grpc_address, credentials);
  grpc_builder.RegisterService(&grpc_listener);
  auto grpc_server = std::unique_ptr<grpc::Server>(grpc_builder.BuildAndStart());
  if (!grpc_server) {
    leasehold::common::critical(kCodespace,
                                "failed to start gRPC server on " +
                                    grpc_address);
  }
  grpc_server->GetHealthCheckService()->SetServingStatus(false);

  auto threads = std::vector<std::thread>{};
  threads.emplace_back([&] { grpc_server->Wait(); });
  threads.emplace_back([&] {
    while (!shutdown_requested()) {
      grpc_server->GetHealthCheckService()->SetServingStatus(true);
      std::this_thread::sleep_for(std::chrono::seconds(1));
    }
    grpc_server->GetHealthCheckService()->SetServingStatus(false);
    grpc_server->Shutdown();
  });

  for (auto& t : threads) {
    t.join();
  }

  spdlog::info("Leasehold router stopped; {} calls journaled",
               executor.entries().size());
  spdlog::shutdown();
  return 0;
}
