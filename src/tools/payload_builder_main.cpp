#include <boost/program_options.hpp>
#include <leasehold/common/critical.hpp>
#include <leasehold/crypto/typed_message.hpp>
#include <leasehold/router/access_router.hpp>
#include <leasehold/schema/operator_permit.hpp>
#include <leasehold/tools/payload_builder.hpp>
#include <leasehold/vault/vault.hpp>

#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

namespace po = boost::program_options;

constexpr auto kCodespace = "leasehold.payload_builder";

leasehold::schema::address_t get_address(const po::variables_map& vm,
                                         const char* name) {
  if (!vm.contains(name)) {
    leasehold::common::critical(kCodespace, std::string{"missing --"} + name);
  }
  auto address =
      leasehold::schema::try_make_address(vm[name].as<std::string>());
  if (!address) {
    leasehold::common::critical(kCodespace, std::string{"--"} + name +
                                " must be 20-byte hex");
  }
  return *address;
}

leasehold::schema::amount_t get_amount(const po::variables_map& vm,
                                       const char* name) {
  if (!vm.contains(name)) {
    return {};
  }
  try {
    return leasehold::schema::amount_t{vm[name].as<std::string>()};
  } catch (const std::runtime_error&) {
    leasehold::common::critical(kCodespace, std::string{"--"} + name +
                                " must be a decimal or 0x amount");
  }
}

std::vector<leasehold::schema::address_t> get_path(
    const po::variables_map& vm) {
  auto path = std::vector<leasehold::schema::address_t>{};
  if (!vm.contains("path")) {
    return path;
  }
  for (const auto& hex : vm["path"].as<std::vector<std::string>>()) {
    auto address = leasehold::schema::try_make_address(hex);
    if (!address) {
      leasehold::common::critical(kCodespace,
                                  "--path entries must be 20-byte hex");
    }
    path.push_back(*address);
  }
  return path;
}

leasehold::schema::bytes_t build_payload(const po::variables_map& vm) {
  using namespace leasehold::tools;
  const auto kind = vm["kind"].as<std::string>();
  const auto deadline = vm["deadline"].as<uint64_t>();
  if (kind == "transfer") {
    return encode_transfer(get_address(vm, "to"), get_amount(vm, "amount"));
  }
  if (kind == "transfer-from") {
    return encode_transfer_from(get_address(vm, "from"), get_address(vm, "to"),
                                get_amount(vm, "amount"));
  }
  if (kind == "approve") {
    return encode_approve(get_address(vm, "spender"),
                          get_amount(vm, "amount"));
  }
  if (kind == "increase-allowance") {
    return encode_increase_allowance(get_address(vm, "spender"),
                                     get_amount(vm, "amount"));
  }
  if (kind == "decrease-allowance") {
    return encode_decrease_allowance(get_address(vm, "spender"),
                                     get_amount(vm, "amount"));
  }
  if (kind == "permit") {
    return encode_permit(get_address(vm, "from"), get_address(vm, "spender"),
                         get_amount(vm, "amount"), deadline);
  }
  if (kind == "deposit") {
    return encode_deposit();
  }
  if (kind == "withdraw") {
    return encode_withdraw(get_amount(vm, "amount"));
  }
  if (kind == "swap-exact-in") {
    return encode_swap_exact_tokens_for_tokens(
        get_amount(vm, "amount"), get_amount(vm, "limit"), get_path(vm),
        get_address(vm, "to"), deadline);
  }
  if (kind == "swap-exact-out") {
    return encode_swap_tokens_for_exact_tokens(
        get_amount(vm, "amount"), get_amount(vm, "limit"), get_path(vm),
        get_address(vm, "to"), deadline);
  }
  if (kind == "swap-exact-native-in") {
    return encode_swap_exact_eth_for_tokens(get_amount(vm, "limit"),
                                            get_path(vm),
                                            get_address(vm, "to"), deadline);
  }
  if (kind == "exact-input-single") {
    auto path = get_path(vm);
    if (path.size() != 2) {
      leasehold::common::critical(kCodespace,
                                  "exact-input-single takes two --path tokens");
    }
    return encode_exact_input_single(path[0], path[1], vm["fee"].as<uint32_t>(),
                                     get_address(vm, "to"),
                                     get_amount(vm, "amount"),
                                     get_amount(vm, "limit"));
  }
  leasehold::common::critical(kCodespace, "unsupported --kind " + kind);
}

leasehold::schema::bytes_t build_permit_message(const po::variables_map& vm) {
  auto domain = leasehold::crypto::signing_domain{
      .verifying_component = leasehold::router::default_router_address()};
  if (vm.contains("network-id")) {
    auto network_id =
        leasehold::schema::try_make_hash32(vm["network-id"].as<std::string>());
    if (!network_id) {
      leasehold::common::critical(kCodespace,
                                  "--network-id must be 32-byte hex");
    }
    domain.network_id = *network_id;
  }
  if (vm.contains("router")) {
    domain.verifying_component = get_address(vm, "router");
  }
  auto permit = leasehold::schema::operator_permit_t{
      .entity_id = vm["entity-id"].as<uint64_t>(),
      .renter = get_address(vm, "renter"),
      .operator_address = get_address(vm, "operator"),
      .expiry = vm["expiry"].as<uint64_t>(),
      .nonce = vm["nonce"].as<uint64_t>(),
      .deadline = vm["deadline"].as<uint64_t>()};
  return leasehold::crypto::signing_message(domain, permit);
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  payload_builder payload --kind <kind> [options]\n"
            << "  payload_builder permit-message [options]\n"
            << "  payload_builder vault-address --entity-id <id>\n"
            << "  payload_builder router-address\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"payload_builder options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "payload|permit-message|vault-address|router-address")(
      "kind", po::value<std::string>()->default_value("transfer"),
      "transfer|transfer-from|approve|increase-allowance|decrease-allowance|"
      "permit|deposit|withdraw|swap-exact-in|swap-exact-out|"
      "swap-exact-native-in|exact-input-single")(
      "from", po::value<std::string>(), "source or token owner address hex")(
      "to", po::value<std::string>(), "recipient address hex")(
      "spender", po::value<std::string>(), "spender address hex")(
      "amount", po::value<std::string>(), "amount (decimal or 0x hex)")(
      "limit", po::value<std::string>(),
      "swap minimum output or maximum input")(
      "path", po::value<std::vector<std::string>>()->multitoken(),
      "swap path token addresses")(
      "fee", po::value<uint32_t>()->default_value(3000), "pool fee tier")(
      "deadline", po::value<uint64_t>()->default_value(0),
      "call or permit deadline")(
      "entity-id", po::value<uint64_t>()->default_value(0), "entity id")(
      "renter", po::value<std::string>(), "permit renter address hex")(
      "operator", po::value<std::string>(), "permit operator address hex")(
      "expiry", po::value<uint64_t>()->default_value(0),
      "permit delegation expiry ms")(
      "nonce", po::value<uint64_t>()->default_value(0), "permit nonce")(
      "network-id", po::value<std::string>(), "32-byte network id hex")(
      "router", po::value<std::string>(), "verifying router address hex");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  po::store(po::command_line_parser(argc, argv)
                .options(options)
                .positional(positional)
                .run(),
            vm);
  po::notify(vm);

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  if (command == "payload") {
    auto payload = build_payload(vm);
    std::cout << leasehold::schema::to_hex(leasehold::schema::bytes_view_t{
                     payload.data(), payload.size()})
              << '\n';
    return 0;
  }

  if (command == "permit-message") {
    auto message = build_permit_message(vm);
    std::cout << leasehold::schema::to_hex(leasehold::schema::bytes_view_t{
                     message.data(), message.size()})
              << '\n';
    return 0;
  }

  if (command == "vault-address") {
    std::cout << leasehold::schema::to_hex(leasehold::vault::vault::address_of(
                     vm["entity-id"].as<uint64_t>()))
              << '\n';
    return 0;
  }

  if (command == "router-address") {
    std::cout << leasehold::schema::to_hex(
                     leasehold::router::default_router_address())
              << '\n';
    return 0;
  }

  leasehold::common::critical(
      kCodespace,
      "command must be payload|permit-message|vault-address|router-address");
}
