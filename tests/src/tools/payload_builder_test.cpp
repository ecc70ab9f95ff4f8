#include <gtest/gtest.h>
#include <leasehold/crypto/typed_message.hpp>
#include <leasehold/decoder/selectors.hpp>
#include <leasehold/router/access_router.hpp>
#include <leasehold/testing/common.hpp>
#include <leasehold/tools/payload_builder.hpp>
#include <leasehold/vault/vault.hpp>

#include <array>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <sys/wait.h>

#ifndef LEASEHOLD_PAYLOAD_BUILDER_PATH
#define LEASEHOLD_PAYLOAD_BUILDER_PATH ""
#endif

namespace {

using leasehold::testing::make_address;

std::string shell_quote(const std::string_view value) {
  auto out = std::string{"'"};
  for (const auto ch : value) {
    if (ch == '\'') {
      out += "'\\''";
    } else {
      out.push_back(ch);
    }
  }
  out.push_back('\'');
  return out;
}

std::string trim_ascii_whitespace(const std::string& input) {
  auto first = size_t{0};
  while (first < input.size() &&
         std::isspace(static_cast<unsigned char>(input[first])) != 0) {
    ++first;
  }
  auto last = input.size();
  while (last > first &&
         std::isspace(static_cast<unsigned char>(input[last - 1])) != 0) {
    --last;
  }
  return input.substr(first, last - first);
}

std::pair<int, std::string> run_capture(const std::string& command) {
  auto buffer = std::array<char, 256>{};
  auto output = std::string{};
  auto* pipe = popen(command.c_str(), "r");
  if (pipe == nullptr) {
    return {-1, {}};
  }
  while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) !=
         nullptr) {
    output += buffer.data();
  }
  auto status = pclose(pipe);
  if (status == -1 || WIFEXITED(status) == 0) {
    return {-1, output};
  }
  return {WEXITSTATUS(status), output};
}

/// Run the builder binary and return its trimmed stdout, or an empty string
/// when it exits non-zero.
std::string run_builder(const std::string_view args) {
  auto command = shell_quote(LEASEHOLD_PAYLOAD_BUILDER_PATH) + " " +
                 std::string{args} + " 2>/dev/null";
  auto [exit_code, output] = run_capture(command);
  if (exit_code != 0) {
    return {};
  }
  return trim_ascii_whitespace(output);
}

bool builder_available() {
  auto path = std::filesystem::path{LEASEHOLD_PAYLOAD_BUILDER_PATH};
  return !path.empty() && std::filesystem::exists(path);
}

std::string hex(const leasehold::schema::bytes_t& bytes) {
  return leasehold::schema::to_hex(
      leasehold::schema::bytes_view_t{bytes.data(), bytes.size()});
}

}  // namespace

TEST(abi_writer, writes_static_words_in_place) {
  auto payload = leasehold::tools::abi_writer{leasehold::decoder::selector::kTransfer}
                     .address(make_address(0x10))
                     .uint(leasehold::schema::amount_t{5})
                     .build();
  ASSERT_EQ(payload.size(), 4u + 64u);
  EXPECT_EQ(payload, leasehold::tools::encode_transfer(
                         make_address(0x10), leasehold::schema::amount_t{5}));
  // Address words are left padded with twelve zero bytes.
  for (std::size_t i = 4; i < 16; ++i) {
    EXPECT_EQ(payload[i], 0u);
  }
  EXPECT_EQ(payload[16], 0x10);
  EXPECT_EQ(payload.back(), 0x05);
}

TEST(abi_writer, dynamic_array_goes_to_tail) {
  auto path = std::vector<leasehold::schema::address_t>{make_address(0x70),
                                                        make_address(0x74)};
  auto payload = leasehold::tools::abi_writer{leasehold::decoder::selector::kTransfer}
                     .uint(leasehold::schema::amount_t{1})
                     .address_array(path)
                     .address(make_address(0x01))
                     .build();
  // head: 3 words, tail: length word + 2 elements.
  ASSERT_EQ(payload.size(), 4u + (6u * 32u));
  // Offset of the array, relative to the start of the arguments.
  EXPECT_EQ(payload[4 + 32 + 31], 96u);
  EXPECT_EQ(payload[4 + 96 + 31], 2u);
  EXPECT_EQ(payload[4 + 128 + 12], 0x70);
  EXPECT_EQ(payload[4 + 160 + 12], 0x74);
}

TEST(payload_builder_cli, payload_matches_library_encoding) {
  if (!builder_available()) {
    GTEST_SKIP() << "payload_builder binary not built";
  }
  auto to = make_address(0x10);
  auto output = run_builder("payload --kind transfer --to " +
                            leasehold::schema::to_hex(to) + " --amount 5");
  EXPECT_EQ(output.substr(0, 8), "a9059cbb");
  EXPECT_EQ(output, hex(leasehold::tools::encode_transfer(
                        to, leasehold::schema::amount_t{5})));

  auto swap = run_builder(
      "payload --kind swap-exact-in --amount 0x10 --limit 1 --to " +
      leasehold::schema::to_hex(to) + " --path " +
      leasehold::schema::to_hex(make_address(0x70)) + " " +
      leasehold::schema::to_hex(make_address(0x74)));
  EXPECT_EQ(swap, hex(leasehold::tools::encode_swap_exact_tokens_for_tokens(
                      leasehold::schema::amount_t{16},
                      leasehold::schema::amount_t{1},
                      {make_address(0x70), make_address(0x74)}, to, 0)));
}

TEST(payload_builder_cli, unsupported_kind_fails) {
  if (!builder_available()) {
    GTEST_SKIP() << "payload_builder binary not built";
  }
  auto command = shell_quote(LEASEHOLD_PAYLOAD_BUILDER_PATH) +
                 " payload --kind rugpull 2>/dev/null";
  auto [exit_code, output] = run_capture(command);
  EXPECT_NE(exit_code, 0);
}

TEST(payload_builder_cli, vault_and_router_addresses) {
  if (!builder_available()) {
    GTEST_SKIP() << "payload_builder binary not built";
  }
  EXPECT_EQ(run_builder("vault-address --entity-id 7"),
            leasehold::schema::to_hex(leasehold::vault::vault::address_of(7)));
  EXPECT_EQ(run_builder("router-address"),
            leasehold::schema::to_hex(
                leasehold::router::default_router_address()));
}

TEST(payload_builder_cli, permit_message_matches_signing_message) {
  if (!builder_available()) {
    GTEST_SKIP() << "payload_builder binary not built";
  }
  auto network_id = leasehold::testing::make_hash(0x77);
  auto router = make_address(0xC0);
  auto permit = leasehold::schema::operator_permit_t{
      .entity_id = 3,
      .renter = make_address(0x02),
      .operator_address = make_address(0x03),
      .expiry = 5'000,
      .nonce = 2,
      .deadline = 4'000,
  };
  auto expected = leasehold::crypto::signing_message(
      leasehold::crypto::signing_domain{.network_id = network_id,
                                        .verifying_component = router},
      permit);

  auto args =
      std::string{"permit-message --entity-id 3 --expiry 5000 --nonce 2 "
                  "--deadline 4000"} +
      " --renter " + leasehold::schema::to_hex(permit.renter) +
      " --operator " + leasehold::schema::to_hex(permit.operator_address) +
      " --router " + leasehold::schema::to_hex(router) + " --network-id " +
      leasehold::schema::to_hex(leasehold::schema::bytes_view_t{
          network_id.data(), network_id.size()});
  EXPECT_EQ(run_builder(args), hex(expected));
}
