#include <gtest/gtest.h>
#include <leasehold/policy/receiver_guard.hpp>
#include <leasehold/testing/policy_context.hpp>
#include <leasehold/tools/payload_builder.hpp>

#include <iterator>
#include <vector>

using namespace leasehold::schema;
using leasehold::testing::make_address;
using leasehold::testing::make_context;
using leasehold::testing::test_vault;

namespace {

void append_word(bytes_t& out, const address_t& address) {
  out.insert(std::end(out), 12, 0x00);
  out.insert(std::end(out), std::begin(address), std::end(address));
}

void append_word(bytes_t& out, const uint8_t low_byte) {
  out.insert(std::end(out), 31, 0x00);
  out.push_back(low_byte);
}

/// exactInput((bytes path, address recipient, uint256 in, uint256 minOut)),
/// a router entry point the decoder does not recognise.
bytes_t exact_input(const address_t& recipient) {
  auto payload = bytes_t{0xb8, 0x58, 0x18, 0x3f};
  append_word(payload, 0x20);
  append_word(payload, 0x80);
  append_word(payload, recipient);
  append_word(payload, 0x05);
  append_word(payload, 0x01);
  append_word(payload, 0x2b);
  payload.insert(std::end(payload), 0x2b, 0x11);
  payload.insert(std::end(payload), 64 - 0x2b, 0x00);
  return payload;
}

}  // namespace

TEST(receiver_guard, swap_proceeds_must_reach_the_vault) {
  auto guard = leasehold::policy::receiver_guard{};
  auto path = std::vector{make_address(0x10), make_address(0x14)};
  auto to_vault = make_context(
      make_address(0x80), leasehold::tools::encode_swap_exact_tokens_for_tokens(
                              amount_t{1}, amount_t{1}, path, test_vault(), 1));
  EXPECT_TRUE(guard.check(to_vault.context).allowed);

  auto diverted = make_context(
      make_address(0x80), leasehold::tools::encode_swap_exact_tokens_for_tokens(
                              amount_t{1}, amount_t{1}, path,
                              make_address(0x66), 1));
  auto decision = guard.check(diverted.context);
  EXPECT_FALSE(decision.allowed);
  EXPECT_EQ(decision.reason, "swap recipient is not the vault");

  auto single = make_context(
      make_address(0x81),
      leasehold::tools::encode_exact_output_single(
          make_address(0x10), make_address(0x14), 500, make_address(0x66),
          amount_t{1}, amount_t{2}));
  EXPECT_FALSE(guard.check(single.context).allowed);
}

TEST(receiver_guard, transfers_must_reach_the_vault) {
  auto guard = leasehold::policy::receiver_guard{};
  auto token = make_address(0x10);
  auto inbound = make_context(
      token, leasehold::tools::encode_transfer_from(make_address(0x66),
                                                    test_vault(), amount_t{3}));
  EXPECT_TRUE(guard.check(inbound.context).allowed);

  auto outbound = make_context(
      token, leasehold::tools::encode_transfer(make_address(0x66), amount_t{3}));
  auto decision = guard.check(outbound.context);
  EXPECT_FALSE(decision.allowed);
  EXPECT_EQ(decision.reason, "transfer recipient is not the vault");
}

TEST(receiver_guard, raw_value_must_target_the_vault) {
  auto guard = leasehold::policy::receiver_guard{};
  auto to_vault = make_context(test_vault(), {}, amount_t{1});
  EXPECT_TRUE(guard.check(to_vault.context).allowed);

  auto outside = make_context(make_address(0x66), {}, amount_t{1});
  EXPECT_EQ(guard.check(outside.context).reason,
            "value transfer must target the vault");

  auto stub = make_context(test_vault(), bytes_t{0x01, 0x02});
  EXPECT_EQ(guard.check(stub.context).reason,
            "payload shorter than an instruction id");
}

TEST(receiver_guard, approvals_pass_without_value) {
  auto guard = leasehold::policy::receiver_guard{};
  auto approve = make_context(
      make_address(0x10),
      leasehold::tools::encode_approve(make_address(0x80), amount_t{5}));
  EXPECT_TRUE(guard.check(approve.context).allowed);

  auto paid = make_context(
      make_address(0x10),
      leasehold::tools::encode_approve(make_address(0x80), amount_t{5}),
      amount_t{1});
  EXPECT_EQ(guard.check(paid.context).reason, "value must target the vault");

  auto wrap = make_context(make_address(0x11), leasehold::tools::encode_deposit(),
                           amount_t{7});
  EXPECT_TRUE(guard.check(wrap.context).allowed);
}

TEST(receiver_guard, is_owner_only) {
  auto guard = leasehold::policy::receiver_guard{};
  EXPECT_FALSE(guard.renter_configurable());
  EXPECT_FALSE(guard.capabilities().commit_hook);
  EXPECT_FALSE(guard.capabilities().instance_init_hook);
}

TEST(receiver_guard, unrecognized_instructions_are_rejected) {
  auto guard = leasehold::policy::receiver_guard{};
  auto diverted = make_context(make_address(0x81),
                               exact_input(make_address(0x66)));
  ASSERT_EQ(diverted.context.instruction.kind,
            leasehold::decoder::instruction_kind_t::unknown);
  auto decision = guard.check(diverted.context);
  EXPECT_FALSE(decision.allowed);
  EXPECT_EQ(decision.reason, "unrecognized instruction: 0xb858183f");

  // Even a recipient that happens to be the vault cannot be confirmed.
  auto home = make_context(make_address(0x81), exact_input(test_vault()));
  EXPECT_FALSE(guard.check(home.context).allowed);
}

TEST(receiver_guard, malformed_instructions_are_rejected) {
  auto guard = leasehold::policy::receiver_guard{};
  auto payload = leasehold::tools::encode_transfer(test_vault(), amount_t{1});
  payload.pop_back();
  auto truncated = make_context(make_address(0x10), payload);
  ASSERT_EQ(truncated.context.instruction.kind,
            leasehold::decoder::instruction_kind_t::malformed);
  auto decision = guard.check(truncated.context);
  EXPECT_FALSE(decision.allowed);
  EXPECT_EQ(decision.reason,
            "malformed instruction: " + truncated.context.instruction.error);
}
