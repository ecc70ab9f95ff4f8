#include <gtest/gtest.h>
#include <leasehold/testing/common.hpp>
#include <leasehold/testing/router_fixture.hpp>
#include <leasehold/vault/vault.hpp>

namespace {

using leasehold::schema::amount_t;
using leasehold::schema::error_code_t;
using leasehold::testing::make_address;

const auto kRouter = make_address(0xC0);

struct vault_harness final {
  explicit vault_harness(const std::string_view prefix)
      : store{prefix},
        holder{store.encoder(), store.storage(), executor, kRouter} {}

  leasehold::testing::storage_fixture store;
  leasehold::testing::recording_executor executor;
  leasehold::vault::vault holder;
};

}  // namespace

TEST(vault, address_is_deterministic_and_distinct_per_entity) {
  EXPECT_EQ(leasehold::vault::vault::address_of(1),
            leasehold::vault::vault::address_of(1));
  EXPECT_NE(leasehold::vault::vault::address_of(1),
            leasehold::vault::vault::address_of(2));
  EXPECT_FALSE(
      leasehold::schema::is_zero(leasehold::vault::vault::address_of(0)));
}

TEST(vault, rejects_callers_other_than_router) {
  auto harness = vault_harness{"leasehold_vault_caller"};
  auto stranger = make_address(0x01);

  EXPECT_EQ(harness.holder.deposit(stranger, 1, amount_t{5}).code,
            error_code_t::authorization_denied);
  ASSERT_TRUE(harness.holder.deposit(kRouter, 1, amount_t{5}).ok());

  auto action = leasehold::schema::action_t{.destination = make_address(0x70),
                                            .value = amount_t{1}};
  EXPECT_EQ(harness.holder.forward(stranger, 1, action).code,
            error_code_t::authorization_denied);
  EXPECT_EQ(harness.holder.withdraw(stranger, 1, stranger, amount_t{5}).code,
            error_code_t::authorization_denied);
  EXPECT_TRUE(harness.executor.calls.empty());
  EXPECT_EQ(harness.holder.balance(1), amount_t{5});
}

TEST(vault, forward_debits_only_on_success) {
  auto harness = vault_harness{"leasehold_vault_forward"};
  ASSERT_TRUE(harness.holder.deposit(kRouter, 1, amount_t{10}).ok());

  auto action = leasehold::schema::action_t{.destination = make_address(0x70),
                                            .value = amount_t{4}};
  harness.executor.fail = true;
  auto failed = harness.holder.forward(kRouter, 1, action);
  EXPECT_EQ(failed.code, error_code_t::call_failed);
  EXPECT_EQ(failed.info, "execution reverted");
  EXPECT_EQ(harness.holder.balance(1), amount_t{10});

  harness.executor.fail = false;
  ASSERT_TRUE(harness.holder.forward(kRouter, 1, action).ok());
  EXPECT_EQ(harness.holder.balance(1), amount_t{6});
  ASSERT_EQ(harness.executor.calls.size(), 2u);
  EXPECT_EQ(harness.executor.calls.back().from,
            leasehold::vault::vault::address_of(1));
}

TEST(vault, value_sent_to_itself_keeps_the_balance) {
  auto harness = vault_harness{"leasehold_vault_self"};
  ASSERT_TRUE(harness.holder.deposit(kRouter, 1, amount_t{10}).ok());
  auto own = leasehold::vault::vault::address_of(1);
  auto action =
      leasehold::schema::action_t{.destination = own, .value = amount_t{4}};
  ASSERT_TRUE(harness.holder.forward(kRouter, 1, action).ok());
  EXPECT_EQ(harness.holder.balance(1), amount_t{10});
  ASSERT_EQ(harness.executor.calls.size(), 1u);
  EXPECT_EQ(harness.executor.calls[0].from, own);

  // The balance check still applies to the attempted value.
  action.value = amount_t{11};
  EXPECT_EQ(harness.holder.forward(kRouter, 1, action).code,
            error_code_t::insufficient_balance);
}

TEST(vault, forward_rejects_value_above_balance) {
  auto harness = vault_harness{"leasehold_vault_balance"};
  ASSERT_TRUE(harness.holder.deposit(kRouter, 1, amount_t{3}).ok());
  auto action = leasehold::schema::action_t{.destination = make_address(0x70),
                                            .value = amount_t{4}};
  EXPECT_EQ(harness.holder.forward(kRouter, 1, action).code,
            error_code_t::insufficient_balance);
  EXPECT_TRUE(harness.executor.calls.empty());
}

TEST(vault, balances_are_isolated_per_entity) {
  auto harness = vault_harness{"leasehold_vault_isolation"};
  ASSERT_TRUE(harness.holder.deposit(kRouter, 1, amount_t{7}).ok());
  ASSERT_TRUE(harness.holder.deposit(kRouter, 2, amount_t{9}).ok());
  ASSERT_TRUE(harness.vault
                  .withdraw(kRouter, 1, make_address(0x01), amount_t{7})
                  .ok());
  EXPECT_EQ(harness.holder.balance(1), amount_t{0});
  EXPECT_EQ(harness.holder.balance(2), amount_t{9});
  ASSERT_EQ(harness.executor.calls.size(), 1u);
  EXPECT_EQ(harness.executor.calls[0].action.destination, make_address(0x01));
  EXPECT_TRUE(harness.executor.calls[0].action.payload.empty());
}

TEST(vault, deposit_rejects_overflow) {
  auto harness = vault_harness{"leasehold_vault_overflow"};
  ASSERT_TRUE(
      harness.holder.deposit(kRouter, 1, leasehold::schema::max_amount()).ok());
  EXPECT_EQ(harness.holder.deposit(kRouter, 1, amount_t{1}).code,
            error_code_t::invalid_argument);
  EXPECT_EQ(harness.holder.balance(1), leasehold::schema::max_amount());
}

TEST(journal_call_executor, records_calls_in_sequence) {
  auto journal = leasehold::vault::journal_call_executor{};
  auto first = journal.execute(
      make_address(0x90),
      leasehold::schema::action_t{.destination = make_address(0x70)});
  auto second = journal.execute(
      make_address(0x91),
      leasehold::schema::action_t{.destination = make_address(0x71),
                                  .value = amount_t{2}});
  EXPECT_TRUE(first.success);
  EXPECT_TRUE(second.success);
  auto entries = journal.entries();
  ASSERT_EQ(entries.size(), 2u);
  EXPECT_EQ(entries[0].sequence, 1u);
  EXPECT_EQ(entries[1].sequence, 2u);
  EXPECT_EQ(entries[1].from, make_address(0x91));
  EXPECT_EQ(entries[1].action.value, amount_t{2});
}
