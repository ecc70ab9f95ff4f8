#include <gtest/gtest.h>
#include <leasehold/policy/cooldown.hpp>
#include <leasehold/testing/common.hpp>
#include <leasehold/testing/policy_context.hpp>

using namespace leasehold::schema;
using leasehold::policy::configuration_scope_t;
using leasehold::testing::make_context;
using leasehold::testing::test_vault;

TEST(cooldown, first_action_passes_then_interval_applies) {
  auto fixture = leasehold::testing::storage_fixture{"lh_cooldown_interval"};
  auto plugin =
      leasehold::policy::cooldown{fixture.encoder(), fixture.storage()};
  ASSERT_TRUE(
      plugin.set_interval(configuration_scope_t{.entity_id = 1}, 60'000).ok());

  auto first = make_context(test_vault(), {}, amount_t{1}, 1'000'000);
  ASSERT_TRUE(plugin.check(first.context).allowed);
  plugin.commit(first.context);
  EXPECT_EQ(plugin.last_action(1), timestamp_milliseconds_t{1'000'000});

  auto early = make_context(test_vault(), {}, amount_t{1}, 1'059'999);
  auto decision = plugin.check(early.context);
  EXPECT_FALSE(decision.allowed);
  EXPECT_EQ(decision.reason, "cooldown active");

  auto on_time = make_context(test_vault(), {}, amount_t{1}, 1'060'000);
  EXPECT_TRUE(plugin.check(on_time.context).allowed);
}

TEST(cooldown, unconfigured_rejects_actions_that_move_value) {
  auto fixture = leasehold::testing::storage_fixture{"lh_cooldown_missing"};
  auto plugin =
      leasehold::policy::cooldown{fixture.encoder(), fixture.storage()};
  auto action = make_context(test_vault(), {}, amount_t{1});
  EXPECT_EQ(plugin.check(action.context).reason, "cooldown not configured");
  auto idle = make_context(test_vault(), {});
  EXPECT_TRUE(plugin.check(idle.context).allowed);
}

TEST(cooldown, instance_interval_cannot_be_shorter_than_template) {
  auto fixture = leasehold::testing::storage_fixture{"lh_cooldown_ceiling"};
  auto plugin =
      leasehold::policy::cooldown{fixture.encoder(), fixture.storage()};
  auto instance = configuration_scope_t{.entity_id = 2, .ceiling = 1};
  EXPECT_EQ(plugin.set_interval(instance, 1'000).code,
            error_code_t::ceiling_violation);

  ASSERT_TRUE(
      plugin.set_interval(configuration_scope_t{.entity_id = 1}, 5'000).ok());
  plugin.initialize_instance(2, 1);
  ASSERT_TRUE(plugin.config(2).has_value());
  EXPECT_EQ(plugin.config(2)->minimum_interval, 5'000u);
  EXPECT_FALSE(plugin.last_action(2).has_value());

  EXPECT_EQ(plugin.set_interval(instance, 4'999).code,
            error_code_t::ceiling_violation);
  EXPECT_TRUE(plugin.set_interval(instance, 10'000).ok());
}
