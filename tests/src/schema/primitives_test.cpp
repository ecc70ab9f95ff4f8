#include <gtest/gtest.h>
#include <leasehold/schema/audit_event_type.hpp>
#include <leasehold/schema/entity_status.hpp>
#include <leasehold/schema/policy_type.hpp>
#include <leasehold/schema/primitives.hpp>

TEST(primitives, address_parses_with_and_without_prefix) {
  auto with_prefix = leasehold::schema::try_make_address(
      "0x0102030405060708090a0b0c0d0e0f1011121314");
  auto without_prefix = leasehold::schema::try_make_address(
      "0102030405060708090A0B0C0D0E0F1011121314");
  ASSERT_TRUE(with_prefix.has_value());
  ASSERT_TRUE(without_prefix.has_value());
  EXPECT_EQ(*with_prefix, *without_prefix);
  EXPECT_EQ((*with_prefix)[0], 0x01);
  EXPECT_EQ((*with_prefix)[19], 0x14);
  EXPECT_EQ(leasehold::schema::to_hex(*with_prefix),
            "0x0102030405060708090a0b0c0d0e0f1011121314");
}

TEST(primitives, address_rejects_wrong_width_and_bad_digits) {
  EXPECT_FALSE(leasehold::schema::try_make_address("0x0102").has_value());
  EXPECT_FALSE(leasehold::schema::try_make_address(
                   "0x0102030405060708090a0b0c0d0e0f10111213zz")
                   .has_value());
  EXPECT_FALSE(leasehold::schema::try_make_hash32("abc").has_value());
}

TEST(primitives, zero_address_and_max_amount) {
  EXPECT_TRUE(leasehold::schema::is_zero(leasehold::schema::make_zero_address()));
  auto address = leasehold::schema::make_zero_address();
  address[19] = 1;
  EXPECT_FALSE(leasehold::schema::is_zero(address));

  auto max = leasehold::schema::max_amount();
  EXPECT_EQ(max + 1, leasehold::schema::amount_t{0});
  EXPECT_EQ(boost::multiprecision::msb(max), 255u);
}

TEST(primitives, hex_round_trips_bytes) {
  auto payload = leasehold::schema::bytes_t{0x00, 0xA9, 0x05, 0xFF};
  auto hex = leasehold::schema::to_hex(
      leasehold::schema::bytes_view_t{payload.data(), payload.size()});
  EXPECT_EQ(hex, "00a905ff");
  EXPECT_EQ(leasehold::schema::try_from_hex(hex), payload);
  EXPECT_FALSE(leasehold::schema::try_from_hex("abc").has_value());
}

TEST(primitives, enum_names_are_stable) {
  using leasehold::schema::policy_type_t;
  EXPECT_EQ(leasehold::schema::to_string(policy_type_t::spend_limit),
            "spend_limit");
  EXPECT_EQ(leasehold::schema::try_from_string<policy_type_t>("cooldown"),
            policy_type_t::cooldown);
  EXPECT_FALSE(leasehold::schema::try_from_string<policy_type_t>("nonsense")
                   .has_value());
  EXPECT_EQ(leasehold::schema::to_string(
                leasehold::schema::entity_status_t::terminated),
            "terminated");
  EXPECT_EQ(leasehold::schema::to_string(
                leasehold::schema::audit_event_type_t::policy_commit_failed),
            "policy_commit_failed");
}

TEST(primitives, every_named_enum_parses_its_own_names) {
  using namespace leasehold::schema;
  for (const auto& [name, value] : kEntityStatusMappings) {
    EXPECT_EQ(try_from_string<entity_status_t>(name), value);
  }
  for (const auto& [name, value] : kAuditEventTypeMappings) {
    EXPECT_EQ(try_from_string<audit_event_type_t>(name), value);
  }
  EXPECT_FALSE(try_from_string<policy_type_t>("Cooldown").has_value());
  EXPECT_EQ(name_of(static_cast<entity_status_t>(9)), "unknown");
  static_assert(name_of(policy_type_t::receiver_guard) == "receiver_guard");
}
