#include <gtest/gtest.h>
#include <leasehold/schema/cooldown_config.hpp>
#include <leasehold/schema/key/state_keys.hpp>
#include <leasehold/testing/common.hpp>

#include <vector>

namespace {

using leasehold::testing::make_address;

leasehold::schema::cooldown_config_t make_cooldown(const uint64_t interval) {
  return leasehold::schema::cooldown_config_t{.minimum_interval = interval};
}

}  // namespace

TEST(storage, get_missing_key_returns_nullopt) {
  auto fixture = leasehold::testing::storage_fixture{"leasehold_storage_get"};
  auto key = leasehold::schema::key::make_entity_key(
      leasehold::schema::key::kCooldownConfigPrefix, 1);
  EXPECT_FALSE(fixture.storage()
                   .get<leasehold::schema::cooldown_config_t>(
                       fixture.encoder(), key)
                   .has_value());
}

TEST(storage, put_get_erase) {
  auto fixture = leasehold::testing::storage_fixture{"leasehold_storage_put"};
  auto key = leasehold::schema::key::make_entity_key(
      leasehold::schema::key::kCooldownConfigPrefix, 1);
  fixture.storage().put(fixture.encoder(), key, make_cooldown(60'000));

  auto loaded = fixture.storage().get<leasehold::schema::cooldown_config_t>(
      fixture.encoder(), key);
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->minimum_interval, 60'000u);

  fixture.storage().erase(key);
  EXPECT_FALSE(fixture.storage()
                   .get<leasehold::schema::cooldown_config_t>(
                       fixture.encoder(), key)
                   .has_value());
  // Erasing again is not an error.
  fixture.storage().erase(key);
}

TEST(storage, list_by_prefix_is_scoped_and_ordered) {
  auto fixture = leasehold::testing::storage_fixture{"leasehold_storage_list"};
  const auto prefix = leasehold::schema::key::kTokenWhitelistPrefix;
  auto entity_prefix = leasehold::schema::key::make_entity_key(prefix, 1);

  fixture.storage().put(
      fixture.encoder(),
      leasehold::schema::key::make_entity_address_key(prefix, 1,
                                                      make_address(0x30)),
      true);
  fixture.storage().put(
      fixture.encoder(),
      leasehold::schema::key::make_entity_address_key(prefix, 1,
                                                      make_address(0x10)),
      true);
  // Entity 256 must not be matched by the prefix of entity 1.
  fixture.storage().put(
      fixture.encoder(),
      leasehold::schema::key::make_entity_address_key(prefix, 256,
                                                      make_address(0x20)),
      true);

  auto entries = fixture.storage().list_by_prefix(entity_prefix);
  ASSERT_EQ(entries.size(), 2u);
  EXPECT_EQ(leasehold::schema::key::address_from_key(entries[0].first),
            make_address(0x10));
  EXPECT_EQ(leasehold::schema::key::address_from_key(entries[1].first),
            make_address(0x30));
}

TEST(storage, replace_by_prefix_swaps_only_that_prefix) {
  auto fixture =
      leasehold::testing::storage_fixture{"leasehold_storage_replace"};
  const auto prefix = leasehold::schema::key::kDestinationWhitelistPrefix;
  auto entity_one = leasehold::schema::key::make_entity_key(prefix, 1);
  auto entity_two = leasehold::schema::key::make_entity_key(prefix, 2);

  for (auto seed : std::vector<uint8_t>{0x10, 0x11, 0x12}) {
    fixture.storage().put(
        fixture.encoder(),
        leasehold::schema::key::make_entity_address_key(prefix, 1,
                                                        make_address(seed)),
        true);
  }
  fixture.storage().put(
      fixture.encoder(),
      leasehold::schema::key::make_entity_address_key(prefix, 2,
                                                      make_address(0x40)),
      true);

  auto replacement = std::vector<leasehold::storage::key_value_entry_t>{
      {leasehold::schema::key::make_entity_address_key(prefix, 1,
                                                       make_address(0x50)),
       fixture.encoder().encode(true)}};
  fixture.storage().replace_by_prefix(entity_one, replacement);

  auto entries = fixture.storage().list_by_prefix(entity_one);
  ASSERT_EQ(entries.size(), 1u);
  EXPECT_EQ(leasehold::schema::key::address_from_key(entries[0].first),
            make_address(0x50));
  EXPECT_EQ(fixture.storage().list_by_prefix(entity_two).size(), 1u);
}

TEST(storage, unopened_database_is_a_critical_fault) {
  auto unopened = leasehold::storage::storage<
      leasehold::storage::rocksdb_storage_tag>{};
  auto key = leasehold::schema::key::make_entity_key(
      leasehold::schema::key::kCooldownConfigPrefix, 1);
  EXPECT_DEATH(unopened.erase(key), "");
}
