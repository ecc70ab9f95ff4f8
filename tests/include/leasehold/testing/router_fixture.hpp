#pragma once

#include <leasehold/router/access_router.hpp>
#include <leasehold/schema/policy_type.hpp>
#include <leasehold/testing/common.hpp>
#include <leasehold/tools/payload_builder.hpp>
#include <leasehold/vault/call_executor.hpp>

#include <gtest/gtest.h>

#include <array>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace leasehold::testing {

inline constexpr auto kStart =
    leasehold::schema::timestamp_milliseconds_t{1'700'000'000'000};
inline constexpr auto kMinute = leasehold::schema::duration_milliseconds_t{
    60'000};
inline constexpr auto kHour =
    leasehold::schema::duration_milliseconds_t{3'600'000};
inline constexpr auto kDay = leasehold::schema::kMillisecondsPerDay;

inline constexpr auto kAllPolicies = std::array{
    leasehold::schema::policy_type_t::token_whitelist,
    leasehold::schema::policy_type_t::destination_whitelist,
    leasehold::schema::policy_type_t::spend_limit,
    leasehold::schema::policy_type_t::cooldown,
    leasehold::schema::policy_type_t::receiver_guard};

/// Call executor that records every forwarded call and can be told to fail.
class recording_executor final : public leasehold::vault::call_executor {
 public:
  leasehold::vault::call_result execute(
      const leasehold::schema::address_t& from,
      const leasehold::schema::action_t& action) override {
    calls.push_back(leasehold::vault::journal_entry{
        .sequence = calls.size() + 1, .from = from, .action = action});
    if (fail) {
      return leasehold::vault::call_result{.success = false,
                                           .reason = reason};
    }
    return leasehold::vault::call_result{.success = true};
  }

  bool fail{};
  std::string reason{"execution reverted"};
  std::vector<leasehold::vault::journal_entry> calls;
};

/// Access router over a temporary database with a manual clock.
class router_fixture final {
 public:
  explicit router_fixture(const std::string_view db_prefix)
      : router_fixture{db_prefix,
                       leasehold::router::router_options{
                           .administrator = admin(),
                           .lease_manager = lease_manager(),
                           .network_id = make_hash(0x77)}} {}

  router_fixture(const std::string_view db_prefix,
                 leasehold::router::router_options options)
      : storage_{db_prefix},
        now_{kStart},
        router_{storage_.encoder(), storage_.storage(), executor_,
                std::move(options), [this] { return now_; }} {}

  router_fixture(const router_fixture&) = delete;
  router_fixture& operator=(const router_fixture&) = delete;
  router_fixture(router_fixture&&) = delete;
  router_fixture& operator=(router_fixture&&) = delete;

  static leasehold::schema::address_t admin() { return make_address(0xA0); }
  static leasehold::schema::address_t lease_manager() {
    return make_address(0xB0);
  }
  static leasehold::schema::address_t token() { return make_address(0x70); }
  static leasehold::schema::address_t other_token() {
    return make_address(0x74);
  }
  static leasehold::schema::address_t dex() { return make_address(0x80); }

  leasehold::router::access_router& router() { return router_; }
  recording_executor& executor() { return executor_; }
  storage_fixture& store() { return storage_; }
  leasehold::schema::timestamp_milliseconds_t now() const { return now_; }
  void advance(const leasehold::schema::duration_milliseconds_t duration) {
    now_ += duration;
  }

  void approve_all() {
    for (const auto type : kAllPolicies) {
      ASSERT_TRUE(router_.approve_plugin(admin(), type).ok());
    }
  }

  leasehold::schema::entity_id_t mint(const leasehold::schema::address_t& owner) {
    auto result = router_.mint_entity(owner, owner);
    EXPECT_TRUE(result.ok()) << result.log;
    return static_cast<leasehold::schema::entity_id_t>(std::stoull(result.info));
  }

  /// Mint an entity and give it `policies`; it is not registered.
  leasehold::schema::entity_id_t make_policy_entity(
      const leasehold::schema::address_t& owner,
      const std::vector<leasehold::schema::policy_type_t>& policies) {
    auto entity_id = mint(owner);
    for (const auto type : policies) {
      auto result = router_.add_template_policy(owner, entity_id, type);
      EXPECT_TRUE(result.ok()) << result.log;
    }
    return entity_id;
  }

  leasehold::schema::entity_id_t mint_instance(
      const leasehold::schema::entity_id_t template_id,
      const leasehold::schema::address_t& renter,
      const leasehold::schema::timestamp_milliseconds_t lease_expiry) {
    auto params = leasehold::schema::bytes_t{0x01, 0x02};
    auto result = router_.mint_instance(
        lease_manager(), template_id, renter, lease_expiry,
        leasehold::schema::bytes_view_t{params.data(), params.size()});
    EXPECT_TRUE(result.ok()) << result.log;
    return static_cast<leasehold::schema::entity_id_t>(std::stoull(result.info));
  }

  void fund(const leasehold::schema::entity_id_t entity_id,
            const leasehold::schema::amount_t& amount) {
    auto result = router_.deposit(make_address(0xD0), entity_id, amount);
    ASSERT_TRUE(result.ok()) << result.log;
  }

  /// Token transfer from the vault to `to`.
  static leasehold::schema::action_t transfer_action(
      const leasehold::schema::address_t& to,
      const leasehold::schema::amount_t& amount) {
    return leasehold::schema::action_t{
        .destination = token(),
        .payload = leasehold::tools::encode_transfer(to, amount)};
  }

  /// Exact-input swap of token() into other_token() on dex().
  static leasehold::schema::action_t swap_action(
      const leasehold::schema::amount_t& amount_in,
      const leasehold::schema::address_t& recipient) {
    return leasehold::schema::action_t{
        .destination = dex(),
        .payload = leasehold::tools::encode_swap_exact_tokens_for_tokens(
            amount_in, leasehold::schema::amount_t{1}, {token(), other_token()},
            recipient, 0)};
  }

  /// Approve `spender` on token().
  static leasehold::schema::action_t approve_action(
      const leasehold::schema::address_t& spender,
      const leasehold::schema::amount_t& amount) {
    return leasehold::schema::action_t{
        .destination = token(),
        .payload = leasehold::tools::encode_approve(spender, amount)};
  }

  /// Put every policy on a plain entity: token() and other_token() as
  /// tokens, token() and dex() as destinations, the given spend limits and a
  /// cooldown of `interval`.
  void bind_all_policies(
      const leasehold::schema::address_t& owner,
      const leasehold::schema::entity_id_t entity_id,
      const leasehold::schema::spend_limit_config_t& limits,
      const leasehold::schema::duration_milliseconds_t interval = 0) {
    for (const auto type : kAllPolicies) {
      auto added = router_.add_template_policy(owner, entity_id, type);
      ASSERT_TRUE(added.ok()) << added.log;
    }
    ASSERT_TRUE(router_.add_whitelisted_token(owner, entity_id, token()).ok());
    ASSERT_TRUE(
        router_.add_whitelisted_token(owner, entity_id, other_token()).ok());
    ASSERT_TRUE(
        router_.add_whitelisted_destination(owner, entity_id, token()).ok());
    ASSERT_TRUE(
        router_.add_whitelisted_destination(owner, entity_id, dex()).ok());
    ASSERT_TRUE(router_.set_spend_limits(owner, entity_id, limits).ok());
    ASSERT_TRUE(router_.set_cooldown(owner, entity_id, interval).ok());
  }

  /// Native value transfer with no payload.
  static leasehold::schema::action_t native_action(
      const leasehold::schema::address_t& to,
      const leasehold::schema::amount_t& value) {
    return leasehold::schema::action_t{.destination = to, .value = value};
  }

 private:
  storage_fixture storage_;
  recording_executor executor_;
  leasehold::schema::timestamp_milliseconds_t now_;
  leasehold::router::access_router router_;
};

}  // namespace leasehold::testing
