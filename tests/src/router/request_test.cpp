#include <gtest/gtest.h>
#include <leasehold/crypto/recover.hpp>
#include <leasehold/crypto/typed_message.hpp>
#include <leasehold/testing/router_fixture.hpp>
#include <leasehold/testing/signed_request.hpp>
#include <leasehold/testing/signer.hpp>

#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

using namespace leasehold::schema;
using leasehold::testing::kDay;
using leasehold::testing::kHour;
using leasehold::testing::kMinute;
using leasehold::testing::kStart;
using leasehold::testing::make_address;
using leasehold::testing::make_hash;
using leasehold::testing::router_fixture;
using leasehold::testing::sign_request;
using leasehold::testing::test_signer;

namespace {

/// Router whose administrator and lease manager are signing keys.
struct signed_router final {
  explicit signed_router(const std::string_view prefix)
      : fixture{prefix, leasehold::router::router_options{
                            .administrator = admin.address(),
                            .lease_manager = manager.address(),
                            .network_id = make_hash(0x77)}} {}

  operation_result_t submit(const test_signer& signer, router_call_t call) {
    auto request = sign_request(fixture.router(), signer, std::move(call));
    if (!request) {
      return make_error(error_code_t::invalid_argument, "signing failed",
                        "test");
    }
    return fixture.router().submit(request->request, request->signature);
  }

  test_signer admin;
  test_signer manager;
  router_fixture fixture;
};

bool signers_ready(std::initializer_list<const test_signer*> signers) {
  for (const auto* signer : signers) {
    if (!signer->valid()) {
      return false;
    }
  }
  return true;
}

}  // namespace

TEST(signed_request, call_is_applied_as_the_signer) {
  if (!leasehold::crypto::available()) {
    GTEST_SKIP() << "secp256k1 is not available in this OpenSSL build";
  }
  auto owner = test_signer{};
  auto router = signed_router{"lh_request_signer"};
  ASSERT_TRUE(signers_ready({&owner, &router.admin, &router.manager}));

  auto minted = router.submit(owner, mint_entity_t{.owner = owner.address()});
  ASSERT_TRUE(minted.ok()) << minted.log;
  EXPECT_EQ(minted.info, "1");
  EXPECT_EQ(minted.events.back().attributes[1].value,
            to_hex(owner.address()));
  EXPECT_EQ(router.fixture.router().request_nonce(owner.address()), 1u);

  auto paused = router.submit(
      owner, change_status_t{.entity_id = 1,
                             .change = lifecycle_change_t::pause});
  ASSERT_TRUE(paused.ok()) << paused.log;
  EXPECT_EQ(router.fixture.router().entity(1)->status, entity_status_t::paused);
  EXPECT_EQ(router.fixture.router().request_nonce(owner.address()), 2u);
}

TEST(signed_request, authentication_failures_are_distinct) {
  if (!leasehold::crypto::available()) {
    GTEST_SKIP() << "secp256k1 is not available in this OpenSSL build";
  }
  auto owner = test_signer{};
  auto impostor = test_signer{};
  auto router = signed_router{"lh_request_authentication"};
  ASSERT_TRUE(signers_ready({&owner, &impostor}));
  auto& access = router.fixture.router();
  auto call = router_call_t{mint_entity_t{.owner = owner.address()}};

  auto wrong_network = sign_request(access, owner, call);
  ASSERT_TRUE(wrong_network.has_value());
  wrong_network->request.network_id = make_hash(0x78);
  EXPECT_EQ(access.submit(wrong_network->request, wrong_network->signature)
                .code,
            error_code_t::request_network_mismatch);

  // Claiming another signer does not make the request theirs.
  auto claimed = sign_request(access, impostor, call);
  ASSERT_TRUE(claimed.has_value());
  claimed->request.signer = owner.address();
  auto rejected = access.submit(claimed->request, claimed->signature);
  EXPECT_EQ(rejected.code, error_code_t::request_signature_invalid);
  EXPECT_EQ(rejected.codespace, "leasehold.router");

  // The signature covers the call.
  auto tampered = sign_request(access, owner, call);
  ASSERT_TRUE(tampered.has_value());
  tampered->request.call = mint_entity_t{.owner = impostor.address()};
  EXPECT_EQ(access.submit(tampered->request, tampered->signature).code,
            error_code_t::request_signature_invalid);

  auto skipped = sign_request(access, owner, call, 4);
  ASSERT_TRUE(skipped.has_value());
  auto out_of_order = access.submit(skipped->request, skipped->signature);
  EXPECT_EQ(out_of_order.code, error_code_t::request_nonce_mismatch);
  EXPECT_EQ(out_of_order.info, "0");

  EXPECT_EQ(access.request_nonce(owner.address()), 0u);
  EXPECT_FALSE(access.entity(1).has_value());

  auto first = sign_request(access, owner, call);
  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(access.submit(first->request, first->signature).ok());
  auto replay = access.submit(first->request, first->signature);
  EXPECT_EQ(replay.code, error_code_t::request_nonce_mismatch);
  EXPECT_EQ(replay.info, "1");
  EXPECT_FALSE(access.entity(2).has_value());
}

TEST(signed_request, rejected_call_still_consumes_the_nonce) {
  if (!leasehold::crypto::available()) {
    GTEST_SKIP() << "secp256k1 is not available in this OpenSSL build";
  }
  auto owner = test_signer{};
  auto stranger = test_signer{};
  auto router = signed_router{"lh_request_consumed"};
  ASSERT_TRUE(signers_ready({&owner, &stranger}));
  ASSERT_TRUE(
      router.submit(owner, mint_entity_t{.owner = owner.address()}).ok());

  auto denied = router.submit(
      stranger, change_status_t{.entity_id = 1,
                                .change = lifecycle_change_t::terminate});
  EXPECT_EQ(denied.code, error_code_t::authorization_denied);
  EXPECT_EQ(router.fixture.router().request_nonce(stranger.address()), 1u);
  EXPECT_EQ(router.fixture.router().entity(1)->status, entity_status_t::active);
}

TEST(signed_request, every_call_kind_reaches_its_operation) {
  if (!leasehold::crypto::available()) {
    GTEST_SKIP() << "secp256k1 is not available in this OpenSSL build";
  }
  auto owner = test_signer{};
  auto renter = test_signer{};
  auto delegate = test_signer{};
  auto router = signed_router{"lh_request_dispatch"};
  ASSERT_TRUE(signers_ready(
      {&owner, &renter, &delegate, &router.admin, &router.manager}));
  auto& access = router.fixture.router();
  auto expect_ok = [](const operation_result_t& result) {
    EXPECT_TRUE(result.ok()) << result.log;
  };

  // Plugin registry
  for (auto type : {policy_type_t::spend_limit, policy_type_t::token_whitelist,
                    policy_type_t::cooldown,
                    policy_type_t::destination_whitelist}) {
    expect_ok(router.submit(
        router.admin, set_plugin_approval_t{.type = type, .approved = true}));
  }
  expect_ok(router.submit(
      router.admin,
      set_plugin_approval_t{.type = policy_type_t::destination_whitelist,
                            .approved = false}));
  EXPECT_EQ(router
                .submit(owner, set_plugin_approval_t{
                                   .type = policy_type_t::receiver_guard,
                                   .approved = true})
                .code,
            error_code_t::authorization_denied);

  // Plain entity 1 with its policies configured
  expect_ok(router.submit(owner, mint_entity_t{.owner = owner.address()}));
  for (auto type : {policy_type_t::spend_limit, policy_type_t::token_whitelist,
                    policy_type_t::cooldown}) {
    expect_ok(router.submit(
        owner, update_policy_list_t{.entity_id = 1,
                                    .list = policy_list_t::template_list,
                                    .type = type,
                                    .add = true}));
  }
  expect_ok(router.submit(
      owner, update_whitelist_t{.entity_id = 1,
                                .kind = whitelist_kind_t::token,
                                .address = router_fixture::token(),
                                .add = true}));
  expect_ok(router.submit(
      owner, update_whitelist_t{.entity_id = 1,
                                .kind = whitelist_kind_t::destination,
                                .address = router_fixture::dex(),
                                .add = true}));
  expect_ok(router.submit(
      owner, update_whitelist_t{.entity_id = 1,
                                .kind = whitelist_kind_t::destination,
                                .address = router_fixture::dex(),
                                .add = false}));
  expect_ok(router.submit(
      owner,
      set_spend_limits_t{.entity_id = 1,
                         .limits = spend_limit_config_t{
                             .max_per_call = amount_t{10},
                             .max_per_day = amount_t{20},
                             .max_approve = amount_t{5}}}));
  expect_ok(router.submit(
      owner, set_cooldown_t{.entity_id = 1, .minimum_interval = 0}));
  EXPECT_EQ(access.active_policies(1)->size(), 3u);

  // Lease, funds and execution
  expect_ok(router.submit(
      renter, deposit_funds_t{.entity_id = 1, .amount = amount_t{50}}));
  expect_ok(router.submit(owner, assign_lease_t{.entity_id = 1,
                                                .renter = renter.address(),
                                                .expiry = kStart + kDay}));
  expect_ok(router.submit(
      renter, execute_action_t{.entity_id = 1,
                               .action = router_fixture::native_action(
                                   make_address(0x66), amount_t{5})}));
  EXPECT_EQ(access.balance_of(1), amount_t{45});
  EXPECT_EQ(router
                .submit(renter, execute_action_t{
                                    .entity_id = 1,
                                    .action = router_fixture::native_action(
                                        make_address(0x66), amount_t{11})})
                .log,
            "exceeds per-call limit");

  expect_ok(router.submit(
      renter, set_operator_t{.entity_id = 1,
                             .operator_address = delegate.address(),
                             .expiry = kStart + kHour}));
  EXPECT_EQ(access.operator_of(1), delegate.address());
  expect_ok(router.submit(renter, clear_operator_t{.entity_id = 1}));
  EXPECT_FALSE(access.operator_of(1).has_value());

  expect_ok(router.submit(
      owner, extend_lease_t{.entity_id = 1, .expiry = kStart + 2 * kDay}));
  EXPECT_EQ(access.entity(1)->lease_expiry, kStart + 2 * kDay);
  expect_ok(router.submit(
      owner, withdraw_funds_t{.entity_id = 1, .amount = amount_t{5}}));
  EXPECT_EQ(access.balance_of(1), amount_t{40});

  expect_ok(router.submit(
      owner, change_status_t{.entity_id = 1,
                             .change = lifecycle_change_t::pause}));
  expect_ok(router.submit(
      owner, change_status_t{.entity_id = 1,
                             .change = lifecycle_change_t::unpause}));

  // Template 2 and its instance 3
  expect_ok(router.submit(owner, mint_entity_t{.owner = owner.address()}));
  expect_ok(router.submit(
      owner, update_policy_list_t{.entity_id = 2,
                                  .list = policy_list_t::template_list,
                                  .type = policy_type_t::spend_limit,
                                  .add = true}));
  expect_ok(router.submit(owner, register_template_t{.entity_id = 2}));
  auto instance = router.submit(
      router.manager, mint_instance_t{.template_id = 2,
                                      .renter = renter.address(),
                                      .lease_expiry = kStart + kDay,
                                      .init_params = bytes_t{0x01}});
  ASSERT_TRUE(instance.ok()) << instance.log;
  EXPECT_EQ(instance.info, "3");
  expect_ok(router.submit(
      renter, update_policy_list_t{.entity_id = 3,
                                   .list = policy_list_t::instance_list,
                                   .type = policy_type_t::spend_limit,
                                   .add = false}));

  // Permit relayed by the delegate it names
  auto permit = operator_permit_t{.entity_id = 3,
                                  .renter = renter.address(),
                                  .operator_address = delegate.address(),
                                  .expiry = kStart + kHour,
                                  .nonce = 0,
                                  .deadline = kStart + kMinute};
  auto permit_signature = renter.sign(
      leasehold::crypto::signing_message(access.signing_domain(), permit));
  ASSERT_TRUE(permit_signature.has_value());
  expect_ok(router.submit(
      delegate, apply_operator_permit_t{.permit = permit,
                                        .permit_signature = *permit_signature}));
  EXPECT_EQ(access.operator_of(3), delegate.address());

  // Ownership and termination
  expect_ok(router.submit(
      owner, transfer_entity_t{.entity_id = 2, .new_owner = make_address(0x55)}));
  EXPECT_EQ(access.entity(2)->owner, make_address(0x55));
  expect_ok(router.submit(
      owner, change_status_t{.entity_id = 1,
                             .change = lifecycle_change_t::terminate}));
  EXPECT_EQ(access.entity(1)->status, entity_status_t::terminated);
}
