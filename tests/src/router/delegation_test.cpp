#include <gtest/gtest.h>
#include <leasehold/crypto/recover.hpp>
#include <leasehold/crypto/typed_message.hpp>
#include <leasehold/testing/router_fixture.hpp>
#include <leasehold/testing/signer.hpp>

using namespace leasehold::schema;
using leasehold::testing::kDay;
using leasehold::testing::kHour;
using leasehold::testing::kMinute;
using leasehold::testing::kStart;
using leasehold::testing::make_address;
using leasehold::testing::router_fixture;

namespace {

address_t owner() {
  return make_address(0x01);
}
address_t operator_address() {
  return make_address(0x03);
}

spend_limit_config_t limits() {
  return spend_limit_config_t{.max_per_call = amount_t{10},
                              .max_per_day = amount_t{100},
                              .max_approve = amount_t{10}};
}

entity_id_t make_rented_entity(router_fixture& fixture,
                               const address_t& renter) {
  fixture.approve_all();
  auto entity_id = fixture.mint(owner());
  fixture.bind_all_policies(owner(), entity_id, limits());
  auto lease =
      fixture.router().assign_lease(owner(), entity_id, renter, kStart + kDay);
  EXPECT_TRUE(lease.ok()) << lease.log;
  return entity_id;
}

action_t vault_swap(router_fixture& fixture, const entity_id_t entity_id) {
  return router_fixture::swap_action(amount_t{1},
                                     fixture.router().entity(entity_id)->vault);
}

operator_permit_t make_permit(const entity_id_t entity_id,
                              const address_t& renter,
                              const uint64_t nonce) {
  return operator_permit_t{.entity_id = entity_id,
                           .renter = renter,
                           .operator_address = operator_address(),
                           .expiry = kStart + kHour,
                           .nonce = nonce,
                           .deadline = kStart + kMinute};
}

signature_t sign_permit(const leasehold::testing::test_signer& signer,
                        router_fixture& fixture,
                        const operator_permit_t& permit) {
  auto signature = signer.sign(leasehold::crypto::signing_message(
      fixture.router().signing_domain(), permit));
  EXPECT_TRUE(signature.has_value());
  return signature.value_or(signature_t{});
}

}  // namespace

TEST(delegation, operator_expires_before_the_lease) {
  auto fixture = router_fixture{"lh_delegation_expiry"};
  auto renter = make_address(0x02);
  auto entity_id = make_rented_entity(fixture, renter);
  auto& router = fixture.router();

  ASSERT_TRUE(
      router.set_operator(renter, entity_id, operator_address(), kStart + kHour)
          .ok());
  EXPECT_EQ(router.operator_of(entity_id), operator_address());
  auto as_operator =
      router.execute(operator_address(), entity_id, vault_swap(fixture, entity_id));
  ASSERT_TRUE(as_operator.ok()) << as_operator.log;
  EXPECT_EQ(as_operator.events.back().attributes[1].value, "operator");

  fixture.advance(61 * kMinute);
  EXPECT_FALSE(router.operator_of(entity_id).has_value());
  EXPECT_EQ(
      router.execute(operator_address(), entity_id, vault_swap(fixture, entity_id))
          .code,
      error_code_t::delegation_expired);
  EXPECT_TRUE(
      router.execute(renter, entity_id, vault_swap(fixture, entity_id)).ok());
}

TEST(delegation, expiry_may_not_outlive_the_lease) {
  auto fixture = router_fixture{"lh_delegation_bound"};
  auto renter = make_address(0x02);
  auto entity_id = make_rented_entity(fixture, renter);
  auto& router = fixture.router();

  EXPECT_EQ(router
                .set_operator(renter, entity_id, operator_address(),
                              kStart + kDay + 1)
                .code,
            error_code_t::delegation_exceeds_lease);
  EXPECT_EQ(
      router.set_operator(renter, entity_id, operator_address(), kStart).code,
      error_code_t::delegation_expired);
  EXPECT_EQ(router
                .set_operator(owner(), entity_id, operator_address(),
                              kStart + kHour)
                .code,
            error_code_t::authorization_denied);
  EXPECT_EQ(
      router.set_operator(renter, entity_id, address_t{}, kStart + kHour).code,
      error_code_t::invalid_argument);
  EXPECT_TRUE(
      router.set_operator(renter, entity_id, operator_address(), kStart + kDay)
          .ok());
}

TEST(delegation, operators_can_never_withdraw) {
  auto fixture = router_fixture{"lh_delegation_withdraw"};
  auto renter = make_address(0x02);
  auto entity_id = make_rented_entity(fixture, renter);
  fixture.fund(entity_id, amount_t{5});
  ASSERT_TRUE(fixture.router()
                  .set_operator(renter, entity_id, operator_address(),
                                kStart + kHour)
                  .ok());
  EXPECT_EQ(
      fixture.router().withdraw(operator_address(), entity_id, amount_t{1}).code,
      error_code_t::authorization_denied);
  EXPECT_EQ(fixture.router().withdraw(renter, entity_id, amount_t{1}).code,
            error_code_t::authorization_denied);
  EXPECT_EQ(fixture.router().balance_of(entity_id), amount_t{5});
}

TEST(delegation, operator_loses_access_when_lease_ends) {
  auto fixture = router_fixture{"lh_delegation_lease_end"};
  auto renter = make_address(0x02);
  auto entity_id = make_rented_entity(fixture, renter);
  ASSERT_TRUE(fixture.router()
                  .set_operator(renter, entity_id, operator_address(),
                                kStart + kDay)
                  .ok());
  fixture.advance(kDay);
  EXPECT_EQ(fixture.router()
                .execute(operator_address(), entity_id,
                         vault_swap(fixture, entity_id))
                .code,
            error_code_t::lease_expired);
}

TEST(delegation, clear_operator_by_renter_or_owner) {
  auto fixture = router_fixture{"lh_delegation_clear"};
  auto renter = make_address(0x02);
  auto entity_id = make_rented_entity(fixture, renter);
  auto& router = fixture.router();
  EXPECT_EQ(router.clear_operator(renter, entity_id).code,
            error_code_t::invalid_argument);
  ASSERT_TRUE(
      router.set_operator(renter, entity_id, operator_address(), kStart + kHour)
          .ok());
  EXPECT_EQ(router.clear_operator(operator_address(), entity_id).code,
            error_code_t::authorization_denied);
  ASSERT_TRUE(router.clear_operator(owner(), entity_id).ok());
  EXPECT_FALSE(router.operator_of(entity_id).has_value());
  EXPECT_EQ(
      router.execute(operator_address(), entity_id, vault_swap(fixture, entity_id))
          .code,
      error_code_t::authorization_denied);
}

TEST(delegation, new_lease_drops_previous_operator) {
  auto fixture = router_fixture{"lh_delegation_new_lease"};
  auto renter = make_address(0x02);
  auto entity_id = make_rented_entity(fixture, renter);
  ASSERT_TRUE(fixture.router()
                  .set_operator(renter, entity_id, operator_address(),
                                kStart + kHour)
                  .ok());
  ASSERT_TRUE(fixture.router()
                  .assign_lease(owner(), entity_id, renter, kStart + 2 * kDay)
                  .ok());
  EXPECT_FALSE(fixture.router().operator_of(entity_id).has_value());
}

TEST(delegation, signed_permit_sets_operator_once) {
  if (!leasehold::crypto::available()) {
    GTEST_SKIP() << "secp256k1 is not available in this OpenSSL build";
  }
  auto signer = leasehold::testing::test_signer{};
  ASSERT_TRUE(signer.valid());
  auto fixture = router_fixture{"lh_delegation_permit"};
  auto entity_id = make_rented_entity(fixture, signer.address());
  auto& router = fixture.router();

  auto permit = make_permit(entity_id, signer.address(), 0);
  auto signature = sign_permit(signer, fixture, permit);
  auto result =
      router.set_operator_with_permit(operator_address(), permit, signature);
  ASSERT_TRUE(result.ok()) << result.log;
  EXPECT_EQ(router.operator_of(entity_id), operator_address());
  EXPECT_EQ(router.operator_nonce(entity_id), 1u);
  EXPECT_EQ(result.events.back().type, audit_event_type_t::operator_set);

  auto replay =
      router.set_operator_with_permit(operator_address(), permit, signature);
  EXPECT_EQ(replay.code, error_code_t::delegation_replayed);

  auto next = make_permit(entity_id, signer.address(), 1);
  EXPECT_TRUE(router
                  .set_operator_with_permit(operator_address(), next,
                                            sign_permit(signer, fixture, next))
                  .ok());
  EXPECT_EQ(router.operator_nonce(entity_id), 2u);
}

TEST(delegation, permit_rejections_are_distinct) {
  if (!leasehold::crypto::available()) {
    GTEST_SKIP() << "secp256k1 is not available in this OpenSSL build";
  }
  auto signer = leasehold::testing::test_signer{};
  auto impostor = leasehold::testing::test_signer{};
  ASSERT_TRUE(signer.valid());
  ASSERT_TRUE(impostor.valid());
  auto fixture = router_fixture{"lh_delegation_permit_errors"};
  auto entity_id = make_rented_entity(fixture, signer.address());
  auto& router = fixture.router();
  auto permit = make_permit(entity_id, signer.address(), 0);
  auto signature = sign_permit(signer, fixture, permit);

  EXPECT_EQ(router.set_operator_with_permit(make_address(0x66), permit,
                                            signature)
                .code,
            error_code_t::delegation_submitter_mismatch);
  EXPECT_EQ(router
                .set_operator_with_permit(operator_address(), permit,
                                          sign_permit(impostor, fixture, permit))
                .code,
            error_code_t::delegation_signature_invalid);

  auto tampered = permit;
  tampered.expiry = kStart + kDay;
  EXPECT_EQ(router.set_operator_with_permit(operator_address(), tampered,
                                            signature)
                .code,
            error_code_t::delegation_signature_invalid);

  auto skipped = make_permit(entity_id, signer.address(), 5);
  EXPECT_EQ(router
                .set_operator_with_permit(operator_address(), skipped,
                                          sign_permit(signer, fixture, skipped))
                .code,
            error_code_t::delegation_replayed);

  auto too_long = permit;
  too_long.expiry = kStart + 2 * kDay;
  EXPECT_EQ(router
                .set_operator_with_permit(operator_address(), too_long,
                                          sign_permit(signer, fixture, too_long))
                .code,
            error_code_t::delegation_exceeds_lease);

  fixture.advance(kMinute + 1);
  EXPECT_EQ(router.set_operator_with_permit(operator_address(), permit,
                                            signature)
                .code,
            error_code_t::permit_deadline_passed);
  EXPECT_EQ(router.operator_nonce(entity_id), 0u);
}

TEST(delegation, permit_is_bound_to_its_signing_domain) {
  auto permit = make_permit(1, make_address(0x02), 0);
  auto domain = leasehold::crypto::signing_domain{
      .network_id = leasehold::testing::make_hash(0x77),
      .verifying_component = make_address(0xC0)};
  auto other_network = domain;
  other_network.network_id = leasehold::testing::make_hash(0x78);
  auto other_router = domain;
  other_router.verifying_component = make_address(0xC1);

  auto message = leasehold::crypto::signing_message(domain, permit);
  ASSERT_EQ(message.size(), 66u);
  EXPECT_EQ(message[0], 0x19);
  EXPECT_EQ(message[1], 0x01);
  EXPECT_NE(message, leasehold::crypto::signing_message(other_network, permit));
  EXPECT_NE(message, leasehold::crypto::signing_message(other_router, permit));

  auto renewed = permit;
  renewed.nonce = 1;
  EXPECT_NE(leasehold::crypto::struct_hash(permit),
            leasehold::crypto::struct_hash(renewed));
}
