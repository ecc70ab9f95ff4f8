#pragma once

#include <leasehold/crypto/typed_message.hpp>
#include <leasehold/policy/cooldown.hpp>
#include <leasehold/policy/engine.hpp>
#include <leasehold/policy/entity_directory.hpp>
#include <leasehold/policy/receiver_guard.hpp>
#include <leasehold/policy/spend_limit.hpp>
#include <leasehold/policy/whitelist_plugin.hpp>
#include <leasehold/schema/action.hpp>
#include <leasehold/schema/audit_event.hpp>
#include <leasehold/schema/entity_state.hpp>
#include <leasehold/schema/operation_result.hpp>
#include <leasehold/schema/operator_permit.hpp>
#include <leasehold/schema/primitives.hpp>
#include <leasehold/schema/router_request.hpp>
#include <leasehold/vault/call_executor.hpp>
#include <leasehold/vault/vault.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace leasehold::router {

using clock_function_t = std::function<leasehold::schema::timestamp_milliseconds_t()>;

/// Wall clock in milliseconds since the epoch.
leasehold::schema::timestamp_milliseconds_t system_clock_now();

/// Address the router uses when calling the engine and the vault, and the
/// verifying component of its signing domain.
leasehold::schema::address_t default_router_address();

struct router_options final {
  leasehold::schema::address_t administrator{};
  /// Marketplace component allowed to assign leases and mint instances.
  leasehold::schema::address_t lease_manager{};
  leasehold::schema::hash32_t network_id{};
  leasehold::schema::address_t self{default_router_address()};
};

enum class caller_role_t : uint8_t {
  none = 0,
  plain_owner = 1,
  instance_owner = 2,
  renter = 3,
  delegated_operator = 4,
};

inline constexpr std::string_view to_string(const caller_role_t role) {
  switch (role) {
    case caller_role_t::plain_owner:
      return "owner";
    case caller_role_t::instance_owner:
      return "instance_owner";
    case caller_role_t::renter:
      return "renter";
    case caller_role_t::delegated_operator:
      return "operator";
    case caller_role_t::none:
      break;
  }
  return "none";
}

/// Public entrypoint. Resolves the caller's role against lease and operator
/// state, runs the policy engine when the role requires it, forwards to the
/// vault and commits policy state.
///
/// Every public operation holds one mutex, so operations are applied serially
/// and each observes the fully committed state of the previous one. Lease and
/// operator expiry are evaluated lazily against the injected clock.
///
/// Hosts reach the router through `submit`, which authenticates a signed
/// request and applies its call as the recovered signer. The per-operation
/// methods take an already authenticated caller.
class access_router final : public leasehold::policy::entity_directory {
 public:
  access_router(leasehold::policy::encoder_t& encoder,
                leasehold::policy::storage_t& storage,
                leasehold::vault::call_executor& executor,
                router_options options,
                clock_function_t clock = system_clock_now);

  /// Authenticate `request` against `signature` and apply its call with the
  /// signer as caller. The request must name this router's network, recover
  /// to its signer over the domain-separated request message and carry the
  /// signer's next request nonce. An authenticated request consumes its nonce
  /// whatever the outcome of the call.
  leasehold::schema::operation_result_t submit(
      const leasehold::schema::router_request_t& request,
      const leasehold::schema::signature_t& signature);

  // Entity lifecycle
  leasehold::schema::operation_result_t mint_entity(
      const leasehold::schema::address_t& caller,
      const leasehold::schema::address_t& owner);
  /// Clears renter and operator immediately.
  leasehold::schema::operation_result_t transfer_entity(
      const leasehold::schema::address_t& caller,
      leasehold::schema::entity_id_t entity_id,
      const leasehold::schema::address_t& new_owner);
  leasehold::schema::operation_result_t pause(
      const leasehold::schema::address_t& caller,
      leasehold::schema::entity_id_t entity_id);
  leasehold::schema::operation_result_t unpause(
      const leasehold::schema::address_t& caller,
      leasehold::schema::entity_id_t entity_id);
  /// Irreversible.
  leasehold::schema::operation_result_t terminate(
      const leasehold::schema::address_t& caller,
      leasehold::schema::entity_id_t entity_id);

  // Leases and delegation
  leasehold::schema::operation_result_t assign_lease(
      const leasehold::schema::address_t& caller,
      leasehold::schema::entity_id_t entity_id,
      const leasehold::schema::address_t& renter,
      leasehold::schema::timestamp_milliseconds_t expiry);
  leasehold::schema::operation_result_t extend_lease(
      const leasehold::schema::address_t& caller,
      leasehold::schema::entity_id_t entity_id,
      leasehold::schema::timestamp_milliseconds_t expiry);
  leasehold::schema::operation_result_t set_operator(
      const leasehold::schema::address_t& caller,
      leasehold::schema::entity_id_t entity_id,
      const leasehold::schema::address_t& operator_address,
      leasehold::schema::timestamp_milliseconds_t expiry);
  /// `submitter` must be the permit's operator; the signature must recover to
  /// the permit's renter and the permit nonce must equal the entity's next
  /// nonce.
  leasehold::schema::operation_result_t set_operator_with_permit(
      const leasehold::schema::address_t& submitter,
      const leasehold::schema::operator_permit_t& permit,
      const leasehold::schema::signature_t& signature);
  leasehold::schema::operation_result_t clear_operator(
      const leasehold::schema::address_t& caller,
      leasehold::schema::entity_id_t entity_id);

  // Templates and instances
  leasehold::schema::operation_result_t register_template(
      const leasehold::schema::address_t& caller,
      leasehold::schema::entity_id_t entity_id);
  /// Mint an instance of a registered template owned and leased by `renter`.
  /// The instance is bound and its plugins seeded before it is persisted.
  leasehold::schema::operation_result_t mint_instance(
      const leasehold::schema::address_t& caller,
      leasehold::schema::entity_id_t template_id,
      const leasehold::schema::address_t& renter,
      leasehold::schema::timestamp_milliseconds_t lease_expiry,
      const leasehold::schema::bytes_view_t& init_params);

  // Funds
  leasehold::schema::operation_result_t deposit(
      const leasehold::schema::address_t& caller,
      leasehold::schema::entity_id_t entity_id,
      const leasehold::schema::amount_t& amount);
  /// Owner only; pays the owner-of-record.
  leasehold::schema::operation_result_t withdraw(
      const leasehold::schema::address_t& caller,
      leasehold::schema::entity_id_t entity_id,
      const leasehold::schema::amount_t& amount);
  leasehold::schema::operation_result_t execute(
      const leasehold::schema::address_t& caller,
      leasehold::schema::entity_id_t entity_id,
      const leasehold::schema::action_t& action);

  // Policy configuration
  leasehold::schema::operation_result_t approve_plugin(
      const leasehold::schema::address_t& caller,
      leasehold::schema::policy_type_t type);
  leasehold::schema::operation_result_t revoke_plugin(
      const leasehold::schema::address_t& caller,
      leasehold::schema::policy_type_t type);
  leasehold::schema::operation_result_t add_template_policy(
      const leasehold::schema::address_t& caller,
      leasehold::schema::entity_id_t entity_id,
      leasehold::schema::policy_type_t type);
  leasehold::schema::operation_result_t remove_template_policy(
      const leasehold::schema::address_t& caller,
      leasehold::schema::entity_id_t entity_id,
      leasehold::schema::policy_type_t type);
  leasehold::schema::operation_result_t add_instance_policy(
      const leasehold::schema::address_t& caller,
      leasehold::schema::entity_id_t entity_id,
      leasehold::schema::policy_type_t type);
  leasehold::schema::operation_result_t remove_instance_policy(
      const leasehold::schema::address_t& caller,
      leasehold::schema::entity_id_t entity_id,
      leasehold::schema::policy_type_t type);
  leasehold::schema::operation_result_t add_whitelisted_token(
      const leasehold::schema::address_t& caller,
      leasehold::schema::entity_id_t entity_id,
      const leasehold::schema::address_t& token);
  leasehold::schema::operation_result_t remove_whitelisted_token(
      const leasehold::schema::address_t& caller,
      leasehold::schema::entity_id_t entity_id,
      const leasehold::schema::address_t& token);
  leasehold::schema::operation_result_t add_whitelisted_destination(
      const leasehold::schema::address_t& caller,
      leasehold::schema::entity_id_t entity_id,
      const leasehold::schema::address_t& destination);
  leasehold::schema::operation_result_t remove_whitelisted_destination(
      const leasehold::schema::address_t& caller,
      leasehold::schema::entity_id_t entity_id,
      const leasehold::schema::address_t& destination);
  leasehold::schema::operation_result_t set_spend_limits(
      const leasehold::schema::address_t& caller,
      leasehold::schema::entity_id_t entity_id,
      const leasehold::schema::spend_limit_config_t& limits);
  leasehold::schema::operation_result_t set_cooldown(
      const leasehold::schema::address_t& caller,
      leasehold::schema::entity_id_t entity_id,
      leasehold::schema::duration_milliseconds_t minimum_interval);

  // Queries
  std::optional<leasehold::schema::entity_state_t> entity(
      leasehold::schema::entity_id_t entity_id) const;
  std::optional<leasehold::schema::address_t> renter_of(
      leasehold::schema::entity_id_t entity_id) const;
  std::optional<leasehold::schema::address_t> operator_of(
      leasehold::schema::entity_id_t entity_id) const;
  uint64_t operator_nonce(leasehold::schema::entity_id_t entity_id) const;
  /// Nonce the next request of `signer` must carry.
  uint64_t request_nonce(const leasehold::schema::address_t& signer) const;
  leasehold::schema::amount_t balance_of(
      leasehold::schema::entity_id_t entity_id) const;
  /// Persisted audit events with id >= `from_event_id`, at most `limit`.
  std::vector<leasehold::schema::audit_event_t> events(uint64_t from_event_id,
                                                       std::size_t limit) const;
  std::optional<std::vector<leasehold::schema::policy_type_t>>
  active_policies(leasehold::schema::entity_id_t entity_id) const;
  const leasehold::crypto::signing_domain& signing_domain() const;
  const leasehold::policy::engine& policy_engine() const;

  // entity_directory; callers inside the router already hold the mutex.
  std::optional<leasehold::schema::address_t> owner_of(
      leasehold::schema::entity_id_t entity_id) const override;
  std::optional<leasehold::schema::address_t> active_renter_of(
      leasehold::schema::entity_id_t entity_id) const override;
  std::optional<leasehold::schema::address_t> vault_of(
      leasehold::schema::entity_id_t entity_id) const override;
  std::optional<leasehold::schema::entity_id_t> template_of(
      leasehold::schema::entity_id_t entity_id) const override;

 private:
  std::optional<leasehold::schema::entity_state_t> load(
      leasehold::schema::entity_id_t entity_id) const;
  void save(const leasehold::schema::entity_state_t& state);
  leasehold::schema::entity_id_t next_entity_id() const;

  /// Assign a sequence id, persist and append to `result.events`.
  void record(leasehold::schema::operation_result_t& result,
              leasehold::schema::audit_event_type_t type,
              leasehold::schema::entity_id_t entity_id,
              std::vector<leasehold::schema::audit_event_attribute_t>
                  attributes = {});

  /// Role of `caller` for execution, or an error result when the caller may
  /// not act at all.
  caller_role_t resolve_role(const leasehold::schema::entity_state_t& state,
                             const leasehold::schema::address_t& caller,
                             leasehold::schema::operation_result_t& error) const;

  /// Shared tail of set_operator and set_operator_with_permit.
  leasehold::schema::operation_result_t apply_operator(
      leasehold::schema::entity_state_t& state,
      const leasehold::schema::address_t& renter,
      const leasehold::schema::address_t& operator_address,
      leasehold::schema::timestamp_milliseconds_t expiry);

  /// Configuration gate shared by every plugin configuration operation.
  template <typename Apply>
  leasehold::schema::operation_result_t configure(
      const leasehold::schema::address_t& caller,
      leasehold::schema::entity_id_t entity_id,
      leasehold::schema::policy_type_t type,
      Apply&& apply);

  bool lease_active(const leasehold::schema::entity_state_t& state) const;

  leasehold::schema::operation_result_t authenticate(
      const leasehold::schema::router_request_t& request,
      const leasehold::schema::signature_t& signature);
  leasehold::schema::operation_result_t dispatch(
      const leasehold::schema::address_t& caller,
      const leasehold::schema::router_call_t& call);

  // Recursive so that submit can hold it across the operation it applies.
  mutable std::recursive_mutex mutex_;
  leasehold::policy::encoder_t& encoder_;
  leasehold::policy::storage_t& storage_;
  router_options options_;
  clock_function_t clock_;
  leasehold::crypto::signing_domain domain_;
  leasehold::vault::vault vault_;
  std::shared_ptr<leasehold::policy::token_whitelist> token_whitelist_;
  std::shared_ptr<leasehold::policy::destination_whitelist>
      destination_whitelist_;
  std::shared_ptr<leasehold::policy::spend_limit> spend_limit_;
  std::shared_ptr<leasehold::policy::cooldown> cooldown_;
  std::shared_ptr<leasehold::policy::receiver_guard> receiver_guard_;
  leasehold::policy::engine engine_;
};

}  // namespace leasehold::router
