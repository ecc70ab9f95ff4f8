#pragma once

#include <leasehold/policy/policy_plugin.hpp>
#include <leasehold/schema/spend_limit_config.hpp>
#include <leasehold/schema/spend_window_state.hpp>
#include <optional>

namespace leasehold::policy {

/// Per-call and rolling 24h caps on outgoing value.
///
/// The spend of an action is the decoded token amount for transfers and
/// token-input swaps (the maximum input for exact-output swaps) and the
/// native value otherwise. Approvals are bounded by `max_approve` instead and
/// never count against the daily window. Allowance increases, permits,
/// unknown and malformed instructions are always rejected.
class spend_limit final : public policy_plugin {
 public:
  spend_limit(encoder_t& encoder, storage_t& storage);

  leasehold::schema::policy_type_t type() const override {
    return leasehold::schema::policy_type_t::spend_limit;
  }
  bool renter_configurable() const override { return true; }
  plugin_capabilities capabilities() const override {
    return {.commit_hook = true, .instance_init_hook = true};
  }

  policy_decision_t check(const check_context_t& context) const override;
  void commit(const check_context_t& context) override;
  void initialize_instance(
      leasehold::schema::entity_id_t instance,
      leasehold::schema::entity_id_t template_id) override;

  /// Instance limits may not exceed the template's.
  leasehold::schema::operation_result_t set_limits(
      const configuration_scope_t& scope,
      const leasehold::schema::spend_limit_config_t& limits);

  std::optional<leasehold::schema::spend_limit_config_t> limits(
      leasehold::schema::entity_id_t entity_id) const;
  std::optional<leasehold::schema::spend_window_state_t> window(
      leasehold::schema::entity_id_t entity_id) const;

 private:
  encoder_t& encoder_;
  storage_t& storage_;
};

/// Amount counted against the caps, or std::nullopt for instructions that do
/// not spend (approvals, decreases).
std::optional<leasehold::schema::amount_t> spend_of(
    const check_context_t& context);

}  // namespace leasehold::policy
