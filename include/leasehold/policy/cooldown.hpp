#pragma once

#include <leasehold/policy/policy_plugin.hpp>
#include <leasehold/schema/cooldown_config.hpp>
#include <optional>

namespace leasehold::policy {

/// Minimum interval between committed actions of an entity. The first action
/// after binding always passes.
class cooldown final : public policy_plugin {
 public:
  cooldown(encoder_t& encoder, storage_t& storage);

  leasehold::schema::policy_type_t type() const override {
    return leasehold::schema::policy_type_t::cooldown;
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

  /// Instance intervals may not be shorter than the template's.
  leasehold::schema::operation_result_t set_interval(
      const configuration_scope_t& scope,
      leasehold::schema::duration_milliseconds_t minimum_interval);

  std::optional<leasehold::schema::cooldown_config_t> config(
      leasehold::schema::entity_id_t entity_id) const;
  std::optional<leasehold::schema::timestamp_milliseconds_t> last_action(
      leasehold::schema::entity_id_t entity_id) const;

 private:
  encoder_t& encoder_;
  storage_t& storage_;
};

}  // namespace leasehold::policy
