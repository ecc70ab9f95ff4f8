#pragma once

#include <leasehold/policy/policy_plugin.hpp>
#include <string_view>
#include <vector>

namespace leasehold::policy {

/// Address set per entity stored as one key per member under `prefix`.
/// Shared by the token and destination whitelists.
class whitelist_plugin : public policy_plugin {
 public:
  whitelist_plugin(encoder_t& encoder,
                   storage_t& storage,
                   std::string_view prefix);

  bool renter_configurable() const override { return true; }
  plugin_capabilities capabilities() const override {
    return {.commit_hook = false, .instance_init_hook = true};
  }

  /// Copies the template's members to the instance.
  void initialize_instance(
      leasehold::schema::entity_id_t instance,
      leasehold::schema::entity_id_t template_id) override;

  /// Instance additions must already be members of the ceiling.
  leasehold::schema::operation_result_t add(
      const configuration_scope_t& scope,
      const leasehold::schema::address_t& address);
  leasehold::schema::operation_result_t remove(
      const configuration_scope_t& scope,
      const leasehold::schema::address_t& address);

  bool contains(leasehold::schema::entity_id_t entity_id,
                const leasehold::schema::address_t& address) const;
  std::vector<leasehold::schema::address_t> entries(
      leasehold::schema::entity_id_t entity_id) const;
  bool configured(leasehold::schema::entity_id_t entity_id) const;

 protected:
  std::string codespace() const;

 private:
  encoder_t& encoder_;
  storage_t& storage_;
  std::string_view prefix_;
};

/// Counter-party whitelist: every token touched by a swap path, and the token
/// targeted by a token-level instruction, must be a member.
class token_whitelist final : public whitelist_plugin {
 public:
  token_whitelist(encoder_t& encoder, storage_t& storage);

  leasehold::schema::policy_type_t type() const override {
    return leasehold::schema::policy_type_t::token_whitelist;
  }
  policy_decision_t check(const check_context_t& context) const override;
};

/// Protocol whitelist: every called address other than the entity's own vault
/// must be a member; approval-family spenders must be members too.
class destination_whitelist final : public whitelist_plugin {
 public:
  destination_whitelist(encoder_t& encoder, storage_t& storage);

  leasehold::schema::policy_type_t type() const override {
    return leasehold::schema::policy_type_t::destination_whitelist;
  }
  policy_decision_t check(const check_context_t& context) const override;
};

}  // namespace leasehold::policy
