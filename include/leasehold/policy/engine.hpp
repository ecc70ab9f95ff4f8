#pragma once

#include <leasehold/policy/entity_directory.hpp>
#include <leasehold/policy/policy_plugin.hpp>
#include <leasehold/schema/action.hpp>
#include <leasehold/schema/audit_event.hpp>
#include <leasehold/schema/operation_result.hpp>
#include <leasehold/schema/policy_type.hpp>
#include <leasehold/schema/template_state.hpp>
#include <map>
#include <memory>
#include <optional>
#include <vector>

namespace leasehold::policy {

/// Maximum number of plugins in a template or instance policy list.
inline constexpr auto kMaxPoliciesPerEntity = std::size_t{16};

/// Plugin registry and per-entity policy lists.
///
/// The engine owns only registry and binding state (the `LH|ENGINE|`
/// keyspace); each plugin owns its own per-entity state. `bind_instance` and
/// `commit` are reserved to the router address given at construction, and
/// the approval registry to the administrator.
class engine final {
 public:
  engine(encoder_t& encoder,
         storage_t& storage,
         const entity_directory& directory,
         leasehold::schema::address_t administrator,
         leasehold::schema::address_t router);

  /// Make a plugin implementation known to the engine. Capabilities are read
  /// here, once.
  void register_plugin(std::shared_ptr<policy_plugin> plugin);
  std::shared_ptr<policy_plugin> plugin(
      leasehold::schema::policy_type_t type) const;

  leasehold::schema::operation_result_t approve_plugin(
      const leasehold::schema::address_t& caller,
      leasehold::schema::policy_type_t type);
  leasehold::schema::operation_result_t revoke_plugin(
      const leasehold::schema::address_t& caller,
      leasehold::schema::policy_type_t type);
  bool is_approved(leasehold::schema::policy_type_t type) const;

  /// Append to the owner-defined list of a plain entity.
  leasehold::schema::operation_result_t add_template_policy(
      const leasehold::schema::address_t& caller,
      leasehold::schema::entity_id_t entity_id,
      leasehold::schema::policy_type_t type);
  /// Remove by swap-and-truncate; order of the remaining list may change.
  leasehold::schema::operation_result_t remove_template_policy(
      const leasehold::schema::address_t& caller,
      leasehold::schema::entity_id_t entity_id,
      leasehold::schema::policy_type_t type);
  /// Freeze the list and every plugin configuration of the entity.
  leasehold::schema::operation_result_t register_template(
      const leasehold::schema::address_t& caller,
      leasehold::schema::entity_id_t entity_id);

  leasehold::schema::operation_result_t add_instance_policy(
      const leasehold::schema::address_t& caller,
      leasehold::schema::entity_id_t instance,
      leasehold::schema::policy_type_t type);
  leasehold::schema::operation_result_t remove_instance_policy(
      const leasehold::schema::address_t& caller,
      leasehold::schema::entity_id_t instance,
      leasehold::schema::policy_type_t type);

  /// Bind `instance` to a registered template and seed every plugin that
  /// declares the instance_init_hook capability. Once per instance.
  leasehold::schema::operation_result_t bind_instance(
      const leasehold::schema::address_t& caller,
      leasehold::schema::entity_id_t instance,
      leasehold::schema::entity_id_t template_id);

  /// Who may change plugin configuration of `entity_id`, and within which
  /// ceiling. On rejection returns std::nullopt and fills `error`.
  std::optional<configuration_scope_t> authorize_configuration(
      const leasehold::schema::address_t& caller,
      leasehold::schema::entity_id_t entity_id,
      leasehold::schema::policy_type_t type,
      leasehold::schema::operation_result_t& error) const;

  /// Evaluate the active set in order; the first rejection wins. Pure read.
  leasehold::schema::operation_result_t validate(
      leasehold::schema::entity_id_t entity_id,
      const leasehold::schema::address_t& caller,
      const leasehold::schema::action_t& action,
      leasehold::schema::timestamp_milliseconds_t now) const;

  /// Run commit hooks after a successful execution. A throwing plugin is
  /// reported as a policy_commit_failed event and never stops the others.
  leasehold::schema::operation_result_t commit(
      const leasehold::schema::address_t& caller,
      leasehold::schema::entity_id_t entity_id,
      const leasehold::schema::action_t& action,
      leasehold::schema::timestamp_milliseconds_t now);

  std::optional<leasehold::schema::template_state_t> template_state(
      leasehold::schema::entity_id_t entity_id) const;
  std::vector<leasehold::schema::policy_type_t> instance_policies(
      leasehold::schema::entity_id_t instance) const;
  std::optional<leasehold::schema::entity_id_t> binding_of(
      leasehold::schema::entity_id_t instance) const;

  /// Instance list plus the template's owner-only plugins for bound
  /// instances; the owner-defined list for plain entities; std::nullopt when
  /// nothing is bound.
  std::optional<std::vector<leasehold::schema::policy_type_t>>
  active_policies(leasehold::schema::entity_id_t entity_id) const;

 private:
  std::optional<check_context_t> make_context(
      leasehold::schema::entity_id_t entity_id,
      const leasehold::schema::address_t& caller,
      const leasehold::schema::action_t& action,
      leasehold::schema::timestamp_milliseconds_t now) const;

  leasehold::schema::operation_result_t check_owner(
      const leasehold::schema::address_t& caller,
      leasehold::schema::entity_id_t entity_id) const;

  void save_template_state(const leasehold::schema::template_state_t& state);
  void save_instance_policies(
      leasehold::schema::entity_id_t instance,
      const std::vector<leasehold::schema::policy_type_t>& policies);

  encoder_t& encoder_;
  storage_t& storage_;
  const entity_directory& directory_;
  leasehold::schema::address_t administrator_;
  leasehold::schema::address_t router_;
  std::map<leasehold::schema::policy_type_t, std::shared_ptr<policy_plugin>>
      plugins_;
};

}  // namespace leasehold::policy
