#include <spdlog/spdlog.h>
#include <leasehold/policy/engine.hpp>
#include <leasehold/schema/key/state_keys.hpp>
#include <algorithm>
#include <iterator>
#include <string>
#include <utility>

using namespace leasehold::schema;

namespace {

constexpr auto kCodespace = "leasehold.policy.engine";

bool contains(const std::vector<policy_type_t>& policies,
              const policy_type_t type) {
  return std::find(std::begin(policies), std::end(policies), type) !=
         std::end(policies);
}

/// Swap-and-truncate removal. Returns false when `type` is not present.
bool swap_remove(std::vector<policy_type_t>& policies,
                 const policy_type_t type) {
  auto it = std::find(std::begin(policies), std::end(policies), type);
  if (it == std::end(policies)) {
    return false;
  }
  *it = policies.back();
  policies.pop_back();
  return true;
}

std::string plugin_codespace(const policy_type_t type) {
  return "leasehold.policy." + std::string{to_string(type)};
}

}  // namespace

namespace leasehold::policy {

engine::engine(encoder_t& encoder,
               storage_t& storage,
               const entity_directory& directory,
               address_t administrator,
               address_t router)
    : encoder_{encoder},
      storage_{storage},
      directory_{directory},
      administrator_{administrator},
      router_{router} {
  spdlog::info("Policy engine ready; administrator {} router {}",
               to_hex(administrator_), to_hex(router_));
}

void engine::register_plugin(std::shared_ptr<policy_plugin> plugin) {
  if (!plugin) {
    return;
  }
  auto capabilities = plugin->capabilities();
  spdlog::info("Registered policy plugin '{}' (renter configurable: {}, "
               "commit hook: {}, instance init hook: {})",
               to_string(plugin->type()), plugin->renter_configurable(),
               capabilities.commit_hook, capabilities.instance_init_hook);
  plugins_[plugin->type()] = std::move(plugin);
}

std::shared_ptr<policy_plugin> engine::plugin(const policy_type_t type) const {
  auto it = plugins_.find(type);
  if (it == std::end(plugins_)) {
    return nullptr;
  }
  return it->second;
}

operation_result_t engine::approve_plugin(const address_t& caller,
                                          const policy_type_t type) {
  if (caller != administrator_) {
    return make_error(error_code_t::authorization_denied,
                      "only the administrator may approve plugins",
                      kCodespace);
  }
  if (!plugin(type)) {
    return make_error(error_code_t::plugin_missing,
                      "plugin is not registered", kCodespace);
  }
  storage_.put(encoder_, key::make_plugin_key(type), true);
  spdlog::info("Approved policy plugin '{}'", to_string(type));
  return {};
}

operation_result_t engine::revoke_plugin(const address_t& caller,
                                         const policy_type_t type) {
  if (caller != administrator_) {
    return make_error(error_code_t::authorization_denied,
                      "only the administrator may revoke plugins", kCodespace);
  }
  if (!is_approved(type)) {
    return make_error(error_code_t::plugin_not_approved,
                      "plugin is not approved", kCodespace);
  }
  storage_.erase(key::make_plugin_key(type));
  spdlog::info("Revoked policy plugin '{}'", to_string(type));
  return {};
}

bool engine::is_approved(const policy_type_t type) const {
  return storage_.get<bool>(encoder_, key::make_plugin_key(type))
      .value_or(false);
}

operation_result_t engine::check_owner(const address_t& caller,
                                       const entity_id_t entity_id) const {
  auto owner = directory_.owner_of(entity_id);
  if (!owner) {
    return make_error(error_code_t::entity_missing, "entity not found",
                      kCodespace);
  }
  if (*owner != caller) {
    return make_error(error_code_t::authorization_denied,
                      "caller is not the entity owner", kCodespace);
  }
  return {};
}

operation_result_t engine::add_template_policy(const address_t& caller,
                                               const entity_id_t entity_id,
                                               const policy_type_t type) {
  if (auto result = check_owner(caller, entity_id); !result.ok()) {
    return result;
  }
  if (directory_.template_of(entity_id)) {
    return make_error(error_code_t::invalid_argument,
                      "instances use instance policies", kCodespace);
  }
  if (!plugin(type)) {
    return make_error(error_code_t::plugin_missing,
                      "plugin is not registered", kCodespace);
  }
  if (!is_approved(type)) {
    return make_error(error_code_t::plugin_not_approved,
                      "plugin is not approved", kCodespace);
  }
  auto state = template_state(entity_id).value_or(
      template_state_t{.entity_id = entity_id});
  if (state.frozen) {
    return make_error(error_code_t::template_frozen,
                      "template is registered", kCodespace);
  }
  if (contains(state.policies, type)) {
    return make_error(error_code_t::plugin_duplicate,
                      "plugin already in policy list", kCodespace);
  }
  if (state.policies.size() >= kMaxPoliciesPerEntity) {
    return make_error(error_code_t::plugin_cap_exceeded,
                      "policy list is full", kCodespace);
  }
  state.policies.push_back(type);
  save_template_state(state);
  spdlog::info("Entity {} added template policy '{}'", entity_id,
               to_string(type));
  return {};
}

operation_result_t engine::remove_template_policy(const address_t& caller,
                                                  const entity_id_t entity_id,
                                                  const policy_type_t type) {
  if (auto result = check_owner(caller, entity_id); !result.ok()) {
    return result;
  }
  auto state = template_state(entity_id);
  if (state && state->frozen) {
    return make_error(error_code_t::template_frozen,
                      "template is registered", kCodespace);
  }
  if (!state || !swap_remove(state->policies, type)) {
    return make_error(error_code_t::plugin_missing,
                      "plugin not in policy list", kCodespace);
  }
  save_template_state(*state);
  spdlog::info("Entity {} removed template policy '{}'", entity_id,
               to_string(type));
  return {};
}

operation_result_t engine::register_template(const address_t& caller,
                                             const entity_id_t entity_id) {
  if (auto result = check_owner(caller, entity_id); !result.ok()) {
    return result;
  }
  if (directory_.template_of(entity_id)) {
    return make_error(error_code_t::invalid_argument,
                      "an instance cannot be registered as a template",
                      kCodespace);
  }
  auto state = template_state(entity_id);
  if (!state || state->policies.empty()) {
    return make_error(error_code_t::template_empty,
                      "template has no policies", kCodespace);
  }
  if (state->frozen) {
    return make_error(error_code_t::template_frozen,
                      "template is already registered", kCodespace);
  }
  state->frozen = true;
  save_template_state(*state);
  spdlog::info("Entity {} registered as template with {} policies", entity_id,
               state->policies.size());
  return {};
}

operation_result_t engine::add_instance_policy(const address_t& caller,
                                               const entity_id_t instance,
                                               const policy_type_t type) {
  auto template_id = binding_of(instance);
  if (!template_id) {
    return make_error(error_code_t::binding_missing, "instance is not bound",
                      kCodespace);
  }
  if (directory_.owner_of(instance) != caller &&
      directory_.active_renter_of(instance) != caller) {
    return make_error(error_code_t::authorization_denied,
                      "caller is neither owner nor renter", kCodespace);
  }
  auto ceiling = template_state(*template_id);
  if (!ceiling || !contains(ceiling->policies, type)) {
    return make_error(error_code_t::ceiling_violation,
                      "plugin not in template policy list", kCodespace);
  }
  if (!is_approved(type)) {
    return make_error(error_code_t::plugin_not_approved,
                      "plugin is not approved", kCodespace);
  }
  auto policies = instance_policies(instance);
  if (contains(policies, type)) {
    return make_error(error_code_t::plugin_duplicate,
                      "plugin already in policy list", kCodespace);
  }
  if (policies.size() >= kMaxPoliciesPerEntity) {
    return make_error(error_code_t::plugin_cap_exceeded,
                      "policy list is full", kCodespace);
  }
  policies.push_back(type);
  save_instance_policies(instance, policies);
  spdlog::info("Instance {} added policy '{}'", instance, to_string(type));
  return {};
}

operation_result_t engine::remove_instance_policy(const address_t& caller,
                                                  const entity_id_t instance,
                                                  const policy_type_t type) {
  if (!binding_of(instance)) {
    return make_error(error_code_t::binding_missing, "instance is not bound",
                      kCodespace);
  }
  if (directory_.owner_of(instance) != caller &&
      directory_.active_renter_of(instance) != caller) {
    return make_error(error_code_t::authorization_denied,
                      "caller is neither owner nor renter", kCodespace);
  }
  if (auto implementation = plugin(type);
      implementation && !implementation->renter_configurable()) {
    return make_error(error_code_t::plugin_not_removable,
                      "owner-only plugin cannot be removed", kCodespace);
  }
  auto policies = instance_policies(instance);
  if (!swap_remove(policies, type)) {
    return make_error(error_code_t::plugin_missing,
                      "plugin not in policy list", kCodespace);
  }
  save_instance_policies(instance, policies);
  spdlog::info("Instance {} removed policy '{}'", instance, to_string(type));
  return {};
}

operation_result_t engine::bind_instance(const address_t& caller,
                                         const entity_id_t instance,
                                         const entity_id_t template_id) {
  if (caller != router_) {
    return make_error(error_code_t::authorization_denied,
                      "only the router may bind instances", kCodespace);
  }
  if (template_id == 0) {
    return make_error(error_code_t::template_missing,
                      "empty template reference", kCodespace);
  }
  if (binding_of(instance)) {
    return make_error(error_code_t::binding_exists,
                      "instance is already bound", kCodespace);
  }
  auto state = template_state(template_id);
  if (!state || !state->frozen) {
    return make_error(error_code_t::template_missing,
                      "template is not registered", kCodespace);
  }
  if (state->policies.empty()) {
    return make_error(error_code_t::template_empty,
                      "template has no policies", kCodespace);
  }
  auto seeded = std::vector<std::shared_ptr<policy_plugin>>{};
  for (const auto type : state->policies) {
    auto implementation = plugin(type);
    if (!implementation) {
      return make_error(error_code_t::plugin_missing,
                        "template plugin is not registered: " +
                            std::string{to_string(type)},
                        kCodespace);
    }
    if (!is_approved(type)) {
      return make_error(error_code_t::plugin_not_approved,
                        "template plugin is not approved: " +
                            std::string{to_string(type)},
                        kCodespace);
    }
    if (implementation->capabilities().instance_init_hook) {
      seeded.push_back(std::move(implementation));
    }
  }

  storage_.put(encoder_, key::make_entity_key(key::kBindingPrefix, instance),
               template_id);
  save_instance_policies(instance, state->policies);
  for (const auto& implementation : seeded) {
    implementation->initialize_instance(instance, template_id);
  }
  spdlog::info("Instance {} bound to template {} ({} plugin(s) seeded)",
               instance, template_id, seeded.size());
  return {};
}

std::optional<configuration_scope_t> engine::authorize_configuration(
    const address_t& caller,
    const entity_id_t entity_id,
    const policy_type_t type,
    operation_result_t& error) const {
  auto owner = directory_.owner_of(entity_id);
  if (!owner) {
    error = make_error(error_code_t::entity_missing, "entity not found",
                       kCodespace);
    return std::nullopt;
  }
  auto implementation = plugin(type);
  if (!implementation) {
    error = make_error(error_code_t::plugin_missing,
                       "plugin is not registered", kCodespace);
    return std::nullopt;
  }

  auto template_id = directory_.template_of(entity_id);
  if (!template_id) {
    if (*owner != caller) {
      error = make_error(error_code_t::authorization_denied,
                         "caller is not the entity owner", kCodespace);
      return std::nullopt;
    }
    if (auto state = template_state(entity_id); state && state->frozen) {
      error = make_error(error_code_t::template_frozen,
                         "template is registered", kCodespace);
      return std::nullopt;
    }
    return configuration_scope_t{.entity_id = entity_id};
  }

  auto is_owner = *owner == caller;
  if (!is_owner && directory_.active_renter_of(entity_id) != caller) {
    error = make_error(error_code_t::authorization_denied,
                       "caller is neither owner nor renter", kCodespace);
    return std::nullopt;
  }
  if (!is_owner && !implementation->renter_configurable()) {
    error = make_error(error_code_t::authorization_denied,
                       "plugin is owner-only", kCodespace);
    return std::nullopt;
  }
  auto ceiling = template_state(*template_id);
  if (!ceiling || !contains(ceiling->policies, type)) {
    error = make_error(error_code_t::ceiling_violation,
                       "plugin not in template policy list", kCodespace);
    return std::nullopt;
  }
  return configuration_scope_t{.entity_id = entity_id,
                               .ceiling = *template_id};
}

std::optional<check_context_t> engine::make_context(
    const entity_id_t entity_id,
    const address_t& caller,
    const action_t& action,
    const timestamp_milliseconds_t now) const {
  auto vault = directory_.vault_of(entity_id);
  if (!vault) {
    return std::nullopt;
  }
  auto payload = bytes_view_t{action.payload.data(), action.payload.size()};
  return check_context_t{
      .entity_id = entity_id,
      .caller = caller,
      .vault = *vault,
      .destination = action.destination,
      .value = action.value,
      .payload = payload,
      .instruction =
          leasehold::decoder::decode_instruction(action.destination, payload),
      .now = now};
}

operation_result_t engine::validate(const entity_id_t entity_id,
                                    const address_t& caller,
                                    const action_t& action,
                                    const timestamp_milliseconds_t now) const {
  auto policies = active_policies(entity_id);
  if (!policies) {
    return make_error(error_code_t::policy_not_bound, "policy not bound",
                      kCodespace);
  }
  if (policies->empty()) {
    // A bound instance whose renter removed every configurable plugin.
    return make_error(error_code_t::policy_not_bound, "no active policies",
                      kCodespace);
  }
  auto context = make_context(entity_id, caller, action, now);
  if (!context) {
    return make_error(error_code_t::entity_missing, "entity not found",
                      kCodespace);
  }
  spdlog::debug("Validating entity {} instruction '{}' ({}) against {} "
                "policies",
                entity_id,
                leasehold::decoder::to_string(context->instruction.kind),
                leasehold::decoder::instruction_id(context->instruction),
                policies->size());
  for (const auto type : *policies) {
    auto implementation = plugin(type);
    if (!implementation) {
      auto result = make_error(error_code_t::policy_violation,
                               "plugin unavailable", plugin_codespace(type));
      result.info = std::string{to_string(type)};
      return result;
    }
    auto decision = implementation->check(*context);
    if (!decision.allowed) {
      spdlog::debug("Entity {} rejected by '{}': {}", entity_id,
                    to_string(type), decision.reason);
      auto result = make_error(error_code_t::policy_violation,
                               std::move(decision.reason),
                               plugin_codespace(type));
      result.info = std::string{to_string(type)};
      return result;
    }
  }
  return {};
}

operation_result_t engine::commit(const address_t& caller,
                                  const entity_id_t entity_id,
                                  const action_t& action,
                                  const timestamp_milliseconds_t now) {
  if (caller != router_) {
    return make_error(error_code_t::authorization_denied,
                      "only the router may commit", kCodespace);
  }
  auto result = operation_result_t{};
  auto policies = active_policies(entity_id);
  if (!policies) {
    return result;
  }
  auto context = make_context(entity_id, caller, action, now);
  if (!context) {
    return result;
  }
  for (const auto type : *policies) {
    auto implementation = plugin(type);
    if (!implementation || !implementation->capabilities().commit_hook) {
      continue;
    }
    try {
      implementation->commit(*context);
    } catch (const std::exception& ex) {
      spdlog::warn("Commit hook of '{}' failed for entity {}: {}",
                   to_string(type), entity_id, ex.what());
      result.events.push_back(audit_event_t{
          .type = audit_event_type_t::policy_commit_failed,
          .entity_id = entity_id,
          .recorded_at = now,
          .attributes = {
              audit_event_attribute_t{.key = "plugin",
                                      .value = std::string{to_string(type)}},
              audit_event_attribute_t{.key = "diagnostic",
                                      .value = ex.what()}}});
    }
  }
  return result;
}

std::optional<template_state_t> engine::template_state(
    const entity_id_t entity_id) const {
  return storage_.get<template_state_t>(
      encoder_, key::make_entity_key(key::kTemplatePolicyPrefix, entity_id));
}

std::vector<policy_type_t> engine::instance_policies(
    const entity_id_t instance) const {
  return storage_
      .get<std::vector<policy_type_t>>(
          encoder_, key::make_entity_key(key::kInstancePolicyPrefix, instance))
      .value_or(std::vector<policy_type_t>{});
}

std::optional<entity_id_t> engine::binding_of(
    const entity_id_t instance) const {
  return storage_.get<entity_id_t>(
      encoder_, key::make_entity_key(key::kBindingPrefix, instance));
}

std::optional<std::vector<policy_type_t>> engine::active_policies(
    const entity_id_t entity_id) const {
  if (auto template_id = binding_of(entity_id)) {
    auto policies = instance_policies(entity_id);
    if (auto ceiling = template_state(*template_id)) {
      for (const auto type : ceiling->policies) {
        auto implementation = plugin(type);
        if (implementation && !implementation->renter_configurable() &&
            !contains(policies, type)) {
          policies.push_back(type);
        }
      }
    }
    return policies;
  }
  auto state = template_state(entity_id);
  if (!state || state->policies.empty()) {
    return std::nullopt;
  }
  return state->policies;
}

void engine::save_template_state(const template_state_t& state) {
  storage_.put(encoder_,
               key::make_entity_key(key::kTemplatePolicyPrefix, state.entity_id),
               state);
}

void engine::save_instance_policies(
    const entity_id_t instance,
    const std::vector<policy_type_t>& policies) {
  storage_.put(encoder_,
               key::make_entity_key(key::kInstancePolicyPrefix, instance),
               policies);
}

}  // namespace leasehold::policy
