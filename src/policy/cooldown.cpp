#include <spdlog/spdlog.h>
#include <leasehold/policy/cooldown.hpp>
#include <leasehold/schema/key/state_keys.hpp>

using namespace leasehold::schema;

namespace leasehold::policy {

cooldown::cooldown(encoder_t& encoder, storage_t& storage)
    : encoder_{encoder}, storage_{storage} {}

policy_decision_t cooldown::check(const check_context_t& context) const {
  auto interval = config(context.entity_id);
  if (!interval) {
    if (moves_value_or_state(context)) {
      return reject("cooldown not configured");
    }
    return allow();
  }
  auto last = last_action(context.entity_id);
  if (last && context.now < *last + interval->minimum_interval) {
    return reject("cooldown active");
  }
  return allow();
}

void cooldown::commit(const check_context_t& context) {
  storage_.put(
      encoder_,
      key::make_entity_key(key::kCooldownLastPrefix, context.entity_id),
      context.now);
}

void cooldown::initialize_instance(const entity_id_t instance,
                                   const entity_id_t template_id) {
  if (auto interval = config(template_id)) {
    storage_.put(encoder_,
                 key::make_entity_key(key::kCooldownConfigPrefix, instance),
                 *interval);
  }
}

operation_result_t cooldown::set_interval(
    const configuration_scope_t& scope,
    const duration_milliseconds_t minimum_interval) {
  if (scope.ceiling) {
    auto ceiling = config(*scope.ceiling);
    if (!ceiling) {
      return make_error(error_code_t::ceiling_violation,
                        "template has no cooldown", "leasehold.policy.cooldown");
    }
    if (minimum_interval < ceiling->minimum_interval) {
      return make_error(error_code_t::ceiling_violation,
                        "cooldown shorter than template ceiling",
                        "leasehold.policy.cooldown");
    }
  }
  storage_.put(
      encoder_,
      key::make_entity_key(key::kCooldownConfigPrefix, scope.entity_id),
      cooldown_config_t{.minimum_interval = minimum_interval});
  spdlog::info("cooldown entity {} set to {} ms", scope.entity_id,
               minimum_interval);
  return {};
}

std::optional<cooldown_config_t> cooldown::config(
    const entity_id_t entity_id) const {
  return storage_.get<cooldown_config_t>(
      encoder_, key::make_entity_key(key::kCooldownConfigPrefix, entity_id));
}

std::optional<timestamp_milliseconds_t> cooldown::last_action(
    const entity_id_t entity_id) const {
  return storage_.get<timestamp_milliseconds_t>(
      encoder_, key::make_entity_key(key::kCooldownLastPrefix, entity_id));
}

}  // namespace leasehold::policy
