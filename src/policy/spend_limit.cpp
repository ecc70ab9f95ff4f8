#include <spdlog/spdlog.h>
#include <leasehold/policy/spend_limit.hpp>
#include <leasehold/schema/key/state_keys.hpp>

using namespace leasehold::schema;
using leasehold::decoder::instruction_kind_t;

namespace {

constexpr auto kCodespace = "leasehold.policy.spend_limit";

/// Spent amount of the window that is current at `now`.
amount_t current_spent(const std::optional<spend_window_state_t>& window,
                       const timestamp_milliseconds_t now) {
  if (!window || now >= window->window_start + kMillisecondsPerDay) {
    return 0;
  }
  return window->spent;
}

}  // namespace

namespace leasehold::policy {

std::optional<amount_t> spend_of(const check_context_t& context) {
  const auto& instruction = context.instruction;
  switch (instruction.kind) {
    case instruction_kind_t::transfer:
    case instruction_kind_t::transfer_from:
      return instruction.amount;
    case instruction_kind_t::swap_exact_input:
    case instruction_kind_t::swap_exact_output:
      if (instruction.native_input) {
        return context.value;
      }
      return instruction.max_input;
    case instruction_kind_t::approve:
    case instruction_kind_t::increase_allowance:
    case instruction_kind_t::decrease_allowance:
    case instruction_kind_t::permit:
      return std::nullopt;
    case instruction_kind_t::none:
      // Value sent back to the vault itself is not spent.
      if (context.destination == context.vault) {
        return std::nullopt;
      }
      return context.value;
    case instruction_kind_t::unknown:
    case instruction_kind_t::malformed:
    case instruction_kind_t::wrap_native:
    case instruction_kind_t::unwrap_native:
      return context.value;
  }
  return context.value;
}

spend_limit::spend_limit(encoder_t& encoder, storage_t& storage)
    : encoder_{encoder}, storage_{storage} {}

policy_decision_t spend_limit::check(const check_context_t& context) const {
  const auto& instruction = context.instruction;
  switch (instruction.kind) {
    case instruction_kind_t::malformed:
      return reject("malformed instruction: " + instruction.error);
    case instruction_kind_t::unknown:
      return reject("unrecognized instruction");
    case instruction_kind_t::increase_allowance:
      return reject("allowance increase not permitted");
    case instruction_kind_t::permit:
      return reject("permit not permitted");
    case instruction_kind_t::decrease_allowance:
      return allow();
    default:
      break;
  }

  auto config = limits(context.entity_id);
  if (!config) {
    if (moves_value_or_state(context)) {
      return reject("spend limit not configured");
    }
    return allow();
  }

  if (instruction.kind == instruction_kind_t::approve) {
    if (instruction.amount == max_amount()) {
      return reject("unlimited approval not permitted");
    }
    if (instruction.amount > config->max_approve) {
      return reject("exceeds approval limit");
    }
    return allow();
  }

  auto spend = spend_of(context).value_or(0);
  if (spend > config->max_per_call) {
    return reject("exceeds per-call limit");
  }
  auto spent = current_spent(window(context.entity_id), context.now);
  if (spend > config->max_per_day || spent > config->max_per_day - spend) {
    return reject("daily limit reached");
  }
  return allow();
}

void spend_limit::commit(const check_context_t& context) {
  auto spend = spend_of(context);
  if (!spend || *spend == 0) {
    return;
  }
  auto state = window(context.entity_id);
  if (!state || context.now >= state->window_start + kMillisecondsPerDay) {
    state = spend_window_state_t{.window_start = context.now, .spent = 0};
  }
  state->spent += *spend;
  storage_.put(encoder_,
               key::make_entity_key(key::kSpendWindowPrefix, context.entity_id),
               *state);
  spdlog::debug("spend_limit entity {} spent {} in window starting {}",
                context.entity_id, state->spent.str(), state->window_start);
}

void spend_limit::initialize_instance(const entity_id_t instance,
                                      const entity_id_t template_id) {
  if (auto config = limits(template_id)) {
    storage_.put(encoder_,
                 key::make_entity_key(key::kSpendConfigPrefix, instance),
                 *config);
  }
}

operation_result_t spend_limit::set_limits(
    const configuration_scope_t& scope,
    const spend_limit_config_t& limits) {
  if (limits.max_per_call > limits.max_per_day) {
    return make_error(error_code_t::invalid_argument,
                      "per-call limit exceeds daily limit", kCodespace);
  }
  if (limits.max_approve == max_amount()) {
    return make_error(error_code_t::invalid_argument,
                      "approval limit cannot be unlimited", kCodespace);
  }
  if (scope.ceiling) {
    auto ceiling = this->limits(*scope.ceiling);
    if (!ceiling) {
      return make_error(error_code_t::ceiling_violation,
                        "template has no spend limits", kCodespace);
    }
    if (limits.max_per_call > ceiling->max_per_call ||
        limits.max_per_day > ceiling->max_per_day ||
        limits.max_approve > ceiling->max_approve) {
      return make_error(error_code_t::ceiling_violation,
                        "spend limits exceed template ceiling", kCodespace);
    }
  }
  storage_.put(encoder_,
               key::make_entity_key(key::kSpendConfigPrefix, scope.entity_id),
               limits);
  spdlog::info("spend_limit entity {} set per-call {} daily {} approve {}",
               scope.entity_id, limits.max_per_call.str(),
               limits.max_per_day.str(), limits.max_approve.str());
  return {};
}

std::optional<spend_limit_config_t> spend_limit::limits(
    const entity_id_t entity_id) const {
  return storage_.get<spend_limit_config_t>(
      encoder_, key::make_entity_key(key::kSpendConfigPrefix, entity_id));
}

std::optional<spend_window_state_t> spend_limit::window(
    const entity_id_t entity_id) const {
  return storage_.get<spend_window_state_t>(
      encoder_, key::make_entity_key(key::kSpendWindowPrefix, entity_id));
}

}  // namespace leasehold::policy
