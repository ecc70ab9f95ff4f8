#include <spdlog/spdlog.h>
#include <leasehold/policy/whitelist_plugin.hpp>
#include <leasehold/schema/key/state_keys.hpp>
#include <algorithm>
#include <iterator>

using namespace leasehold::schema;
using leasehold::decoder::instruction_kind_t;

namespace leasehold::policy {

whitelist_plugin::whitelist_plugin(encoder_t& encoder,
                                   storage_t& storage,
                                   std::string_view prefix)
    : encoder_{encoder}, storage_{storage}, prefix_{prefix} {}

std::string whitelist_plugin::codespace() const {
  return "leasehold.policy." + std::string{to_string(type())};
}

void whitelist_plugin::initialize_instance(const entity_id_t instance,
                                           const entity_id_t template_id) {
  auto entries = std::vector<leasehold::storage::key_value_entry_t>{};
  for (const auto& address : this->entries(template_id)) {
    entries.emplace_back(
        key::make_entity_address_key(prefix_, instance, address),
        encoder_.encode(true));
  }
  storage_.replace_by_prefix(key::make_entity_key(prefix_, instance), entries);
  spdlog::debug("{} seeded instance {} with {} member(s) from template {}",
                to_string(type()), instance, entries.size(), template_id);
}

operation_result_t whitelist_plugin::add(const configuration_scope_t& scope,
                                         const address_t& address) {
  if (is_zero(address)) {
    return make_error(error_code_t::invalid_argument,
                      "zero address cannot be whitelisted", codespace());
  }
  if (scope.ceiling && !contains(*scope.ceiling, address)) {
    return make_error(error_code_t::ceiling_violation,
                      "address is not whitelisted by the template",
                      codespace());
  }
  storage_.put(encoder_,
               key::make_entity_address_key(prefix_, scope.entity_id, address),
               true);
  spdlog::info("{} added {} for entity {}", to_string(type()),
               to_hex(address), scope.entity_id);
  return {};
}

operation_result_t whitelist_plugin::remove(const configuration_scope_t& scope,
                                            const address_t& address) {
  auto key = key::make_entity_address_key(prefix_, scope.entity_id, address);
  if (!storage_.get<bool>(encoder_, key)) {
    return make_error(error_code_t::invalid_argument,
                      "address is not whitelisted", codespace());
  }
  storage_.erase(key);
  spdlog::info("{} removed {} for entity {}", to_string(type()),
               to_hex(address), scope.entity_id);
  return {};
}

bool whitelist_plugin::contains(const entity_id_t entity_id,
                                const address_t& address) const {
  return storage_
      .get<bool>(encoder_,
                 key::make_entity_address_key(prefix_, entity_id, address))
      .value_or(false);
}

std::vector<address_t> whitelist_plugin::entries(
    const entity_id_t entity_id) const {
  auto out = std::vector<address_t>{};
  for (const auto& [row_key, _] :
       storage_.list_by_prefix(key::make_entity_key(prefix_, entity_id))) {
    if (auto address = key::address_from_key(row_key)) {
      out.push_back(*address);
    }
  }
  return out;
}

bool whitelist_plugin::configured(const entity_id_t entity_id) const {
  return !storage_.list_by_prefix(key::make_entity_key(prefix_, entity_id))
              .empty();
}

token_whitelist::token_whitelist(encoder_t& encoder, storage_t& storage)
    : whitelist_plugin{encoder, storage, key::kTokenWhitelistPrefix} {}

policy_decision_t token_whitelist::check(
    const check_context_t& context) const {
  if (!configured(context.entity_id)) {
    if (moves_value_or_state(context)) {
      return reject("token whitelist not configured");
    }
    return allow();
  }
  const auto& instruction = context.instruction;
  if (instruction.kind == instruction_kind_t::unknown) {
    return reject("unrecognized instruction: " +
                  leasehold::decoder::instruction_id(instruction));
  }
  if (instruction.kind == instruction_kind_t::malformed) {
    return reject("malformed instruction: " + instruction.error);
  }
  if (instruction.is_swap()) {
    for (const auto& token : instruction.path) {
      if (!contains(context.entity_id, token)) {
        return reject("token not whitelisted: " + to_hex(token));
      }
    }
    return allow();
  }
  if (instruction.token && !contains(context.entity_id, *instruction.token)) {
    return reject("token not whitelisted: " + to_hex(*instruction.token));
  }
  return allow();
}

destination_whitelist::destination_whitelist(encoder_t& encoder,
                                             storage_t& storage)
    : whitelist_plugin{encoder, storage, key::kDestinationWhitelistPrefix} {}

policy_decision_t destination_whitelist::check(
    const check_context_t& context) const {
  if (!configured(context.entity_id)) {
    if (moves_value_or_state(context)) {
      return reject("destination whitelist not configured");
    }
    return allow();
  }
  if (context.destination != context.vault &&
      !contains(context.entity_id, context.destination)) {
    return reject("destination not whitelisted: " +
                  to_hex(context.destination));
  }
  const auto& instruction = context.instruction;
  if (instruction.is_allowance() && instruction.spender &&
      !contains(context.entity_id, *instruction.spender)) {
    return reject("spender not whitelisted: " + to_hex(*instruction.spender));
  }
  return allow();
}

}  // namespace leasehold::policy
