#include <spdlog/spdlog.h>
#include <leasehold/blake3/hash.hpp>
#include <leasehold/crypto/recover.hpp>
#include <leasehold/decoder/instruction.hpp>
#include <leasehold/router/access_router.hpp>
#include <leasehold/schema/key/state_keys.hpp>
#include <algorithm>
#include <chrono>
#include <iterator>
#include <string>
#include <utility>
#include <variant>

using namespace leasehold::schema;

namespace {

constexpr auto kCodespace = "leasehold.router";

audit_event_attribute_t attribute(std::string key, std::string value) {
  return audit_event_attribute_t{.key = std::move(key),
                                 .value = std::move(value)};
}

operation_result_t entity_missing() {
  return make_error(error_code_t::entity_missing, "entity not found",
                    kCodespace);
}

operation_result_t entity_terminated() {
  return make_error(error_code_t::entity_terminated, "entity is terminated",
                    kCodespace);
}

}  // namespace

namespace leasehold::router {

timestamp_milliseconds_t system_clock_now() {
  return static_cast<timestamp_milliseconds_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

address_t default_router_address() {
  auto digest = leasehold::blake3::hash(std::string_view{"leasehold/router"});
  auto address = address_t{};
  std::copy(std::end(digest) - static_cast<std::ptrdiff_t>(address.size()),
            std::end(digest), std::begin(address));
  return address;
}

access_router::access_router(leasehold::policy::encoder_t& encoder,
                             leasehold::policy::storage_t& storage,
                             leasehold::vault::call_executor& executor,
                             router_options options,
                             clock_function_t clock)
    : encoder_{encoder},
      storage_{storage},
      options_{options},
      clock_{std::move(clock)},
      domain_{leasehold::crypto::signing_domain{
          .network_id = options.network_id,
          .verifying_component = options.self}},
      vault_{encoder, storage, executor, options.self},
      token_whitelist_{
          std::make_shared<leasehold::policy::token_whitelist>(encoder,
                                                              storage)},
      destination_whitelist_{
          std::make_shared<leasehold::policy::destination_whitelist>(encoder,
                                                                    storage)},
      spend_limit_{
          std::make_shared<leasehold::policy::spend_limit>(encoder, storage)},
      cooldown_{std::make_shared<leasehold::policy::cooldown>(encoder, storage)},
      receiver_guard_{std::make_shared<leasehold::policy::receiver_guard>()},
      engine_{encoder, storage, *this, options.administrator, options.self} {
  engine_.register_plugin(token_whitelist_);
  engine_.register_plugin(destination_whitelist_);
  engine_.register_plugin(spend_limit_);
  engine_.register_plugin(cooldown_);
  engine_.register_plugin(receiver_guard_);
  spdlog::info("Access router {} ready; lease manager {}",
               to_hex(options_.self), to_hex(options_.lease_manager));
}

std::optional<entity_state_t> access_router::load(
    const entity_id_t entity_id) const {
  return storage_.get<entity_state_t>(
      encoder_, key::make_entity_key(key::kEntityKeyPrefix, entity_id));
}

void access_router::save(const entity_state_t& state) {
  storage_.put(encoder_,
               key::make_entity_key(key::kEntityKeyPrefix, state.entity_id),
               state);
}

entity_id_t access_router::next_entity_id() const {
  return storage_
      .get<entity_id_t>(encoder_, key::make_key(key::kNextEntityIdKey))
      .value_or(entity_id_t{1});
}

void access_router::record(operation_result_t& result,
                           const audit_event_type_t type,
                           const entity_id_t entity_id,
                           std::vector<audit_event_attribute_t> attributes) {
  auto seq_key = key::make_key(key::kEventSeqKey);
  auto event_id =
      storage_.get<uint64_t>(encoder_, seq_key).value_or(uint64_t{0}) + 1;
  auto event = audit_event_t{.event_id = event_id,
                             .type = type,
                             .entity_id = entity_id,
                             .recorded_at = clock_(),
                             .attributes = std::move(attributes)};
  storage_.put(encoder_, key::make_event_key(event_id), event);
  storage_.put(encoder_, seq_key, event_id);
  result.events.push_back(std::move(event));
}

bool access_router::lease_active(const entity_state_t& state) const {
  return state.renter.has_value() && clock_() < state.lease_expiry;
}

caller_role_t access_router::resolve_role(const entity_state_t& state,
                                          const address_t& caller,
                                          operation_result_t& error) const {
  if (caller == state.owner) {
    return state.template_id ? caller_role_t::instance_owner
                             : caller_role_t::plain_owner;
  }
  auto now = clock_();
  if (state.renter && *state.renter == caller) {
    if (now >= state.lease_expiry) {
      error = make_error(error_code_t::lease_expired, "lease expired",
                         kCodespace);
      return caller_role_t::none;
    }
    return caller_role_t::renter;
  }
  if (state.operator_address && *state.operator_address == caller) {
    if (!lease_active(state)) {
      error = make_error(error_code_t::lease_expired, "lease expired",
                         kCodespace);
      return caller_role_t::none;
    }
    if (now >= state.operator_expiry) {
      error = make_error(error_code_t::delegation_expired,
                         "operator delegation expired", kCodespace);
      return caller_role_t::none;
    }
    return caller_role_t::delegated_operator;
  }
  error = make_error(error_code_t::authorization_denied,
                     "caller has no role on entity", kCodespace);
  return caller_role_t::none;
}

operation_result_t access_router::submit(const router_request_t& request,
                                         const signature_t& signature) {
  auto lock = std::scoped_lock{mutex_};
  if (auto result = authenticate(request, signature); !result.ok()) {
    spdlog::warn("Rejected request from {}: {}", to_hex(request.signer),
                 result.log);
    return result;
  }
  return dispatch(request.signer, request.call);
}

operation_result_t access_router::authenticate(const router_request_t& request,
                                               const signature_t& signature) {
  if (request.version != 1) {
    return make_error(error_code_t::invalid_argument,
                      "unsupported request version", kCodespace);
  }
  if (request.network_id != options_.network_id) {
    return make_error(error_code_t::request_network_mismatch,
                      "request is for another network", kCodespace);
  }
  if (is_zero(request.signer)) {
    return make_error(error_code_t::invalid_argument, "signer is zero",
                      kCodespace);
  }
  auto message = leasehold::crypto::signing_message(domain_, request);
  auto recovered = leasehold::crypto::recover_address(
      bytes_view_t{message.data(), message.size()}, signature);
  if (!recovered || *recovered != request.signer) {
    return make_error(error_code_t::request_signature_invalid,
                      "request signature does not match signer", kCodespace);
  }
  auto nonce_key = key::make_request_nonce_key(request.signer);
  auto expected =
      storage_.get<uint64_t>(encoder_, nonce_key).value_or(uint64_t{0});
  if (request.nonce != expected) {
    auto result = make_error(error_code_t::request_nonce_mismatch,
                             "request nonce already used or out of order",
                             kCodespace);
    result.info = std::to_string(expected);
    return result;
  }
  storage_.put(encoder_, nonce_key, expected + 1);
  return {};
}

operation_result_t access_router::dispatch(const address_t& caller,
                                           const router_call_t& call) {
  return std::visit(
      overloaded{
          [&](const mint_entity_t& c) { return mint_entity(caller, c.owner); },
          [&](const transfer_entity_t& c) {
            return transfer_entity(caller, c.entity_id, c.new_owner);
          },
          [&](const change_status_t& c) {
            switch (c.change) {
              case lifecycle_change_t::pause:
                return pause(caller, c.entity_id);
              case lifecycle_change_t::unpause:
                return unpause(caller, c.entity_id);
              case lifecycle_change_t::terminate:
                return terminate(caller, c.entity_id);
            }
            return make_error(error_code_t::invalid_argument,
                              "unknown lifecycle change", kCodespace);
          },
          [&](const assign_lease_t& c) {
            return assign_lease(caller, c.entity_id, c.renter, c.expiry);
          },
          [&](const extend_lease_t& c) {
            return extend_lease(caller, c.entity_id, c.expiry);
          },
          [&](const set_operator_t& c) {
            return set_operator(caller, c.entity_id, c.operator_address,
                                c.expiry);
          },
          [&](const clear_operator_t& c) {
            return clear_operator(caller, c.entity_id);
          },
          [&](const apply_operator_permit_t& c) {
            return set_operator_with_permit(caller, c.permit,
                                            c.permit_signature);
          },
          [&](const register_template_t& c) {
            return register_template(caller, c.entity_id);
          },
          [&](const mint_instance_t& c) {
            return mint_instance(
                caller, c.template_id, c.renter, c.lease_expiry,
                bytes_view_t{c.init_params.data(), c.init_params.size()});
          },
          [&](const deposit_funds_t& c) {
            return deposit(caller, c.entity_id, c.amount);
          },
          [&](const withdraw_funds_t& c) {
            return withdraw(caller, c.entity_id, c.amount);
          },
          [&](const execute_action_t& c) {
            return execute(caller, c.entity_id, c.action);
          },
          [&](const set_plugin_approval_t& c) {
            return c.approved ? approve_plugin(caller, c.type)
                              : revoke_plugin(caller, c.type);
          },
          [&](const update_policy_list_t& c) {
            if (c.list == policy_list_t::template_list) {
              return c.add ? add_template_policy(caller, c.entity_id, c.type)
                           : remove_template_policy(caller, c.entity_id,
                                                    c.type);
            }
            return c.add ? add_instance_policy(caller, c.entity_id, c.type)
                         : remove_instance_policy(caller, c.entity_id, c.type);
          },
          [&](const update_whitelist_t& c) {
            if (c.kind == whitelist_kind_t::token) {
              return c.add ? add_whitelisted_token(caller, c.entity_id,
                                                   c.address)
                           : remove_whitelisted_token(caller, c.entity_id,
                                                      c.address);
            }
            return c.add ? add_whitelisted_destination(caller, c.entity_id,
                                                       c.address)
                         : remove_whitelisted_destination(caller, c.entity_id,
                                                          c.address);
          },
          [&](const set_spend_limits_t& c) {
            return set_spend_limits(caller, c.entity_id, c.limits);
          },
          [&](const set_cooldown_t& c) {
            return set_cooldown(caller, c.entity_id, c.minimum_interval);
          }},
      call);
}

operation_result_t access_router::mint_entity(const address_t& caller,
                                              const address_t& owner) {
  auto lock = std::scoped_lock{mutex_};
  if (is_zero(owner)) {
    return make_error(error_code_t::invalid_argument, "owner is zero",
                      kCodespace);
  }
  auto entity_id = next_entity_id();
  auto state = entity_state_t{.entity_id = entity_id,
                              .owner = owner,
                              .vault = leasehold::vault::vault::address_of(
                                  entity_id)};
  save(state);
  storage_.put(encoder_, key::make_key(key::kNextEntityIdKey), entity_id + 1);

  auto result = operation_result_t{};
  result.data = encoder_.encode(entity_id);
  result.info = std::to_string(entity_id);
  record(result, audit_event_type_t::entity_minted, entity_id,
         {attribute("owner", to_hex(owner)),
          attribute("minted_by", to_hex(caller))});
  spdlog::info("Minted entity {} for {}", entity_id, to_hex(owner));
  return result;
}

operation_result_t access_router::transfer_entity(const address_t& caller,
                                                  const entity_id_t entity_id,
                                                  const address_t& new_owner) {
  auto lock = std::scoped_lock{mutex_};
  auto state = load(entity_id);
  if (!state) {
    return entity_missing();
  }
  if (state->owner != caller) {
    return make_error(error_code_t::authorization_denied,
                      "caller is not the entity owner", kCodespace);
  }
  if (state->status == entity_status_t::terminated) {
    return entity_terminated();
  }
  if (is_zero(new_owner)) {
    return make_error(error_code_t::invalid_argument, "new owner is zero",
                      kCodespace);
  }
  auto previous = state->owner;
  state->owner = new_owner;
  state->renter.reset();
  state->lease_expiry = 0;
  state->operator_address.reset();
  state->operator_expiry = 0;
  save(*state);

  auto result = operation_result_t{};
  record(result, audit_event_type_t::entity_transferred, entity_id,
         {attribute("from", to_hex(previous)),
          attribute("to", to_hex(new_owner))});
  spdlog::info("Entity {} transferred from {} to {}; lease and delegation "
               "cleared",
               entity_id, to_hex(previous), to_hex(new_owner));
  return result;
}

operation_result_t access_router::pause(const address_t& caller,
                                        const entity_id_t entity_id) {
  auto lock = std::scoped_lock{mutex_};
  auto state = load(entity_id);
  if (!state) {
    return entity_missing();
  }
  if (state->owner != caller) {
    return make_error(error_code_t::authorization_denied,
                      "caller is not the entity owner", kCodespace);
  }
  if (state->status == entity_status_t::terminated) {
    return entity_terminated();
  }
  if (state->status == entity_status_t::paused) {
    return make_error(error_code_t::entity_paused, "entity is paused",
                      kCodespace);
  }
  state->status = entity_status_t::paused;
  save(*state);
  auto result = operation_result_t{};
  record(result, audit_event_type_t::entity_paused, entity_id);
  spdlog::info("Entity {} paused", entity_id);
  return result;
}

operation_result_t access_router::unpause(const address_t& caller,
                                          const entity_id_t entity_id) {
  auto lock = std::scoped_lock{mutex_};
  auto state = load(entity_id);
  if (!state) {
    return entity_missing();
  }
  if (state->owner != caller) {
    return make_error(error_code_t::authorization_denied,
                      "caller is not the entity owner", kCodespace);
  }
  if (state->status == entity_status_t::terminated) {
    return entity_terminated();
  }
  if (state->status != entity_status_t::paused) {
    return make_error(error_code_t::entity_not_paused, "entity is not paused",
                      kCodespace);
  }
  state->status = entity_status_t::active;
  save(*state);
  auto result = operation_result_t{};
  record(result, audit_event_type_t::entity_unpaused, entity_id);
  spdlog::info("Entity {} unpaused", entity_id);
  return result;
}

operation_result_t access_router::terminate(const address_t& caller,
                                            const entity_id_t entity_id) {
  auto lock = std::scoped_lock{mutex_};
  auto state = load(entity_id);
  if (!state) {
    return entity_missing();
  }
  if (state->owner != caller) {
    return make_error(error_code_t::authorization_denied,
                      "caller is not the entity owner", kCodespace);
  }
  if (state->status == entity_status_t::terminated) {
    return entity_terminated();
  }
  state->status = entity_status_t::terminated;
  state->operator_address.reset();
  state->operator_expiry = 0;
  save(*state);
  auto result = operation_result_t{};
  record(result, audit_event_type_t::entity_terminated, entity_id);
  spdlog::info("Entity {} terminated", entity_id);
  return result;
}

operation_result_t access_router::assign_lease(
    const address_t& caller,
    const entity_id_t entity_id,
    const address_t& renter,
    const timestamp_milliseconds_t expiry) {
  auto lock = std::scoped_lock{mutex_};
  auto state = load(entity_id);
  if (!state) {
    return entity_missing();
  }
  if (caller != options_.lease_manager && caller != state->owner) {
    return make_error(error_code_t::authorization_denied,
                      "caller may not assign leases", kCodespace);
  }
  if (state->status == entity_status_t::terminated) {
    return entity_terminated();
  }
  if (is_zero(renter)) {
    return make_error(error_code_t::invalid_argument, "renter is zero",
                      kCodespace);
  }
  if (expiry <= clock_()) {
    return make_error(error_code_t::invalid_argument,
                      "lease expiry is in the past", kCodespace);
  }
  if (lease_active(*state) && *state->renter != renter) {
    return make_error(error_code_t::invalid_argument,
                      "another lease is active", kCodespace);
  }
  state->renter = renter;
  state->lease_expiry = expiry;
  state->operator_address.reset();
  state->operator_expiry = 0;
  save(*state);

  auto result = operation_result_t{};
  record(result, audit_event_type_t::lease_assigned, entity_id,
         {attribute("renter", to_hex(renter)),
          attribute("expiry", std::to_string(expiry))});
  spdlog::info("Entity {} leased to {} until {}", entity_id, to_hex(renter),
               expiry);
  return result;
}

operation_result_t access_router::extend_lease(
    const address_t& caller,
    const entity_id_t entity_id,
    const timestamp_milliseconds_t expiry) {
  auto lock = std::scoped_lock{mutex_};
  auto state = load(entity_id);
  if (!state) {
    return entity_missing();
  }
  if (caller != options_.lease_manager && caller != state->owner) {
    return make_error(error_code_t::authorization_denied,
                      "caller may not extend leases", kCodespace);
  }
  if (state->status == entity_status_t::terminated) {
    return entity_terminated();
  }
  if (!lease_active(*state)) {
    return make_error(error_code_t::lease_expired, "lease expired",
                      kCodespace);
  }
  if (expiry <= state->lease_expiry) {
    return make_error(error_code_t::invalid_argument,
                      "extension must move expiry forward", kCodespace);
  }
  state->lease_expiry = expiry;
  save(*state);

  auto result = operation_result_t{};
  record(result, audit_event_type_t::lease_extended, entity_id,
         {attribute("renter", to_hex(*state->renter)),
          attribute("expiry", std::to_string(expiry))});
  spdlog::info("Entity {} lease extended until {}", entity_id, expiry);
  return result;
}

operation_result_t access_router::apply_operator(
    entity_state_t& state,
    const address_t& renter,
    const address_t& operator_address,
    const timestamp_milliseconds_t expiry) {
  if (!state.renter || *state.renter != renter) {
    return make_error(error_code_t::authorization_denied,
                      "only the renter may delegate", kCodespace);
  }
  if (!lease_active(state)) {
    return make_error(error_code_t::lease_expired, "lease expired",
                      kCodespace);
  }
  if (is_zero(operator_address)) {
    return make_error(error_code_t::invalid_argument, "operator is zero",
                      kCodespace);
  }
  if (expiry <= clock_()) {
    return make_error(error_code_t::delegation_expired,
                      "delegation expiry is in the past", kCodespace);
  }
  if (expiry > state.lease_expiry) {
    return make_error(error_code_t::delegation_exceeds_lease,
                      "delegation outlives the lease", kCodespace);
  }
  state.operator_address = operator_address;
  state.operator_expiry = expiry;
  return {};
}

operation_result_t access_router::set_operator(
    const address_t& caller,
    const entity_id_t entity_id,
    const address_t& operator_address,
    const timestamp_milliseconds_t expiry) {
  auto lock = std::scoped_lock{mutex_};
  auto state = load(entity_id);
  if (!state) {
    return entity_missing();
  }
  if (state->status == entity_status_t::terminated) {
    return entity_terminated();
  }
  auto result = apply_operator(*state, caller, operator_address, expiry);
  if (!result.ok()) {
    return result;
  }
  save(*state);
  record(result, audit_event_type_t::operator_set, entity_id,
         {attribute("operator", to_hex(operator_address)),
          attribute("expiry", std::to_string(expiry))});
  spdlog::info("Entity {} operator {} until {}", entity_id,
               to_hex(operator_address), expiry);
  return result;
}

operation_result_t access_router::set_operator_with_permit(
    const address_t& submitter,
    const operator_permit_t& permit,
    const signature_t& signature) {
  auto lock = std::scoped_lock{mutex_};
  auto state = load(permit.entity_id);
  if (!state) {
    return entity_missing();
  }
  if (state->status == entity_status_t::terminated) {
    return entity_terminated();
  }
  if (clock_() > permit.deadline) {
    return make_error(error_code_t::permit_deadline_passed,
                      "permit deadline passed", kCodespace);
  }
  if (submitter != permit.operator_address) {
    return make_error(error_code_t::delegation_submitter_mismatch,
                      "submitter is not the permit operator", kCodespace);
  }
  if (permit.nonce != state->operator_nonce) {
    return make_error(error_code_t::delegation_replayed,
                      "permit nonce already used or out of order",
                      kCodespace);
  }
  auto message = leasehold::crypto::signing_message(domain_, permit);
  auto signer = leasehold::crypto::recover_address(
      bytes_view_t{message.data(), message.size()}, signature);
  if (!signer || *signer != permit.renter) {
    return make_error(error_code_t::delegation_signature_invalid,
                      "permit signature does not match renter", kCodespace);
  }
  auto result = apply_operator(*state, permit.renter, permit.operator_address,
                               permit.expiry);
  if (!result.ok()) {
    return result;
  }
  state->operator_nonce += 1;
  save(*state);
  record(result, audit_event_type_t::operator_set, permit.entity_id,
         {attribute("operator", to_hex(permit.operator_address)),
          attribute("expiry", std::to_string(permit.expiry)),
          attribute("nonce", std::to_string(permit.nonce))});
  spdlog::info("Entity {} operator {} set by permit nonce {}",
               permit.entity_id, to_hex(permit.operator_address),
               permit.nonce);
  return result;
}

operation_result_t access_router::clear_operator(const address_t& caller,
                                                 const entity_id_t entity_id) {
  auto lock = std::scoped_lock{mutex_};
  auto state = load(entity_id);
  if (!state) {
    return entity_missing();
  }
  auto is_renter = state->renter && *state->renter == caller &&
                   lease_active(*state);
  if (caller != state->owner && !is_renter) {
    return make_error(error_code_t::authorization_denied,
                      "caller is neither owner nor renter", kCodespace);
  }
  if (!state->operator_address) {
    return make_error(error_code_t::invalid_argument, "no operator set",
                      kCodespace);
  }
  auto previous = *state->operator_address;
  state->operator_address.reset();
  state->operator_expiry = 0;
  save(*state);
  auto result = operation_result_t{};
  record(result, audit_event_type_t::operator_cleared, entity_id,
         {attribute("operator", to_hex(previous))});
  spdlog::info("Entity {} operator cleared", entity_id);
  return result;
}

operation_result_t access_router::register_template(
    const address_t& caller,
    const entity_id_t entity_id) {
  auto lock = std::scoped_lock{mutex_};
  auto state = load(entity_id);
  if (!state) {
    return entity_missing();
  }
  if (state->status == entity_status_t::terminated) {
    return entity_terminated();
  }
  auto result = engine_.register_template(caller, entity_id);
  if (!result.ok()) {
    return result;
  }
  record(result, audit_event_type_t::template_registered, entity_id);
  return result;
}

operation_result_t access_router::mint_instance(
    const address_t& caller,
    const entity_id_t template_id,
    const address_t& renter,
    const timestamp_milliseconds_t lease_expiry,
    const bytes_view_t& init_params) {
  auto lock = std::scoped_lock{mutex_};
  if (caller != options_.lease_manager) {
    return make_error(error_code_t::authorization_denied,
                      "only the lease manager may mint instances", kCodespace);
  }
  auto source = load(template_id);
  if (!source) {
    return make_error(error_code_t::template_missing, "template not found",
                      kCodespace);
  }
  if (source->status != entity_status_t::active) {
    return make_error(source->status == entity_status_t::paused
                          ? error_code_t::entity_paused
                          : error_code_t::entity_terminated,
                      "template entity is not active", kCodespace);
  }
  if (is_zero(renter)) {
    return make_error(error_code_t::invalid_argument, "renter is zero",
                      kCodespace);
  }
  if (lease_expiry <= clock_()) {
    return make_error(error_code_t::invalid_argument,
                      "lease expiry is in the past", kCodespace);
  }

  auto instance_id = next_entity_id();
  auto result = engine_.bind_instance(options_.self, instance_id, template_id);
  if (!result.ok()) {
    return result;
  }
  auto state = entity_state_t{
      .entity_id = instance_id,
      .owner = renter,
      .renter = renter,
      .lease_expiry = lease_expiry,
      .vault = leasehold::vault::vault::address_of(instance_id),
      .template_id = template_id,
      .params_hash = leasehold::blake3::hash(init_params)};
  save(state);
  storage_.put(encoder_, key::make_key(key::kNextEntityIdKey),
               instance_id + 1);

  result.data = encoder_.encode(instance_id);
  result.info = std::to_string(instance_id);
  record(result, audit_event_type_t::instance_minted, instance_id,
         {attribute("template", std::to_string(template_id)),
          attribute("renter", to_hex(renter)),
          attribute("expiry", std::to_string(lease_expiry))});
  spdlog::info("Minted instance {} of template {} for {}", instance_id,
               template_id, to_hex(renter));
  return result;
}

operation_result_t access_router::deposit(const address_t& caller,
                                          const entity_id_t entity_id,
                                          const amount_t& amount) {
  auto lock = std::scoped_lock{mutex_};
  auto state = load(entity_id);
  if (!state) {
    return entity_missing();
  }
  if (state->status == entity_status_t::terminated) {
    return entity_terminated();
  }
  if (amount == 0) {
    return make_error(error_code_t::invalid_argument, "deposit is zero",
                      kCodespace);
  }
  auto result = vault_.deposit(options_.self, entity_id, amount);
  if (!result.ok()) {
    return result;
  }
  record(result, audit_event_type_t::deposit, entity_id,
         {attribute("from", to_hex(caller)), attribute("amount", amount.str())});
  return result;
}

operation_result_t access_router::withdraw(const address_t& caller,
                                           const entity_id_t entity_id,
                                           const amount_t& amount) {
  auto lock = std::scoped_lock{mutex_};
  auto state = load(entity_id);
  if (!state) {
    return entity_missing();
  }
  if (state->owner != caller) {
    return make_error(error_code_t::authorization_denied,
                      "only the owner may withdraw", kCodespace);
  }
  if (state->status == entity_status_t::paused) {
    return make_error(error_code_t::entity_paused, "entity is paused",
                      kCodespace);
  }
  auto result = vault_.withdraw(options_.self, entity_id, state->owner, amount);
  if (!result.ok()) {
    return result;
  }
  record(result, audit_event_type_t::withdrawal, entity_id,
         {attribute("to", to_hex(state->owner)),
          attribute("amount", amount.str())});
  return result;
}

operation_result_t access_router::execute(const address_t& caller,
                                          const entity_id_t entity_id,
                                          const action_t& action) {
  auto lock = std::scoped_lock{mutex_};
  auto state = load(entity_id);
  if (!state) {
    return entity_missing();
  }
  if (state->status == entity_status_t::terminated) {
    return entity_terminated();
  }
  if (state->status == entity_status_t::paused) {
    return make_error(error_code_t::entity_paused, "entity is paused",
                      kCodespace);
  }

  auto error = operation_result_t{};
  auto role = resolve_role(*state, caller, error);
  if (role == caller_role_t::none) {
    spdlog::warn("Rejected action on entity {} from {}: {}", entity_id,
                 to_hex(caller), error.log);
    return error;
  }

  auto now = clock_();
  auto constrained = role != caller_role_t::plain_owner;
  if (constrained) {
    auto verdict = engine_.validate(entity_id, caller, action, now);
    if (!verdict.ok()) {
      spdlog::warn("Policy rejected action on entity {} from {} ({}): {}",
                   entity_id, to_hex(caller), to_string(role), verdict.log);
      return verdict;
    }
  }

  auto result = vault_.forward(options_.self, entity_id, action);
  if (!result.ok()) {
    return result;
  }

  if (constrained) {
    auto committed = engine_.commit(options_.self, entity_id, action, now);
    for (auto& event : committed.events) {
      record(result, event.type, entity_id, std::move(event.attributes));
    }
  }

  state->last_action_at = now;
  save(*state);
  auto instruction = leasehold::decoder::decode_instruction(
      action.destination,
      bytes_view_t{action.payload.data(), action.payload.size()});
  record(result, audit_event_type_t::action_executed, entity_id,
         {attribute("caller", to_hex(caller)),
          attribute("role", std::string{to_string(role)}),
          attribute("destination", to_hex(action.destination)),
          attribute("value", action.value.str()),
          attribute("instruction",
                    leasehold::decoder::instruction_id(instruction)),
          attribute("success", "true")});
  spdlog::debug("Executed action on entity {} from {} ({})", entity_id,
                to_hex(caller), to_string(role));
  return result;
}

operation_result_t access_router::approve_plugin(const address_t& caller,
                                                 const policy_type_t type) {
  auto lock = std::scoped_lock{mutex_};
  return engine_.approve_plugin(caller, type);
}

operation_result_t access_router::revoke_plugin(const address_t& caller,
                                                const policy_type_t type) {
  auto lock = std::scoped_lock{mutex_};
  return engine_.revoke_plugin(caller, type);
}

operation_result_t access_router::add_template_policy(
    const address_t& caller,
    const entity_id_t entity_id,
    const policy_type_t type) {
  auto lock = std::scoped_lock{mutex_};
  return engine_.add_template_policy(caller, entity_id, type);
}

operation_result_t access_router::remove_template_policy(
    const address_t& caller,
    const entity_id_t entity_id,
    const policy_type_t type) {
  auto lock = std::scoped_lock{mutex_};
  return engine_.remove_template_policy(caller, entity_id, type);
}

operation_result_t access_router::add_instance_policy(
    const address_t& caller,
    const entity_id_t entity_id,
    const policy_type_t type) {
  auto lock = std::scoped_lock{mutex_};
  return engine_.add_instance_policy(caller, entity_id, type);
}

operation_result_t access_router::remove_instance_policy(
    const address_t& caller,
    const entity_id_t entity_id,
    const policy_type_t type) {
  auto lock = std::scoped_lock{mutex_};
  return engine_.remove_instance_policy(caller, entity_id, type);
}

template <typename Apply>
operation_result_t access_router::configure(const address_t& caller,
                                            const entity_id_t entity_id,
                                            const policy_type_t type,
                                            Apply&& apply) {
  auto lock = std::scoped_lock{mutex_};
  auto state = load(entity_id);
  if (state && state->status == entity_status_t::terminated) {
    return entity_terminated();
  }
  auto error = operation_result_t{};
  auto scope = engine_.authorize_configuration(caller, entity_id, type, error);
  if (!scope) {
    return error;
  }
  return apply(*scope);
}

operation_result_t access_router::add_whitelisted_token(
    const address_t& caller,
    const entity_id_t entity_id,
    const address_t& token) {
  return configure(caller, entity_id, policy_type_t::token_whitelist,
                   [&](const leasehold::policy::configuration_scope_t& scope) {
                     return token_whitelist_->add(scope, token);
                   });
}

operation_result_t access_router::remove_whitelisted_token(
    const address_t& caller,
    const entity_id_t entity_id,
    const address_t& token) {
  return configure(caller, entity_id, policy_type_t::token_whitelist,
                   [&](const leasehold::policy::configuration_scope_t& scope) {
                     return token_whitelist_->remove(scope, token);
                   });
}

operation_result_t access_router::add_whitelisted_destination(
    const address_t& caller,
    const entity_id_t entity_id,
    const address_t& destination) {
  return configure(caller, entity_id, policy_type_t::destination_whitelist,
                   [&](const leasehold::policy::configuration_scope_t& scope) {
                     return destination_whitelist_->add(scope, destination);
                   });
}

operation_result_t access_router::remove_whitelisted_destination(
    const address_t& caller,
    const entity_id_t entity_id,
    const address_t& destination) {
  return configure(caller, entity_id, policy_type_t::destination_whitelist,
                   [&](const leasehold::policy::configuration_scope_t& scope) {
                     return destination_whitelist_->remove(scope, destination);
                   });
}

operation_result_t access_router::set_spend_limits(
    const address_t& caller,
    const entity_id_t entity_id,
    const spend_limit_config_t& limits) {
  return configure(caller, entity_id, policy_type_t::spend_limit,
                   [&](const leasehold::policy::configuration_scope_t& scope) {
                     return spend_limit_->set_limits(scope, limits);
                   });
}

operation_result_t access_router::set_cooldown(
    const address_t& caller,
    const entity_id_t entity_id,
    const duration_milliseconds_t minimum_interval) {
  return configure(caller, entity_id, policy_type_t::cooldown,
                   [&](const leasehold::policy::configuration_scope_t& scope) {
                     return cooldown_->set_interval(scope, minimum_interval);
                   });
}

std::optional<entity_state_t> access_router::entity(
    const entity_id_t entity_id) const {
  auto lock = std::scoped_lock{mutex_};
  return load(entity_id);
}

std::optional<address_t> access_router::renter_of(
    const entity_id_t entity_id) const {
  auto lock = std::scoped_lock{mutex_};
  return active_renter_of(entity_id);
}

std::optional<address_t> access_router::operator_of(
    const entity_id_t entity_id) const {
  auto lock = std::scoped_lock{mutex_};
  auto state = load(entity_id);
  if (!state || !state->operator_address || !lease_active(*state) ||
      clock_() >= state->operator_expiry) {
    return std::nullopt;
  }
  return state->operator_address;
}

uint64_t access_router::request_nonce(const address_t& signer) const {
  auto lock = std::scoped_lock{mutex_};
  return storage_
      .get<uint64_t>(encoder_, key::make_request_nonce_key(signer))
      .value_or(uint64_t{0});
}

uint64_t access_router::operator_nonce(const entity_id_t entity_id) const {
  auto lock = std::scoped_lock{mutex_};
  auto state = load(entity_id);
  return state ? state->operator_nonce : 0;
}

amount_t access_router::balance_of(const entity_id_t entity_id) const {
  auto lock = std::scoped_lock{mutex_};
  return vault_.balance(entity_id);
}

std::vector<audit_event_t> access_router::events(
    const uint64_t from_event_id,
    const std::size_t limit) const {
  auto lock = std::scoped_lock{mutex_};
  auto out = std::vector<audit_event_t>{};
  for (auto event_id = std::max<uint64_t>(from_event_id, 1);
       out.size() < limit; ++event_id) {
    auto event =
        storage_.get<audit_event_t>(encoder_, key::make_event_key(event_id));
    if (!event) {
      break;
    }
    out.push_back(std::move(*event));
  }
  return out;
}

std::optional<std::vector<policy_type_t>> access_router::active_policies(
    const entity_id_t entity_id) const {
  auto lock = std::scoped_lock{mutex_};
  return engine_.active_policies(entity_id);
}

const leasehold::crypto::signing_domain& access_router::signing_domain()
    const {
  return domain_;
}

const leasehold::policy::engine& access_router::policy_engine() const {
  return engine_;
}

std::optional<address_t> access_router::owner_of(
    const entity_id_t entity_id) const {
  auto state = load(entity_id);
  if (!state) {
    return std::nullopt;
  }
  return state->owner;
}

std::optional<address_t> access_router::active_renter_of(
    const entity_id_t entity_id) const {
  auto state = load(entity_id);
  if (!state || !lease_active(*state)) {
    return std::nullopt;
  }
  return state->renter;
}

std::optional<address_t> access_router::vault_of(
    const entity_id_t entity_id) const {
  auto state = load(entity_id);
  if (!state) {
    return std::nullopt;
  }
  return state->vault;
}

std::optional<entity_id_t> access_router::template_of(
    const entity_id_t entity_id) const {
  auto state = load(entity_id);
  if (!state) {
    return std::nullopt;
  }
  return state->template_id;
}

}  // namespace leasehold::router
