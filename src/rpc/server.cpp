#include <spdlog/spdlog.h>
#include <leasehold/rpc/server.hpp>
#include <algorithm>
#include <array>
#include <iterator>
#include <optional>
#include <string>
#include <utility>

using namespace leasehold::rpc;
using namespace leasehold::schema;

namespace {

grpc::ServerUnaryReactor* finish(grpc::CallbackServerContext* context,
                                 const grpc::Status& status) {
  auto* reactor = context->DefaultReactor();
  reactor->Finish(status);
  return reactor;
}

grpc::ServerUnaryReactor* finish_ok(grpc::CallbackServerContext* context) {
  return finish(context, grpc::Status::OK);
}

grpc::ServerUnaryReactor* finish_invalid(grpc::CallbackServerContext* context,
                                         const std::string& message) {
  spdlog::warn("Rejected malformed request: {}", message);
  return finish(context,
                grpc::Status{grpc::StatusCode::INVALID_ARGUMENT, message});
}

template <std::size_t N>
std::optional<std::array<uint8_t, N>> try_make_fixed(const std::string& value) {
  if (value.size() != N) {
    return std::nullopt;
  }
  auto out = std::array<uint8_t, N>{};
  std::copy_n(std::begin(value), N, std::begin(out));
  return out;
}

/// Amounts travel as at most 32 big-endian bytes; empty is zero.
std::optional<amount_t> try_make_amount(const std::string& value) {
  if (value.size() > 32) {
    return std::nullopt;
  }
  auto amount = amount_t{};
  if (!value.empty()) {
    auto bytes = bytes_t{std::begin(value), std::end(value)};
    boost::multiprecision::import_bits(amount, std::begin(bytes),
                                       std::end(bytes), 8, true);
  }
  return amount;
}

std::string make_amount_string(const amount_t& amount) {
  auto word = std::string(32, '\0');
  auto bytes = bytes_t{};
  boost::multiprecision::export_bits(amount, std::back_inserter(bytes), 8,
                                     true);
  std::copy(std::begin(bytes), std::end(bytes),
            std::end(word) - static_cast<std::ptrdiff_t>(bytes.size()));
  return word;
}

std::string make_address_string(const address_t& address) {
  return std::string{std::begin(address), std::end(address)};
}

void populate_event(const audit_event_t& source,
                    leasehold::v1::AuditEvent* destination) {
  destination->set_event_id(source.event_id);
  destination->set_type(std::string{to_string(source.type)});
  destination->set_entity_id(source.entity_id);
  destination->set_recorded_at(source.recorded_at);
  for (const auto& attribute : source.attributes) {
    auto* out = destination->add_attributes();
    out->set_key(attribute.key);
    out->set_value(attribute.value);
  }
}

void populate_result(const operation_result_t& source,
                     leasehold::v1::OperationResult* destination) {
  destination->set_code(static_cast<uint32_t>(source.code));
  destination->set_log(source.log);
  destination->set_info(source.info);
  destination->set_codespace(source.codespace);
  destination->set_data(make_string(source.data));
  for (const auto& event : source.events) {
    populate_event(event, destination->add_events());
  }
}

/// Signed envelope of a request, or std::nullopt when the signer or the
/// signature has the wrong width.
std::optional<std::pair<router_request_t, signature_t>> try_make_request(
    const leasehold::router::access_router& router,
    const leasehold::v1::Authorization& auth,
    router_call_t call) {
  auto signer = try_make_fixed<20>(auth.signer());
  auto signature = try_make_fixed<65>(auth.signature());
  if (!signer || !signature) {
    return std::nullopt;
  }
  return std::pair{
      router_request_t{.network_id = router.signing_domain().network_id,
                       .nonce = auth.nonce(),
                       .signer = *signer,
                       .call = std::move(call)},
      *signature};
}

grpc::ServerUnaryReactor* submit(leasehold::router::access_router& router,
                                 grpc::CallbackServerContext* context,
                                 const leasehold::v1::Authorization& auth,
                                 router_call_t call,
                                 leasehold::v1::OperationResult* response) {
  auto request = try_make_request(router, auth, std::move(call));
  if (!request) {
    return finish_invalid(context,
                          "signer must be 20 bytes and the signature 65");
  }
  populate_result(router.submit(request->first, request->second), response);
  return finish_ok(context);
}

std::optional<policy_type_t> try_make_policy_type(const std::string& name) {
  return try_from_string<policy_type_t>(name);
}

}  // namespace

listener::listener(leasehold::router::access_router& router)
    : router_{router} {}

grpc::ServerUnaryReactor* listener::MintEntity(
    grpc::CallbackServerContext* context,
    const leasehold::v1::MintEntityRequest* request,
    leasehold::v1::OperationResult* response) {
  auto owner = try_make_fixed<20>(request->owner());
  if (!owner) {
    return finish_invalid(context, "owner must be 20 bytes");
  }
  return submit(router_, context, request->auth(),
                mint_entity_t{.owner = *owner}, response);
}

grpc::ServerUnaryReactor* listener::TransferEntity(
    grpc::CallbackServerContext* context,
    const leasehold::v1::TransferEntityRequest* request,
    leasehold::v1::OperationResult* response) {
  auto new_owner = try_make_fixed<20>(request->new_owner());
  if (!new_owner) {
    return finish_invalid(context, "new owner must be 20 bytes");
  }
  return submit(router_, context, request->auth(),
                transfer_entity_t{.entity_id = request->entity_id(),
                                  .new_owner = *new_owner},
                response);
}

grpc::ServerUnaryReactor* listener::Pause(
    grpc::CallbackServerContext* context,
    const leasehold::v1::EntityCommandRequest* request,
    leasehold::v1::OperationResult* response) {
  return submit(router_, context, request->auth(),
                change_status_t{.entity_id = request->entity_id(),
                                .change = lifecycle_change_t::pause},
                response);
}

grpc::ServerUnaryReactor* listener::Unpause(
    grpc::CallbackServerContext* context,
    const leasehold::v1::EntityCommandRequest* request,
    leasehold::v1::OperationResult* response) {
  return submit(router_, context, request->auth(),
                change_status_t{.entity_id = request->entity_id(),
                                .change = lifecycle_change_t::unpause},
                response);
}

grpc::ServerUnaryReactor* listener::Terminate(
    grpc::CallbackServerContext* context,
    const leasehold::v1::EntityCommandRequest* request,
    leasehold::v1::OperationResult* response) {
  return submit(router_, context, request->auth(),
                change_status_t{.entity_id = request->entity_id(),
                                .change = lifecycle_change_t::terminate},
                response);
}

grpc::ServerUnaryReactor* listener::AssignLease(
    grpc::CallbackServerContext* context,
    const leasehold::v1::AssignLeaseRequest* request,
    leasehold::v1::OperationResult* response) {
  auto renter = try_make_fixed<20>(request->renter());
  if (!renter) {
    return finish_invalid(context, "renter must be 20 bytes");
  }
  return submit(router_, context, request->auth(),
                assign_lease_t{.entity_id = request->entity_id(),
                               .renter = *renter,
                               .expiry = request->expiry()},
                response);
}

grpc::ServerUnaryReactor* listener::ExtendLease(
    grpc::CallbackServerContext* context,
    const leasehold::v1::ExtendLeaseRequest* request,
    leasehold::v1::OperationResult* response) {
  return submit(router_, context, request->auth(),
                extend_lease_t{.entity_id = request->entity_id(),
                               .expiry = request->expiry()},
                response);
}

grpc::ServerUnaryReactor* listener::SetOperator(
    grpc::CallbackServerContext* context,
    const leasehold::v1::SetOperatorRequest* request,
    leasehold::v1::OperationResult* response) {
  auto operator_address = try_make_fixed<20>(request->operator_address());
  if (!operator_address) {
    return finish_invalid(context, "operator must be 20 bytes");
  }
  return submit(router_, context, request->auth(),
                set_operator_t{.entity_id = request->entity_id(),
                               .operator_address = *operator_address,
                               .expiry = request->expiry()},
                response);
}

grpc::ServerUnaryReactor* listener::SetOperatorWithPermit(
    grpc::CallbackServerContext* context,
    const leasehold::v1::SetOperatorWithPermitRequest* request,
    leasehold::v1::OperationResult* response) {
  const auto& permit = request->permit();
  auto renter = try_make_fixed<20>(permit.renter());
  auto operator_address = try_make_fixed<20>(permit.operator_address());
  auto permit_signature = try_make_fixed<65>(request->permit_signature());
  if (!renter || !operator_address || !permit_signature) {
    return finish_invalid(context,
                          "addresses must be 20 bytes and the signature 65");
  }
  auto decoded = operator_permit_t{.entity_id = permit.entity_id(),
                                   .renter = *renter,
                                   .operator_address = *operator_address,
                                   .expiry = permit.expiry(),
                                   .nonce = permit.nonce(),
                                   .deadline = permit.deadline()};
  return submit(router_, context, request->auth(),
                apply_operator_permit_t{.permit = decoded,
                                        .permit_signature = *permit_signature},
                response);
}

grpc::ServerUnaryReactor* listener::ClearOperator(
    grpc::CallbackServerContext* context,
    const leasehold::v1::EntityCommandRequest* request,
    leasehold::v1::OperationResult* response) {
  return submit(router_, context, request->auth(),
                clear_operator_t{.entity_id = request->entity_id()}, response);
}

grpc::ServerUnaryReactor* listener::RegisterTemplate(
    grpc::CallbackServerContext* context,
    const leasehold::v1::EntityCommandRequest* request,
    leasehold::v1::OperationResult* response) {
  return submit(router_, context, request->auth(),
                register_template_t{.entity_id = request->entity_id()},
                response);
}

grpc::ServerUnaryReactor* listener::MintInstance(
    grpc::CallbackServerContext* context,
    const leasehold::v1::MintInstanceRequest* request,
    leasehold::v1::OperationResult* response) {
  auto renter = try_make_fixed<20>(request->renter());
  if (!renter) {
    return finish_invalid(context, "renter must be 20 bytes");
  }
  return submit(router_, context, request->auth(),
                mint_instance_t{.template_id = request->template_id(),
                                .renter = *renter,
                                .lease_expiry = request->lease_expiry(),
                                .init_params =
                                    make_bytes(request->init_params())},
                response);
}

grpc::ServerUnaryReactor* listener::Deposit(
    grpc::CallbackServerContext* context,
    const leasehold::v1::DepositRequest* request,
    leasehold::v1::OperationResult* response) {
  auto amount = try_make_amount(request->amount());
  if (!amount) {
    return finish_invalid(context, "amount must be at most 32 bytes");
  }
  return submit(router_, context, request->auth(),
                deposit_funds_t{.entity_id = request->entity_id(),
                                .amount = *amount},
                response);
}

grpc::ServerUnaryReactor* listener::Withdraw(
    grpc::CallbackServerContext* context,
    const leasehold::v1::WithdrawRequest* request,
    leasehold::v1::OperationResult* response) {
  auto amount = try_make_amount(request->amount());
  if (!amount) {
    return finish_invalid(context, "amount must be at most 32 bytes");
  }
  return submit(router_, context, request->auth(),
                withdraw_funds_t{.entity_id = request->entity_id(),
                                 .amount = *amount},
                response);
}

grpc::ServerUnaryReactor* listener::Execute(
    grpc::CallbackServerContext* context,
    const leasehold::v1::ExecuteRequest* request,
    leasehold::v1::OperationResult* response) {
  auto destination = try_make_fixed<20>(request->destination());
  auto value = try_make_amount(request->value());
  if (!destination || !value) {
    return finish_invalid(context,
                          "destination must be 20 bytes, value at most 32 "
                          "bytes");
  }
  auto action = action_t{.destination = *destination,
                         .value = *value,
                         .payload = make_bytes(request->payload())};
  return submit(router_, context, request->auth(),
                execute_action_t{.entity_id = request->entity_id(),
                                 .action = std::move(action)},
                response);
}

grpc::ServerUnaryReactor* listener::SetPluginApproval(
    grpc::CallbackServerContext* context,
    const leasehold::v1::SetPluginApprovalRequest* request,
    leasehold::v1::OperationResult* response) {
  auto type = try_make_policy_type(request->policy_type());
  if (!type) {
    return finish_invalid(context,
                          "unknown policy type '" + request->policy_type() +
                              "'");
  }
  return submit(router_, context, request->auth(),
                set_plugin_approval_t{.type = *type,
                                      .approved = request->approved()},
                response);
}

grpc::ServerUnaryReactor* listener::UpdatePolicyList(
    grpc::CallbackServerContext* context,
    const leasehold::v1::UpdatePolicyListRequest* request,
    leasehold::v1::OperationResult* response) {
  auto type = try_make_policy_type(request->policy_type());
  if (!type) {
    return finish_invalid(context,
                          "unknown policy type '" + request->policy_type() +
                              "'");
  }
  auto list = std::optional<policy_list_t>{};
  switch (request->list()) {
    case leasehold::v1::POLICY_LIST_TEMPLATE:
      list = policy_list_t::template_list;
      break;
    case leasehold::v1::POLICY_LIST_INSTANCE:
      list = policy_list_t::instance_list;
      break;
    default:
      break;
  }
  if (!list) {
    return finish_invalid(context, "policy list must be template or instance");
  }
  return submit(router_, context, request->auth(),
                update_policy_list_t{.entity_id = request->entity_id(),
                                     .list = *list,
                                     .type = *type,
                                     .add = request->add()},
                response);
}

grpc::ServerUnaryReactor* listener::UpdateWhitelist(
    grpc::CallbackServerContext* context,
    const leasehold::v1::UpdateWhitelistRequest* request,
    leasehold::v1::OperationResult* response) {
  auto address = try_make_fixed<20>(request->address());
  if (!address) {
    return finish_invalid(context, "address must be 20 bytes");
  }
  auto kind = std::optional<whitelist_kind_t>{};
  switch (request->kind()) {
    case leasehold::v1::WHITELIST_KIND_TOKEN:
      kind = whitelist_kind_t::token;
      break;
    case leasehold::v1::WHITELIST_KIND_DESTINATION:
      kind = whitelist_kind_t::destination;
      break;
    default:
      break;
  }
  if (!kind) {
    return finish_invalid(context, "whitelist must be token or destination");
  }
  return submit(router_, context, request->auth(),
                update_whitelist_t{.entity_id = request->entity_id(),
                                   .kind = *kind,
                                   .address = *address,
                                   .add = request->add()},
                response);
}

grpc::ServerUnaryReactor* listener::SetSpendLimits(
    grpc::CallbackServerContext* context,
    const leasehold::v1::SetSpendLimitsRequest* request,
    leasehold::v1::OperationResult* response) {
  auto per_call = try_make_amount(request->max_per_call());
  auto per_day = try_make_amount(request->max_per_day());
  auto approve = try_make_amount(request->max_approve());
  if (!per_call || !per_day || !approve) {
    return finish_invalid(context, "limits must be at most 32 bytes");
  }
  return submit(router_, context, request->auth(),
                set_spend_limits_t{
                    .entity_id = request->entity_id(),
                    .limits = spend_limit_config_t{.max_per_call = *per_call,
                                                   .max_per_day = *per_day,
                                                   .max_approve = *approve}},
                response);
}

grpc::ServerUnaryReactor* listener::SetCooldown(
    grpc::CallbackServerContext* context,
    const leasehold::v1::SetCooldownRequest* request,
    leasehold::v1::OperationResult* response) {
  return submit(router_, context, request->auth(),
                set_cooldown_t{.entity_id = request->entity_id(),
                               .minimum_interval = request->minimum_interval()},
                response);
}

grpc::ServerUnaryReactor* listener::GetEntity(
    grpc::CallbackServerContext* context,
    const leasehold::v1::GetEntityRequest* request,
    leasehold::v1::GetEntityResponse* response) {
  auto state = router_.entity(request->entity_id());
  if (!state) {
    response->set_found(false);
    return finish_ok(context);
  }
  response->set_found(true);
  auto* entity = response->mutable_entity();
  entity->set_entity_id(state->entity_id);
  entity->set_owner(make_address_string(state->owner));
  if (auto renter = router_.renter_of(state->entity_id)) {
    entity->set_renter(make_address_string(*renter));
    entity->set_lease_expiry(state->lease_expiry);
  }
  if (auto operator_address = router_.operator_of(state->entity_id)) {
    entity->set_operator_address(make_address_string(*operator_address));
    entity->set_operator_expiry(state->operator_expiry);
  }
  entity->set_operator_nonce(state->operator_nonce);
  entity->set_status(std::string{to_string(state->status)});
  entity->set_vault(make_address_string(state->vault));
  entity->set_template_id(state->template_id.value_or(0));
  entity->set_balance(make_amount_string(router_.balance_of(state->entity_id)));
  if (auto active = router_.active_policies(state->entity_id)) {
    for (auto type : *active) {
      entity->add_active_policies(std::string{to_string(type)});
    }
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::ListEvents(
    grpc::CallbackServerContext* context,
    const leasehold::v1::ListEventsRequest* request,
    leasehold::v1::ListEventsResponse* response) {
  auto limit = request->limit() == 0 ? 100u : std::min(request->limit(), 1000u);
  for (const auto& event : router_.events(request->from_event_id(), limit)) {
    populate_event(event, response->add_events());
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::GetRequestNonce(
    grpc::CallbackServerContext* context,
    const leasehold::v1::GetRequestNonceRequest* request,
    leasehold::v1::GetRequestNonceResponse* response) {
  auto signer = try_make_fixed<20>(request->signer());
  if (!signer) {
    return finish_invalid(context, "signer must be 20 bytes");
  }
  response->set_nonce(router_.request_nonce(*signer));
  return finish_ok(context);
}
