#include <leasehold/schema/encoding/scale/action.hpp>
#include <leasehold/schema/encoding/scale/operator_permit.hpp>
#include <leasehold/schema/encoding/scale/router_request.hpp>
#include <leasehold/schema/encoding/scale/spend_limit_config.hpp>

using namespace leasehold::schema;

namespace leasehold::schema::encoding::scale {

void encode(mint_entity<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.owner, encoder);
}

void decode(mint_entity<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.owner, decoder);
}

void encode(transfer_entity<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.entity_id, encoder);
  encode(o.new_owner, encoder);
}

void decode(transfer_entity<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.entity_id, decoder);
  decode(o.new_owner, decoder);
}

void encode(change_status<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.entity_id, encoder);
  encode(o.change, encoder);
}

void decode(change_status<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.entity_id, decoder);
  decode(o.change, decoder);
}

void encode(assign_lease<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.entity_id, encoder);
  encode(o.renter, encoder);
  encode(o.expiry, encoder);
}

void decode(assign_lease<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.entity_id, decoder);
  decode(o.renter, decoder);
  decode(o.expiry, decoder);
}

void encode(extend_lease<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.entity_id, encoder);
  encode(o.expiry, encoder);
}

void decode(extend_lease<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.entity_id, decoder);
  decode(o.expiry, decoder);
}

void encode(set_operator<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.entity_id, encoder);
  encode(o.operator_address, encoder);
  encode(o.expiry, encoder);
}

void decode(set_operator<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.entity_id, decoder);
  decode(o.operator_address, decoder);
  decode(o.expiry, decoder);
}

void encode(clear_operator<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.entity_id, encoder);
}

void decode(clear_operator<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.entity_id, decoder);
}

void encode(apply_operator_permit<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.permit, encoder);
  encode(o.permit_signature, encoder);
}

void decode(apply_operator_permit<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.permit, decoder);
  decode(o.permit_signature, decoder);
}

void encode(register_template<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.entity_id, encoder);
}

void decode(register_template<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.entity_id, decoder);
}

void encode(mint_instance<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.template_id, encoder);
  encode(o.renter, encoder);
  encode(o.lease_expiry, encoder);
  encode(o.init_params, encoder);
}

void decode(mint_instance<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.template_id, decoder);
  decode(o.renter, decoder);
  decode(o.lease_expiry, decoder);
  decode(o.init_params, decoder);
}

void encode(deposit_funds<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.entity_id, encoder);
  encode(o.amount, encoder);
}

void decode(deposit_funds<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.entity_id, decoder);
  decode(o.amount, decoder);
}

void encode(withdraw_funds<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.entity_id, encoder);
  encode(o.amount, encoder);
}

void decode(withdraw_funds<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.entity_id, decoder);
  decode(o.amount, decoder);
}

void encode(execute_action<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.entity_id, encoder);
  encode(o.action, encoder);
}

void decode(execute_action<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.entity_id, decoder);
  decode(o.action, decoder);
}

void encode(set_plugin_approval<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.type, encoder);
  encode(o.approved, encoder);
}

void decode(set_plugin_approval<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.type, decoder);
  decode(o.approved, decoder);
}

void encode(update_policy_list<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.entity_id, encoder);
  encode(o.list, encoder);
  encode(o.type, encoder);
  encode(o.add, encoder);
}

void decode(update_policy_list<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.entity_id, decoder);
  decode(o.list, decoder);
  decode(o.type, decoder);
  decode(o.add, decoder);
}

void encode(update_whitelist<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.entity_id, encoder);
  encode(o.kind, encoder);
  encode(o.address, encoder);
  encode(o.add, encoder);
}

void decode(update_whitelist<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.entity_id, decoder);
  decode(o.kind, decoder);
  decode(o.address, decoder);
  decode(o.add, decoder);
}

void encode(set_spend_limits<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.entity_id, encoder);
  encode(o.limits, encoder);
}

void decode(set_spend_limits<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.entity_id, decoder);
  decode(o.limits, decoder);
}

void encode(set_cooldown<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.entity_id, encoder);
  encode(o.minimum_interval, encoder);
}

void decode(set_cooldown<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.entity_id, decoder);
  decode(o.minimum_interval, decoder);
}

void encode(router_request<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.network_id, encoder);
  encode(o.nonce, encoder);
  encode(o.signer, encoder);
  encode(o.call, encoder);
}

void decode(router_request<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.network_id, decoder);
  decode(o.nonce, decoder);
  decode(o.signer, decoder);
  decode(o.call, decoder);
}

}  // namespace leasehold::schema::encoding::scale
