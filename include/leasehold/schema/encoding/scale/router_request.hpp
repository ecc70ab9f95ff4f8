#pragma once
#include <leasehold/schema/router_request.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace leasehold::schema::encoding::scale {

void encode(mint_entity<1>&& o, ::scale::Encoder& encoder);
void decode(mint_entity<1>&& o, ::scale::Decoder& decoder);

void encode(transfer_entity<1>&& o, ::scale::Encoder& encoder);
void decode(transfer_entity<1>&& o, ::scale::Decoder& decoder);

void encode(change_status<1>&& o, ::scale::Encoder& encoder);
void decode(change_status<1>&& o, ::scale::Decoder& decoder);

void encode(assign_lease<1>&& o, ::scale::Encoder& encoder);
void decode(assign_lease<1>&& o, ::scale::Decoder& decoder);

void encode(extend_lease<1>&& o, ::scale::Encoder& encoder);
void decode(extend_lease<1>&& o, ::scale::Decoder& decoder);

void encode(set_operator<1>&& o, ::scale::Encoder& encoder);
void decode(set_operator<1>&& o, ::scale::Decoder& decoder);

void encode(clear_operator<1>&& o, ::scale::Encoder& encoder);
void decode(clear_operator<1>&& o, ::scale::Decoder& decoder);

void encode(apply_operator_permit<1>&& o, ::scale::Encoder& encoder);
void decode(apply_operator_permit<1>&& o, ::scale::Decoder& decoder);

void encode(register_template<1>&& o, ::scale::Encoder& encoder);
void decode(register_template<1>&& o, ::scale::Decoder& decoder);

void encode(mint_instance<1>&& o, ::scale::Encoder& encoder);
void decode(mint_instance<1>&& o, ::scale::Decoder& decoder);

void encode(deposit_funds<1>&& o, ::scale::Encoder& encoder);
void decode(deposit_funds<1>&& o, ::scale::Decoder& decoder);

void encode(withdraw_funds<1>&& o, ::scale::Encoder& encoder);
void decode(withdraw_funds<1>&& o, ::scale::Decoder& decoder);

void encode(execute_action<1>&& o, ::scale::Encoder& encoder);
void decode(execute_action<1>&& o, ::scale::Decoder& decoder);

void encode(set_plugin_approval<1>&& o, ::scale::Encoder& encoder);
void decode(set_plugin_approval<1>&& o, ::scale::Decoder& decoder);

void encode(update_policy_list<1>&& o, ::scale::Encoder& encoder);
void decode(update_policy_list<1>&& o, ::scale::Decoder& decoder);

void encode(update_whitelist<1>&& o, ::scale::Encoder& encoder);
void decode(update_whitelist<1>&& o, ::scale::Decoder& decoder);

void encode(set_spend_limits<1>&& o, ::scale::Encoder& encoder);
void decode(set_spend_limits<1>&& o, ::scale::Decoder& decoder);

void encode(set_cooldown<1>&& o, ::scale::Encoder& encoder);
void decode(set_cooldown<1>&& o, ::scale::Decoder& decoder);

void encode(router_request<1>&& o, ::scale::Encoder& encoder);
void decode(router_request<1>&& o, ::scale::Decoder& decoder);

}  // namespace leasehold::schema::encoding::scale
