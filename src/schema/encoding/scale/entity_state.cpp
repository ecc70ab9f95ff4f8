#include <leasehold/schema/encoding/scale/entity_state.hpp>

using namespace leasehold::schema;

namespace leasehold::schema::encoding::scale {

void encode(entity_state<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.entity_id, encoder);
  encode(o.owner, encoder);
  encode(o.renter, encoder);
  encode(o.lease_expiry, encoder);
  encode(o.operator_address, encoder);
  encode(o.operator_expiry, encoder);
  encode(o.operator_nonce, encoder);
  encode(o.status, encoder);
  encode(o.vault, encoder);
  encode(o.template_id, encoder);
  encode(o.params_hash, encoder);
  encode(o.last_action_at, encoder);
}

void decode(entity_state<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.entity_id, decoder);
  decode(o.owner, decoder);
  decode(o.renter, decoder);
  decode(o.lease_expiry, decoder);
  decode(o.operator_address, decoder);
  decode(o.operator_expiry, decoder);
  decode(o.operator_nonce, decoder);
  decode(o.status, decoder);
  decode(o.vault, decoder);
  decode(o.template_id, decoder);
  decode(o.params_hash, decoder);
  decode(o.last_action_at, decoder);
}

}  // namespace leasehold::schema::encoding::scale
