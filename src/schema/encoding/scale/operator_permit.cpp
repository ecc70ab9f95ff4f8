#include <leasehold/schema/encoding/scale/operator_permit.hpp>

using namespace leasehold::schema;

namespace leasehold::schema::encoding::scale {

void encode(operator_permit<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.entity_id, encoder);
  encode(o.renter, encoder);
  encode(o.operator_address, encoder);
  encode(o.expiry, encoder);
  encode(o.nonce, encoder);
  encode(o.deadline, encoder);
}

void decode(operator_permit<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.entity_id, decoder);
  decode(o.renter, decoder);
  decode(o.operator_address, decoder);
  decode(o.expiry, decoder);
  decode(o.nonce, decoder);
  decode(o.deadline, decoder);
}

}  // namespace leasehold::schema::encoding::scale
