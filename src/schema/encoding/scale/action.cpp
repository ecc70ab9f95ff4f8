#include <leasehold/schema/encoding/scale/action.hpp>

using namespace leasehold::schema;

namespace leasehold::schema::encoding::scale {

void encode(action<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.destination, encoder);
  encode(o.value, encoder);
  encode(o.payload, encoder);
}

void decode(action<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.destination, decoder);
  decode(o.value, decoder);
  decode(o.payload, decoder);
}

}  // namespace leasehold::schema::encoding::scale
