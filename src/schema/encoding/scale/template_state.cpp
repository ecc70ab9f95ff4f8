#include <leasehold/schema/encoding/scale/template_state.hpp>

using namespace leasehold::schema;

namespace leasehold::schema::encoding::scale {

void encode(template_state<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.entity_id, encoder);
  encode(o.frozen, encoder);
  encode(o.policies, encoder);
}

void decode(template_state<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.entity_id, decoder);
  decode(o.frozen, decoder);
  decode(o.policies, decoder);
}

}  // namespace leasehold::schema::encoding::scale
