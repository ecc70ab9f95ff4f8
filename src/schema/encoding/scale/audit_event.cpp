#include <leasehold/schema/encoding/scale/audit_event.hpp>

using namespace leasehold::schema;

namespace leasehold::schema::encoding::scale {

void encode(audit_event_attribute<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.key, encoder);
  encode(o.value, encoder);
}

void decode(audit_event_attribute<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.key, decoder);
  decode(o.value, decoder);
}

void encode(audit_event<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.event_id, encoder);
  encode(o.type, encoder);
  encode(o.entity_id, encoder);
  encode(o.recorded_at, encoder);
  encode(o.attributes, encoder);
}

void decode(audit_event<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.event_id, decoder);
  decode(o.type, decoder);
  decode(o.entity_id, decoder);
  decode(o.recorded_at, decoder);
  decode(o.attributes, decoder);
}

}  // namespace leasehold::schema::encoding::scale
