#include <leasehold/schema/encoding/scale/spend_limit_config.hpp>

using namespace leasehold::schema;

namespace leasehold::schema::encoding::scale {

void encode(spend_limit_config<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.max_per_call, encoder);
  encode(o.max_per_day, encoder);
  encode(o.max_approve, encoder);
}

void decode(spend_limit_config<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.max_per_call, decoder);
  decode(o.max_per_day, decoder);
  decode(o.max_approve, decoder);
}

}  // namespace leasehold::schema::encoding::scale
