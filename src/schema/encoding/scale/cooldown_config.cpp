#include <leasehold/schema/encoding/scale/cooldown_config.hpp>

using namespace leasehold::schema;

namespace leasehold::schema::encoding::scale {

void encode(cooldown_config<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.minimum_interval, encoder);
}

void decode(cooldown_config<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.minimum_interval, decoder);
}

}  // namespace leasehold::schema::encoding::scale
