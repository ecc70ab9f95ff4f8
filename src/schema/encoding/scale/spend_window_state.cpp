#include <leasehold/schema/encoding/scale/spend_window_state.hpp>

using namespace leasehold::schema;

namespace leasehold::schema::encoding::scale {

void encode(spend_window_state<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.window_start, encoder);
  encode(o.spent, encoder);
}

void decode(spend_window_state<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.window_start, decoder);
  decode(o.spent, decoder);
}

}  // namespace leasehold::schema::encoding::scale
