#pragma once
#include <leasehold/schema/spend_window_state.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace leasehold::schema::encoding::scale {

void encode(spend_window_state<1>&& o, ::scale::Encoder& encoder);
void decode(spend_window_state<1>&& o, ::scale::Decoder& decoder);

}  // namespace leasehold::schema::encoding::scale
