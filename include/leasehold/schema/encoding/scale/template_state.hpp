#pragma once
#include <leasehold/schema/template_state.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace leasehold::schema::encoding::scale {

void encode(template_state<1>&& o, ::scale::Encoder& encoder);
void decode(template_state<1>&& o, ::scale::Decoder& decoder);

}  // namespace leasehold::schema::encoding::scale
