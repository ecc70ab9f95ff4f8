#pragma once
#include <leasehold/schema/entity_state.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace leasehold::schema::encoding::scale {

void encode(entity_state<1>&& o, ::scale::Encoder& encoder);
void decode(entity_state<1>&& o, ::scale::Decoder& decoder);

}  // namespace leasehold::schema::encoding::scale
