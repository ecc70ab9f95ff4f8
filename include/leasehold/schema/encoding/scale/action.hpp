#pragma once
#include <leasehold/schema/action.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace leasehold::schema::encoding::scale {

void encode(action<1>&& o, ::scale::Encoder& encoder);
void decode(action<1>&& o, ::scale::Decoder& decoder);

}  // namespace leasehold::schema::encoding::scale
