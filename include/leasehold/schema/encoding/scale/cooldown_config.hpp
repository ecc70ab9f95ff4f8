#pragma once
#include <leasehold/schema/cooldown_config.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace leasehold::schema::encoding::scale {

void encode(cooldown_config<1>&& o, ::scale::Encoder& encoder);
void decode(cooldown_config<1>&& o, ::scale::Decoder& decoder);

}  // namespace leasehold::schema::encoding::scale
