#pragma once
#include <leasehold/schema/spend_limit_config.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace leasehold::schema::encoding::scale {

void encode(spend_limit_config<1>&& o, ::scale::Encoder& encoder);
void decode(spend_limit_config<1>&& o, ::scale::Decoder& decoder);

}  // namespace leasehold::schema::encoding::scale
