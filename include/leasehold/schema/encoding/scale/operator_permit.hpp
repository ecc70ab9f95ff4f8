#pragma once
#include <leasehold/schema/operator_permit.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace leasehold::schema::encoding::scale {

void encode(operator_permit<1>&& o, ::scale::Encoder& encoder);
void decode(operator_permit<1>&& o, ::scale::Decoder& decoder);

}  // namespace leasehold::schema::encoding::scale
