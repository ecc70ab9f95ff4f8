#pragma once
#include <leasehold/schema/audit_event.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace leasehold::schema::encoding::scale {

void encode(audit_event_attribute<1>&& o, ::scale::Encoder& encoder);
void decode(audit_event_attribute<1>&& o, ::scale::Decoder& decoder);

void encode(audit_event<1>&& o, ::scale::Encoder& encoder);
void decode(audit_event<1>&& o, ::scale::Decoder& decoder);

}  // namespace leasehold::schema::encoding::scale
