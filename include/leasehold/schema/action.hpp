#pragma once

#include <leasehold/schema/primitives.hpp>

// Schema type: action.
// Destination/value/payload triple submitted for execution against an
// entity's vault. Every field is explicit; the payload is never mutated.
namespace leasehold::schema {

template <uint16_t Version>
struct action;

template <>
struct action<1> final {
  uint16_t version{1};
  address_t destination{};
  amount_t value{};
  bytes_t payload;
};

using action_t = action<1>;

}  // namespace leasehold::schema
