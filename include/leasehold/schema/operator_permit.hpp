#pragma once

#include <leasehold/schema/primitives.hpp>

// Schema type: operator permit.
// Off-line signed delegation of renter rights to an operator. `expiry` bounds
// the delegation itself, `deadline` bounds when the permit may be submitted.
namespace leasehold::schema {

template <uint16_t Version>
struct operator_permit;

template <>
struct operator_permit<1> final {
  uint16_t version{1};
  entity_id_t entity_id{};
  address_t renter{};
  address_t operator_address{};
  timestamp_milliseconds_t expiry{};
  uint64_t nonce{};
  timestamp_milliseconds_t deadline{};
};

using operator_permit_t = operator_permit<1>;

}  // namespace leasehold::schema
