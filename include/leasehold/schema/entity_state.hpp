#pragma once

#include <leasehold/schema/entity_status.hpp>
#include <leasehold/schema/primitives.hpp>
#include <optional>

// Schema type: entity state.
// Rentable entity record. Renter and operator are stored with their expiries
// and are read as absent once the expiry has passed.
namespace leasehold::schema {

template <uint16_t Version>
struct entity_state;

template <>
struct entity_state<1> final {
  uint16_t version{1};
  entity_id_t entity_id{};
  address_t owner{};
  std::optional<address_t> renter;
  timestamp_milliseconds_t lease_expiry{};
  std::optional<address_t> operator_address;
  timestamp_milliseconds_t operator_expiry{};
  uint64_t operator_nonce{};
  entity_status_t status{entity_status_t::active};
  address_t vault{};
  std::optional<entity_id_t> template_id;
  std::optional<hash32_t> params_hash;
  timestamp_milliseconds_t last_action_at{};
};

using entity_state_t = entity_state<1>;

}  // namespace leasehold::schema
