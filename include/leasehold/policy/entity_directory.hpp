#pragma once

#include <leasehold/schema/primitives.hpp>
#include <optional>

namespace leasehold::policy {

/// Read-only view of entity ownership used by the engine for gating.
class entity_directory {
 public:
  virtual ~entity_directory() = default;

  virtual std::optional<leasehold::schema::address_t> owner_of(
      leasehold::schema::entity_id_t entity_id) const = 0;

  /// Renter whose lease has not expired.
  virtual std::optional<leasehold::schema::address_t> active_renter_of(
      leasehold::schema::entity_id_t entity_id) const = 0;

  virtual std::optional<leasehold::schema::address_t> vault_of(
      leasehold::schema::entity_id_t entity_id) const = 0;

  /// Template an instance was minted from; std::nullopt for plain entities.
  virtual std::optional<leasehold::schema::entity_id_t> template_of(
      leasehold::schema::entity_id_t entity_id) const = 0;
};

}  // namespace leasehold::policy
