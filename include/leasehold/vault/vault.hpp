#pragma once

#include <leasehold/schema/action.hpp>
#include <leasehold/schema/encoding/scale/encoder.hpp>
#include <leasehold/schema/operation_result.hpp>
#include <leasehold/schema/primitives.hpp>
#include <leasehold/storage/rocksdb/storage.hpp>
#include <leasehold/vault/call_executor.hpp>

namespace leasehold::vault {

/// Isolated per-entity fund holder. Balances are only mutated through calls
/// made by the router address given at construction.
class vault final {
 public:
  vault(leasehold::schema::encoding::encoder<
            leasehold::schema::encoding::scale_encoder_tag>& encoder,
        leasehold::storage::storage<leasehold::storage::rocksdb_storage_tag>&
            storage,
        call_executor& executor,
        leasehold::schema::address_t router);

  /// Deterministic vault address of an entity.
  static leasehold::schema::address_t address_of(
      leasehold::schema::entity_id_t entity_id);

  leasehold::schema::amount_t balance(
      leasehold::schema::entity_id_t entity_id) const;

  leasehold::schema::operation_result_t deposit(
      const leasehold::schema::address_t& caller,
      leasehold::schema::entity_id_t entity_id,
      const leasehold::schema::amount_t& amount);

  /// Forward `action` from the vault. The balance is debited only when the
  /// call succeeds.
  leasehold::schema::operation_result_t forward(
      const leasehold::schema::address_t& caller,
      leasehold::schema::entity_id_t entity_id,
      const leasehold::schema::action_t& action);

  /// Pay `amount` to `recipient`; the router passes the owner-of-record.
  leasehold::schema::operation_result_t withdraw(
      const leasehold::schema::address_t& caller,
      leasehold::schema::entity_id_t entity_id,
      const leasehold::schema::address_t& recipient,
      const leasehold::schema::amount_t& amount);

 private:
  void set_balance(leasehold::schema::entity_id_t entity_id,
                   const leasehold::schema::amount_t& amount);

  leasehold::schema::encoding::encoder<
      leasehold::schema::encoding::scale_encoder_tag>& encoder_;
  leasehold::storage::storage<leasehold::storage::rocksdb_storage_tag>&
      storage_;
  call_executor& executor_;
  leasehold::schema::address_t router_;
};

}  // namespace leasehold::vault
