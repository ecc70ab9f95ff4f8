#include <spdlog/spdlog.h>
#include <leasehold/blake3/hash.hpp>
#include <leasehold/schema/key/builder.hpp>
#include <leasehold/schema/key/state_keys.hpp>
#include <leasehold/vault/vault.hpp>
#include <algorithm>
#include <iterator>

using namespace leasehold::schema;

namespace {

constexpr auto kCodespace = "leasehold.vault";

}  // namespace

namespace leasehold::vault {

vault::vault(leasehold::schema::encoding::encoder<
                 leasehold::schema::encoding::scale_encoder_tag>& encoder,
             leasehold::storage::storage<
                 leasehold::storage::rocksdb_storage_tag>& storage,
             call_executor& executor,
             address_t router)
    : encoder_{encoder},
      storage_{storage},
      executor_{executor},
      router_{router} {}

address_t vault::address_of(const entity_id_t entity_id) {
  auto material =
      key::builder{}.write(std::string_view{"leasehold/vault"}).write(entity_id);
  auto digest = leasehold::blake3::hash(
      bytes_view_t{material.data.data(), material.data.size()});
  auto address = address_t{};
  std::copy(std::end(digest) - static_cast<std::ptrdiff_t>(address.size()),
            std::end(digest), std::begin(address));
  return address;
}

amount_t vault::balance(const entity_id_t entity_id) const {
  return storage_
      .get<amount_t>(encoder_,
                     key::make_entity_key(key::kVaultBalancePrefix, entity_id))
      .value_or(amount_t{});
}

void vault::set_balance(const entity_id_t entity_id, const amount_t& amount) {
  storage_.put(encoder_,
               key::make_entity_key(key::kVaultBalancePrefix, entity_id),
               amount);
}

operation_result_t vault::deposit(const address_t& caller,
                                  const entity_id_t entity_id,
                                  const amount_t& amount) {
  if (caller != router_) {
    return make_error(error_code_t::authorization_denied,
                      "vault is only reachable through the router",
                      kCodespace);
  }
  auto current = balance(entity_id);
  if (amount > max_amount() - current) {
    return make_error(error_code_t::invalid_argument, "balance overflow",
                      kCodespace);
  }
  set_balance(entity_id, current + amount);
  spdlog::debug("Vault {} credited {}", entity_id, amount.str());
  return {};
}

operation_result_t vault::forward(const address_t& caller,
                                  const entity_id_t entity_id,
                                  const action_t& action) {
  if (caller != router_) {
    return make_error(error_code_t::authorization_denied,
                      "vault is only reachable through the router",
                      kCodespace);
  }
  auto current = balance(entity_id);
  if (action.value > current) {
    return make_error(error_code_t::insufficient_balance,
                      "insufficient vault balance", kCodespace);
  }
  auto call = executor_.execute(address_of(entity_id), action);
  if (!call.success) {
    spdlog::warn("Vault {} call to {} failed: {}", entity_id,
                 to_hex(action.destination), call.reason);
    auto result =
        make_error(error_code_t::call_failed, "forwarded call failed",
                   kCodespace);
    result.info = call.reason;
    return result;
  }
  // Value sent to the vault's own address never leaves it.
  if (action.value != 0 && action.destination != address_of(entity_id)) {
    set_balance(entity_id, current - action.value);
  }
  auto result = operation_result_t{};
  result.data = std::move(call.output);
  return result;
}

operation_result_t vault::withdraw(const address_t& caller,
                                   const entity_id_t entity_id,
                                   const address_t& recipient,
                                   const amount_t& amount) {
  auto result = forward(caller, entity_id,
                        action_t{.destination = recipient, .value = amount});
  if (result.ok()) {
    spdlog::info("Vault {} withdrew {} to {}", entity_id, amount.str(),
                 to_hex(recipient));
  }
  return result;
}

}  // namespace leasehold::vault
