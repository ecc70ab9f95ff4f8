#pragma once

#include <leasehold/schema/action.hpp>
#include <leasehold/schema/operator_permit.hpp>
#include <leasehold/schema/policy_type.hpp>
#include <leasehold/schema/primitives.hpp>
#include <leasehold/schema/spend_limit_config.hpp>
#include <variant>

// Schema type: router request.
// Signed envelope of one state changing router call. The signer is the
// caller of record; the signature travels beside the request and is taken
// over the typed message of the encoded request.
namespace leasehold::schema {

enum class lifecycle_change_t : uint8_t {
  pause = 0,
  unpause = 1,
  terminate = 2,
};

enum class policy_list_t : uint8_t {
  template_list = 0,
  instance_list = 1,
};

enum class whitelist_kind_t : uint8_t {
  token = 0,
  destination = 1,
};

template <uint16_t Version>
struct mint_entity;

template <>
struct mint_entity<1> final {
  uint16_t version{1};
  address_t owner{};
};

using mint_entity_t = mint_entity<1>;

template <uint16_t Version>
struct transfer_entity;

template <>
struct transfer_entity<1> final {
  uint16_t version{1};
  entity_id_t entity_id{};
  address_t new_owner{};
};

using transfer_entity_t = transfer_entity<1>;

template <uint16_t Version>
struct change_status;

template <>
struct change_status<1> final {
  uint16_t version{1};
  entity_id_t entity_id{};
  lifecycle_change_t change{lifecycle_change_t::pause};
};

using change_status_t = change_status<1>;

template <uint16_t Version>
struct assign_lease;

template <>
struct assign_lease<1> final {
  uint16_t version{1};
  entity_id_t entity_id{};
  address_t renter{};
  timestamp_milliseconds_t expiry{};
};

using assign_lease_t = assign_lease<1>;

template <uint16_t Version>
struct extend_lease;

template <>
struct extend_lease<1> final {
  uint16_t version{1};
  entity_id_t entity_id{};
  timestamp_milliseconds_t expiry{};
};

using extend_lease_t = extend_lease<1>;

template <uint16_t Version>
struct set_operator;

template <>
struct set_operator<1> final {
  uint16_t version{1};
  entity_id_t entity_id{};
  address_t operator_address{};
  timestamp_milliseconds_t expiry{};
};

using set_operator_t = set_operator<1>;

template <uint16_t Version>
struct clear_operator;

template <>
struct clear_operator<1> final {
  uint16_t version{1};
  entity_id_t entity_id{};
};

using clear_operator_t = clear_operator<1>;

/// Relay of a renter-signed permit; the request signer is the submitter.
template <uint16_t Version>
struct apply_operator_permit;

template <>
struct apply_operator_permit<1> final {
  uint16_t version{1};
  operator_permit_t permit{};
  signature_t permit_signature{};
};

using apply_operator_permit_t = apply_operator_permit<1>;

template <uint16_t Version>
struct register_template;

template <>
struct register_template<1> final {
  uint16_t version{1};
  entity_id_t entity_id{};
};

using register_template_t = register_template<1>;

template <uint16_t Version>
struct mint_instance;

template <>
struct mint_instance<1> final {
  uint16_t version{1};
  entity_id_t template_id{};
  address_t renter{};
  timestamp_milliseconds_t lease_expiry{};
  bytes_t init_params;
};

using mint_instance_t = mint_instance<1>;

template <uint16_t Version>
struct deposit_funds;

template <>
struct deposit_funds<1> final {
  uint16_t version{1};
  entity_id_t entity_id{};
  amount_t amount{};
};

using deposit_funds_t = deposit_funds<1>;

template <uint16_t Version>
struct withdraw_funds;

template <>
struct withdraw_funds<1> final {
  uint16_t version{1};
  entity_id_t entity_id{};
  amount_t amount{};
};

using withdraw_funds_t = withdraw_funds<1>;

template <uint16_t Version>
struct execute_action;

template <>
struct execute_action<1> final {
  uint16_t version{1};
  entity_id_t entity_id{};
  action_t action{};
};

using execute_action_t = execute_action<1>;

template <uint16_t Version>
struct set_plugin_approval;

template <>
struct set_plugin_approval<1> final {
  uint16_t version{1};
  policy_type_t type{policy_type_t::token_whitelist};
  bool approved{};
};

using set_plugin_approval_t = set_plugin_approval<1>;

template <uint16_t Version>
struct update_policy_list;

template <>
struct update_policy_list<1> final {
  uint16_t version{1};
  entity_id_t entity_id{};
  policy_list_t list{policy_list_t::template_list};
  policy_type_t type{policy_type_t::token_whitelist};
  bool add{};
};

using update_policy_list_t = update_policy_list<1>;

template <uint16_t Version>
struct update_whitelist;

template <>
struct update_whitelist<1> final {
  uint16_t version{1};
  entity_id_t entity_id{};
  whitelist_kind_t kind{whitelist_kind_t::token};
  address_t address{};
  bool add{};
};

using update_whitelist_t = update_whitelist<1>;

template <uint16_t Version>
struct set_spend_limits;

template <>
struct set_spend_limits<1> final {
  uint16_t version{1};
  entity_id_t entity_id{};
  spend_limit_config_t limits{};
};

using set_spend_limits_t = set_spend_limits<1>;

template <uint16_t Version>
struct set_cooldown;

template <>
struct set_cooldown<1> final {
  uint16_t version{1};
  entity_id_t entity_id{};
  duration_milliseconds_t minimum_interval{};
};

using set_cooldown_t = set_cooldown<1>;

using router_call_t = std::variant<mint_entity_t,
                                   transfer_entity_t,
                                   change_status_t,
                                   assign_lease_t,
                                   extend_lease_t,
                                   set_operator_t,
                                   clear_operator_t,
                                   apply_operator_permit_t,
                                   register_template_t,
                                   mint_instance_t,
                                   deposit_funds_t,
                                   withdraw_funds_t,
                                   execute_action_t,
                                   set_plugin_approval_t,
                                   update_policy_list_t,
                                   update_whitelist_t,
                                   set_spend_limits_t,
                                   set_cooldown_t>;

template <uint16_t Version>
struct router_request;

template <>
struct router_request<1> final {
  uint16_t version{1};
  hash32_t network_id{};
  /// Must equal the signer's next request nonce.
  uint64_t nonce{};
  address_t signer{};
  router_call_t call{};
};

using router_request_t = router_request<1>;

}  // namespace leasehold::schema
