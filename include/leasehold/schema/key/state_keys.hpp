#pragma once

#include <leasehold/schema/policy_type.hpp>
#include <leasehold/schema/primitives.hpp>
#include <string_view>

// Canonical keyspaces. Every component owns exactly one prefix and never
// reads or writes outside of it.
namespace leasehold::schema::key {

inline constexpr std::string_view kRouterPrefix{"LH|ROUTER|"};
inline constexpr std::string_view kEntityKeyPrefix{"LH|ROUTER|ENTITY|"};
inline constexpr std::string_view kNextEntityIdKey{"LH|ROUTER|NEXT_ID"};
inline constexpr std::string_view kEventSeqKey{"LH|ROUTER|EVENT_SEQ"};
inline constexpr std::string_view kRequestNoncePrefix{"LH|ROUTER|NONCE|"};
inline constexpr std::string_view kEventPrefix{"LH|EVENT|"};

inline constexpr std::string_view kEnginePrefix{"LH|ENGINE|"};
inline constexpr std::string_view kApprovedPluginPrefix{"LH|ENGINE|APPROVED|"};
inline constexpr std::string_view kTemplatePolicyPrefix{"LH|ENGINE|TEMPLATE|"};
inline constexpr std::string_view kInstancePolicyPrefix{"LH|ENGINE|INSTANCE|"};
inline constexpr std::string_view kBindingPrefix{"LH|ENGINE|BINDING|"};

inline constexpr std::string_view kVaultBalancePrefix{"LH|VAULT|BALANCE|"};

inline constexpr std::string_view kTokenWhitelistPrefix{"LH|POLICY|TOKEN_WL|"};
inline constexpr std::string_view kDestinationWhitelistPrefix{
    "LH|POLICY|DEST_WL|"};
inline constexpr std::string_view kSpendConfigPrefix{"LH|POLICY|SPEND|CFG|"};
inline constexpr std::string_view kSpendWindowPrefix{"LH|POLICY|SPEND|WIN|"};
inline constexpr std::string_view kCooldownConfigPrefix{
    "LH|POLICY|COOLDOWN|CFG|"};
inline constexpr std::string_view kCooldownLastPrefix{
    "LH|POLICY|COOLDOWN|LAST|"};

bytes_t make_key(std::string_view prefix);
bytes_t make_entity_key(std::string_view prefix, entity_id_t entity_id);
bytes_t make_entity_address_key(std::string_view prefix,
                                entity_id_t entity_id,
                                const address_t& address);
bytes_t make_plugin_key(policy_type_t type);
bytes_t make_request_nonce_key(const address_t& signer);
bytes_t make_event_key(uint64_t event_id);

/// Extract the trailing address from a key made by make_entity_address_key.
std::optional<address_t> address_from_key(const bytes_view_t& key);

}  // namespace leasehold::schema::key
