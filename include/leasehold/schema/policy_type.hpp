#pragma once

#include <leasehold/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: policy type.
// Unique identifier of a policy plugin.
namespace leasehold::schema {

enum class policy_type_t : uint8_t {
  token_whitelist = 1,
  destination_whitelist = 2,
  spend_limit = 3,
  cooldown = 4,
  receiver_guard = 5,
};

inline constexpr auto kPolicyTypeMappings = std::array{
    std::pair<std::string_view, policy_type_t>{"token_whitelist",
                                               policy_type_t::token_whitelist},
    std::pair<std::string_view, policy_type_t>{
        "destination_whitelist", policy_type_t::destination_whitelist},
    std::pair<std::string_view, policy_type_t>{"spend_limit",
                                               policy_type_t::spend_limit},
    std::pair<std::string_view, policy_type_t>{"cooldown",
                                               policy_type_t::cooldown},
    std::pair<std::string_view, policy_type_t>{"receiver_guard",
                                               policy_type_t::receiver_guard},
};

template <>
struct enum_names<policy_type_t> final {
  static constexpr auto values = kPolicyTypeMappings;
};

inline constexpr std::string_view to_string(const policy_type_t value) {
  return name_of(value);
}

}  // namespace leasehold::schema
