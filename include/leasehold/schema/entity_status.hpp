#pragma once

#include <leasehold/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: entity status.
// Lifecycle of a rentable entity. `terminated` is terminal.
namespace leasehold::schema {

enum class entity_status_t : uint8_t {
  active = 0,
  paused = 1,
  terminated = 2,
};

inline constexpr auto kEntityStatusMappings = std::array{
    std::pair<std::string_view, entity_status_t>{"active",
                                                 entity_status_t::active},
    std::pair<std::string_view, entity_status_t>{"paused",
                                                 entity_status_t::paused},
    std::pair<std::string_view, entity_status_t>{"terminated",
                                                 entity_status_t::terminated},
};

template <>
struct enum_names<entity_status_t> final {
  static constexpr auto values = kEntityStatusMappings;
};

inline constexpr std::string_view to_string(const entity_status_t value) {
  return name_of(value);
}

}  // namespace leasehold::schema
