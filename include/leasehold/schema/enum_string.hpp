#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>
#include <utility>

namespace leasehold::schema {

template <typename Enum, std::size_t N>
using enum_table_t = std::array<std::pair<std::string_view, Enum>, N>;

/// Wire names of an enum. Each enum header that takes part in parsing
/// specializes this with a `values` table.
template <typename Enum>
struct enum_names;

template <typename Enum, std::size_t N>
constexpr std::optional<Enum> from_string(const std::string_view value,
                                          const enum_table_t<Enum, N>& table) {
  for (const auto& [name, enum_value] : table) {
    if (name == value) {
      return enum_value;
    }
  }
  return std::nullopt;
}

template <typename Enum, std::size_t N>
constexpr std::optional<std::string_view> to_string(
    const Enum value,
    const enum_table_t<Enum, N>& table) {
  for (const auto& [name, enum_value] : table) {
    if (enum_value == value) {
      return name;
    }
  }
  return std::nullopt;
}

/// Names are case sensitive; an unlisted name is std::nullopt.
template <typename Enum>
constexpr std::optional<Enum> try_from_string(const std::string_view value) {
  return from_string(value, enum_names<Enum>::values);
}

template <typename Enum>
constexpr std::string_view name_of(const Enum value) {
  return to_string(value, enum_names<Enum>::values).value_or("unknown");
}

}  // namespace leasehold::schema
