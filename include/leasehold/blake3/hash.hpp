#pragma once
#include <leasehold/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace leasehold::blake3 {

leasehold::schema::hash32_t hash(const std::string_view& str);
leasehold::schema::hash32_t hash(const std::span<const uint8_t>& bytes);

}  // namespace leasehold::blake3
