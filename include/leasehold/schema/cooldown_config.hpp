#pragma once

#include <leasehold/schema/primitives.hpp>

namespace leasehold::schema {

template <uint16_t Version>
struct cooldown_config;

template <>
struct cooldown_config<1> final {
  uint16_t version{1};
  duration_milliseconds_t minimum_interval{};
};

using cooldown_config_t = cooldown_config<1>;

}  // namespace leasehold::schema
