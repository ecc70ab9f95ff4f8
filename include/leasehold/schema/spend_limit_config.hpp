#pragma once

#include <leasehold/schema/primitives.hpp>

// Schema type: spend limit config.
// Per-entity ceilings enforced by the spend limit policy.
namespace leasehold::schema {

template <uint16_t Version>
struct spend_limit_config;

template <>
struct spend_limit_config<1> final {
  uint16_t version{1};
  amount_t max_per_call{};
  amount_t max_per_day{};
  amount_t max_approve{};
};

using spend_limit_config_t = spend_limit_config<1>;

}  // namespace leasehold::schema
