#pragma once

#include <leasehold/schema/policy_type.hpp>
#include <leasehold/schema/primitives.hpp>
#include <vector>

// Schema type: template state.
// Owner-defined ceiling policy list of an entity. Once `frozen` the list and
// every plugin configuration stored under the entity become immutable and the
// entity can be used as the template of instances.
namespace leasehold::schema {

template <uint16_t Version>
struct template_state;

template <>
struct template_state<1> final {
  uint16_t version{1};
  entity_id_t entity_id{};
  bool frozen{};
  std::vector<policy_type_t> policies;
};

using template_state_t = template_state<1>;

}  // namespace leasehold::schema
