#pragma once

#include <leasehold/schema/audit_event_type.hpp>
#include <leasehold/schema/primitives.hpp>
#include <string>
#include <vector>

// Schema type: audit event.
// Persisted observability record; attributes carry event specific fields
// (caller, destination, instruction id, plugin, diagnostic, ...).
namespace leasehold::schema {

template <uint16_t Version>
struct audit_event_attribute;

template <>
struct audit_event_attribute<1> final {
  uint16_t version{1};
  std::string key;
  std::string value;
};

using audit_event_attribute_t = audit_event_attribute<1>;

template <uint16_t Version>
struct audit_event;

template <>
struct audit_event<1> final {
  uint16_t version{1};
  uint64_t event_id{};
  audit_event_type_t type{};
  entity_id_t entity_id{};
  timestamp_milliseconds_t recorded_at{};
  std::vector<audit_event_attribute_t> attributes;
};

using audit_event_t = audit_event<1>;

}  // namespace leasehold::schema
