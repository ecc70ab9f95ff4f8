#pragma once

#include <leasehold/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

// Schema type: audit event type.
// Observability taxonomy for lifecycle, delegation and execution records.
namespace leasehold::schema {

enum class audit_event_type_t : uint16_t {
  entity_minted = 1,
  entity_transferred = 2,
  lease_assigned = 3,
  operator_set = 4,
  operator_cleared = 5,
  action_executed = 6,
  policy_commit_failed = 7,
  entity_paused = 8,
  entity_unpaused = 9,
  entity_terminated = 10,
  template_registered = 11,
  instance_minted = 12,
  withdrawal = 13,
  lease_extended = 14,
  deposit = 15,
};

inline constexpr auto kAuditEventTypeMappings = std::array{
    std::pair<std::string_view, audit_event_type_t>{
        "entity_minted", audit_event_type_t::entity_minted},
    std::pair<std::string_view, audit_event_type_t>{
        "entity_transferred", audit_event_type_t::entity_transferred},
    std::pair<std::string_view, audit_event_type_t>{
        "lease_assigned", audit_event_type_t::lease_assigned},
    std::pair<std::string_view, audit_event_type_t>{
        "operator_set", audit_event_type_t::operator_set},
    std::pair<std::string_view, audit_event_type_t>{
        "operator_cleared", audit_event_type_t::operator_cleared},
    std::pair<std::string_view, audit_event_type_t>{
        "action_executed", audit_event_type_t::action_executed},
    std::pair<std::string_view, audit_event_type_t>{
        "policy_commit_failed", audit_event_type_t::policy_commit_failed},
    std::pair<std::string_view, audit_event_type_t>{
        "entity_paused", audit_event_type_t::entity_paused},
    std::pair<std::string_view, audit_event_type_t>{
        "entity_unpaused", audit_event_type_t::entity_unpaused},
    std::pair<std::string_view, audit_event_type_t>{
        "entity_terminated", audit_event_type_t::entity_terminated},
    std::pair<std::string_view, audit_event_type_t>{
        "template_registered", audit_event_type_t::template_registered},
    std::pair<std::string_view, audit_event_type_t>{
        "instance_minted", audit_event_type_t::instance_minted},
    std::pair<std::string_view, audit_event_type_t>{
        "withdrawal", audit_event_type_t::withdrawal},
    std::pair<std::string_view, audit_event_type_t>{
        "lease_extended", audit_event_type_t::lease_extended},
    std::pair<std::string_view, audit_event_type_t>{
        "deposit", audit_event_type_t::deposit},
};

template <>
struct enum_names<audit_event_type_t> final {
  static constexpr auto values = kAuditEventTypeMappings;
};

inline constexpr std::string_view to_string(const audit_event_type_t value) {
  return name_of(value);
}

}  // namespace leasehold::schema
