#pragma once

#include <cstdint>

namespace leasehold::schema {

enum class error_code_t : uint32_t {
  ok = 0,
  // Authorization
  authorization_denied = 1,
  lease_expired = 2,
  // Policy
  policy_violation = 10,
  policy_not_bound = 11,
  // Entity state
  entity_missing = 20,
  entity_paused = 21,
  entity_terminated = 22,
  entity_not_paused = 23,
  // Delegation
  delegation_expired = 30,
  delegation_replayed = 31,
  delegation_signature_invalid = 32,
  delegation_submitter_mismatch = 33,
  delegation_exceeds_lease = 34,
  permit_deadline_passed = 35,
  // Configuration
  plugin_not_approved = 40,
  plugin_duplicate = 41,
  plugin_cap_exceeded = 42,
  plugin_missing = 43,
  plugin_not_removable = 44,
  ceiling_violation = 45,
  template_frozen = 46,
  template_missing = 47,
  template_empty = 48,
  binding_exists = 49,
  binding_missing = 50,
  invalid_argument = 51,
  // Execution
  call_failed = 60,
  insufficient_balance = 61,
  // Signed requests
  request_signature_invalid = 70,
  request_nonce_mismatch = 71,
  request_network_mismatch = 72,
};

}  // namespace leasehold::schema
