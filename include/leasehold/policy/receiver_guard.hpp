#pragma once

#include <leasehold/policy/policy_plugin.hpp>

namespace leasehold::policy {

/// Destination-of-funds guard. Swap proceeds, transfer recipients and raw
/// value transfers must all land in the entity's own vault. Stateless and
/// owner-only: renters can never remove it from an instance.
class receiver_guard final : public policy_plugin {
 public:
  leasehold::schema::policy_type_t type() const override {
    return leasehold::schema::policy_type_t::receiver_guard;
  }
  bool renter_configurable() const override { return false; }
  plugin_capabilities capabilities() const override { return {}; }

  policy_decision_t check(const check_context_t& context) const override;
};

}  // namespace leasehold::policy
