#pragma once

#include <leasehold/decoder/instruction.hpp>
#include <leasehold/schema/encoding/scale/encoder.hpp>
#include <leasehold/schema/operation_result.hpp>
#include <leasehold/schema/policy_type.hpp>
#include <leasehold/schema/primitives.hpp>
#include <leasehold/storage/rocksdb/storage.hpp>
#include <optional>
#include <string>
#include <utility>

namespace leasehold::policy {

using encoder_t = leasehold::schema::encoding::encoder<
    leasehold::schema::encoding::scale_encoder_tag>;
using storage_t =
    leasehold::storage::storage<leasehold::storage::rocksdb_storage_tag>;

/// Optional hooks a plugin supports. Declared once, read by the engine; the
/// engine never calls a hook a plugin did not declare.
struct plugin_capabilities final {
  bool commit_hook{};
  bool instance_init_hook{};
};

struct policy_decision final {
  bool allowed{true};
  std::string reason;
};

using policy_decision_t = policy_decision;

inline policy_decision_t allow() {
  return {};
}

inline policy_decision_t reject(std::string reason) {
  return policy_decision_t{.allowed = false, .reason = std::move(reason)};
}

/// Everything a plugin may inspect about one action. Built once per
/// validate/commit pass.
struct check_context final {
  leasehold::schema::entity_id_t entity_id{};
  leasehold::schema::address_t caller{};
  leasehold::schema::address_t vault{};
  leasehold::schema::address_t destination{};
  leasehold::schema::amount_t value{};
  leasehold::schema::bytes_view_t payload;
  leasehold::decoder::decoded_instruction_t instruction;
  leasehold::schema::timestamp_milliseconds_t now{};
};

using check_context_t = check_context;

/// True when the action would move value or call into another component.
inline bool moves_value_or_state(const check_context_t& context) {
  return context.value != 0 || !context.payload.empty();
}

/// Where a configuration change lands. `ceiling` names the template whose
/// configuration bounds an instance change.
struct configuration_scope final {
  leasehold::schema::entity_id_t entity_id{};
  std::optional<leasehold::schema::entity_id_t> ceiling;
};

using configuration_scope_t = configuration_scope;

/// Independent rule evaluator with per-entity state in its own keyspace.
class policy_plugin {
 public:
  virtual ~policy_plugin() = default;

  virtual leasehold::schema::policy_type_t type() const = 0;

  /// Renters may add and remove renter-configurable plugins on their
  /// instances. Owner-only plugins are always active.
  virtual bool renter_configurable() const = 0;

  virtual plugin_capabilities capabilities() const = 0;

  /// Pure read; must not mutate state.
  virtual policy_decision_t check(const check_context_t& context) const = 0;

  /// Called after a successful execution when capabilities().commit_hook.
  virtual void commit(const check_context_t& context);

  /// Seed `instance` from `template_id` when
  /// capabilities().instance_init_hook.
  virtual void initialize_instance(leasehold::schema::entity_id_t instance,
                                   leasehold::schema::entity_id_t template_id);
};

}  // namespace leasehold::policy
