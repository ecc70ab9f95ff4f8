#include <leasehold/policy/receiver_guard.hpp>

using leasehold::decoder::instruction_kind_t;

namespace leasehold::policy {

namespace {

policy_decision_t value_stays_home(const check_context_t& context) {
  if (context.value != 0 && context.destination != context.vault) {
    return reject("value must target the vault");
  }
  return allow();
}

}  // namespace

policy_decision_t receiver_guard::check(const check_context_t& context) const {
  const auto& instruction = context.instruction;
  switch (instruction.kind) {
    case instruction_kind_t::none:
      if (!context.payload.empty()) {
        return reject("payload shorter than an instruction id");
      }
      if (context.destination != context.vault) {
        return reject("value transfer must target the vault");
      }
      return allow();
    case instruction_kind_t::unknown:
      // The recipient of an unrecognised call cannot be established.
      return reject("unrecognized instruction: " +
                    leasehold::decoder::instruction_id(instruction));
    case instruction_kind_t::malformed:
      return reject("malformed instruction: " + instruction.error);
    case instruction_kind_t::swap_exact_input:
    case instruction_kind_t::swap_exact_output:
      if (instruction.recipient != context.vault) {
        return reject("swap recipient is not the vault");
      }
      return allow();
    case instruction_kind_t::transfer:
    case instruction_kind_t::transfer_from:
      if (instruction.recipient != context.vault) {
        return reject("transfer recipient is not the vault");
      }
      return value_stays_home(context);
    case instruction_kind_t::wrap_native:
      // Wrapped tokens are minted to the caller, which is the vault.
      return allow();
    case instruction_kind_t::unwrap_native:
    case instruction_kind_t::approve:
    case instruction_kind_t::increase_allowance:
    case instruction_kind_t::decrease_allowance:
    case instruction_kind_t::permit:
      return value_stays_home(context);
  }
  return reject("unhandled instruction kind");
}

}  // namespace leasehold::policy
