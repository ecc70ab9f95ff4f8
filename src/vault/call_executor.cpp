#include <spdlog/spdlog.h>
#include <leasehold/vault/call_executor.hpp>

using namespace leasehold::schema;

namespace leasehold::vault {

call_result journal_call_executor::execute(const address_t& from,
                                           const action_t& action) {
  auto lock = std::scoped_lock{mutex_};
  auto sequence = static_cast<uint64_t>(entries_.size()) + 1;
  entries_.push_back(
      journal_entry{.sequence = sequence, .from = from, .action = action});
  spdlog::info("Journaled call #{} from {} to {} value {} ({} byte payload)",
               sequence, to_hex(from), to_hex(action.destination),
               action.value.str(), action.payload.size());
  return call_result{.success = true};
}

std::vector<journal_entry> journal_call_executor::entries() const {
  auto lock = std::scoped_lock{mutex_};
  return entries_;
}

}  // namespace leasehold::vault
