#pragma once

#include <leasehold/schema/action.hpp>
#include <leasehold/schema/primitives.hpp>
#include <mutex>
#include <string>
#include <vector>

namespace leasehold::vault {

struct call_result final {
  bool success{};
  leasehold::schema::bytes_t output;
  std::string reason;
};

/// External call primitive used by the vault to move value. Settlement is the
/// host platform's concern; the vault only needs a success signal.
class call_executor {
 public:
  virtual ~call_executor() = default;

  virtual call_result execute(const leasehold::schema::address_t& from,
                              const leasehold::schema::action_t& action) = 0;
};

struct journal_entry final {
  uint64_t sequence{};
  leasehold::schema::address_t from{};
  leasehold::schema::action_t action;
};

/// Records forwarded calls for hand-off to the settlement layer. Every call
/// succeeds.
class journal_call_executor final : public call_executor {
 public:
  call_result execute(const leasehold::schema::address_t& from,
                      const leasehold::schema::action_t& action) override;

  std::vector<journal_entry> entries() const;

 private:
  mutable std::mutex mutex_;
  std::vector<journal_entry> entries_;
};

}  // namespace leasehold::vault
