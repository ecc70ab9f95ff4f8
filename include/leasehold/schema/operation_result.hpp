#pragma once

#include <leasehold/schema/audit_event.hpp>
#include <leasehold/schema/error_code.hpp>
#include <leasehold/schema/primitives.hpp>
#include <string>
#include <vector>

namespace leasehold::schema {

/// Outcome of a router, engine or plugin operation.
///
/// `code` is zero on success. On failure `log` carries the human readable
/// reason (a policy rejection reason verbatim) and `codespace` names the
/// component that rejected.
struct operation_result final {
  error_code_t code{error_code_t::ok};
  std::string log;
  std::string info;
  std::string codespace;
  bytes_t data;
  std::vector<audit_event_t> events;

  bool ok() const { return code == error_code_t::ok; }
};

using operation_result_t = operation_result;

inline operation_result_t make_error(const error_code_t code,
                                     std::string log,
                                     std::string codespace) {
  auto result = operation_result_t{};
  result.code = code;
  result.log = std::move(log);
  result.codespace = std::move(codespace);
  return result;
}

}  // namespace leasehold::schema
