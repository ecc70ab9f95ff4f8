#pragma once

#include <leasehold/schema/enum_string.hpp>
#include <leasehold/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace leasehold::decoder {

/// Longest swap path the decoder accepts.
inline constexpr auto kMaxPathLength = std::size_t{8};

enum class instruction_kind_t : uint8_t {
  none = 0,
  unknown = 1,
  malformed = 2,
  transfer = 3,
  transfer_from = 4,
  approve = 5,
  increase_allowance = 6,
  decrease_allowance = 7,
  permit = 8,
  wrap_native = 9,
  unwrap_native = 10,
  swap_exact_input = 11,
  swap_exact_output = 12,
};

inline constexpr auto kInstructionKindMappings = std::array{
    std::pair<std::string_view, instruction_kind_t>{"none",
                                                    instruction_kind_t::none},
    std::pair<std::string_view, instruction_kind_t>{
        "unknown", instruction_kind_t::unknown},
    std::pair<std::string_view, instruction_kind_t>{
        "malformed", instruction_kind_t::malformed},
    std::pair<std::string_view, instruction_kind_t>{
        "transfer", instruction_kind_t::transfer},
    std::pair<std::string_view, instruction_kind_t>{
        "transfer_from", instruction_kind_t::transfer_from},
    std::pair<std::string_view, instruction_kind_t>{
        "approve", instruction_kind_t::approve},
    std::pair<std::string_view, instruction_kind_t>{
        "increase_allowance", instruction_kind_t::increase_allowance},
    std::pair<std::string_view, instruction_kind_t>{
        "decrease_allowance", instruction_kind_t::decrease_allowance},
    std::pair<std::string_view, instruction_kind_t>{
        "permit", instruction_kind_t::permit},
    std::pair<std::string_view, instruction_kind_t>{
        "wrap_native", instruction_kind_t::wrap_native},
    std::pair<std::string_view, instruction_kind_t>{
        "unwrap_native", instruction_kind_t::unwrap_native},
    std::pair<std::string_view, instruction_kind_t>{
        "swap_exact_input", instruction_kind_t::swap_exact_input},
    std::pair<std::string_view, instruction_kind_t>{
        "swap_exact_output", instruction_kind_t::swap_exact_output},
};

inline constexpr std::string_view to_string(const instruction_kind_t value) {
  return leasehold::schema::to_string(value, kInstructionKindMappings)
      .value_or("unknown");
}

/// Structured view of an action payload.
///
/// Token-level instructions (transfer, approve, ...) are executed on the token
/// itself, so `token` is the call target and the counter-party is the
/// positional spender/recipient parameter. Swaps are executed on a router;
/// their tokens come from the decoded path and `token` stays empty.
struct decoded_instruction final {
  instruction_kind_t kind{instruction_kind_t::none};
  /// Empty when the payload is shorter than a selector.
  std::optional<leasehold::schema::selector_t> selector;
  std::optional<leasehold::schema::address_t> token;
  std::vector<leasehold::schema::address_t> path;
  std::optional<leasehold::schema::address_t> spender;
  /// Destination of funds: swap `to`/`recipient`, transfer `to`.
  std::optional<leasehold::schema::address_t> recipient;
  /// Nominal amount: transfer/approve amount, exact input, or exact output.
  leasehold::schema::amount_t amount{};
  /// Worst-case token input of a swap. Zero for native-input swaps, whose
  /// input is the action value.
  leasehold::schema::amount_t max_input{};
  leasehold::schema::amount_t min_output{};
  bool native_input{};
  bool native_output{};
  std::optional<uint64_t> deadline;
  /// Set when kind is malformed.
  std::string error;

  bool is_swap() const {
    return kind == instruction_kind_t::swap_exact_input ||
           kind == instruction_kind_t::swap_exact_output;
  }
  bool is_allowance() const {
    return kind == instruction_kind_t::approve ||
           kind == instruction_kind_t::increase_allowance ||
           kind == instruction_kind_t::decrease_allowance ||
           kind == instruction_kind_t::permit;
  }
};

using decoded_instruction_t = decoded_instruction;

/// Decode `payload` as a call on `destination`. Pure; never throws.
decoded_instruction_t decode_instruction(
    const leasehold::schema::address_t& destination,
    const leasehold::schema::bytes_view_t& payload);

/// Hex form of the selector, or an empty string when absent.
std::string instruction_id(const decoded_instruction_t& instruction);

}  // namespace leasehold::decoder
