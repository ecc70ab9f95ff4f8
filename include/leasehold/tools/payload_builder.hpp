#pragma once

#include <leasehold/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <vector>

// Builds call payloads in the selector + 32-byte word layout read by the
// instruction decoder.
namespace leasehold::tools {

/// Head/tail ABI writer. Static arguments are written in place; dynamic
/// address arrays leave an offset word in the head and append their length
/// and elements to the tail.
class abi_writer final {
 public:
  explicit abi_writer(const leasehold::schema::selector_t& selector);

  abi_writer& address(const leasehold::schema::address_t& value);
  abi_writer& uint(const leasehold::schema::amount_t& value);
  abi_writer& address_array(
      const std::vector<leasehold::schema::address_t>& values);

  leasehold::schema::bytes_t build() const;

 private:
  leasehold::schema::selector_t selector_;
  std::vector<leasehold::schema::bytes_t> head_;
  /// Index into tails_ for head words that are dynamic offsets.
  std::vector<std::optional<std::size_t>> offsets_;
  std::vector<leasehold::schema::bytes_t> tails_;
};

/// Big-endian 32-byte word.
leasehold::schema::bytes_t encode_word(const leasehold::schema::amount_t& value);
leasehold::schema::bytes_t encode_word(
    const leasehold::schema::address_t& value);

leasehold::schema::bytes_t encode_transfer(
    const leasehold::schema::address_t& to,
    const leasehold::schema::amount_t& amount);
leasehold::schema::bytes_t encode_transfer_from(
    const leasehold::schema::address_t& from,
    const leasehold::schema::address_t& to,
    const leasehold::schema::amount_t& amount);
leasehold::schema::bytes_t encode_approve(
    const leasehold::schema::address_t& spender,
    const leasehold::schema::amount_t& amount);
leasehold::schema::bytes_t encode_increase_allowance(
    const leasehold::schema::address_t& spender,
    const leasehold::schema::amount_t& amount);
leasehold::schema::bytes_t encode_decrease_allowance(
    const leasehold::schema::address_t& spender,
    const leasehold::schema::amount_t& amount);
/// Signature words (v, r, s) are written as zero.
leasehold::schema::bytes_t encode_permit(
    const leasehold::schema::address_t& owner,
    const leasehold::schema::address_t& spender,
    const leasehold::schema::amount_t& value,
    uint64_t deadline);
leasehold::schema::bytes_t encode_deposit();
leasehold::schema::bytes_t encode_withdraw(
    const leasehold::schema::amount_t& amount);

leasehold::schema::bytes_t encode_swap_exact_tokens_for_tokens(
    const leasehold::schema::amount_t& amount_in,
    const leasehold::schema::amount_t& amount_out_min,
    const std::vector<leasehold::schema::address_t>& path,
    const leasehold::schema::address_t& to,
    uint64_t deadline);
leasehold::schema::bytes_t encode_swap_tokens_for_exact_tokens(
    const leasehold::schema::amount_t& amount_out,
    const leasehold::schema::amount_t& amount_in_max,
    const std::vector<leasehold::schema::address_t>& path,
    const leasehold::schema::address_t& to,
    uint64_t deadline);
leasehold::schema::bytes_t encode_swap_exact_eth_for_tokens(
    const leasehold::schema::amount_t& amount_out_min,
    const std::vector<leasehold::schema::address_t>& path,
    const leasehold::schema::address_t& to,
    uint64_t deadline);
leasehold::schema::bytes_t encode_swap_eth_for_exact_tokens(
    const leasehold::schema::amount_t& amount_out,
    const std::vector<leasehold::schema::address_t>& path,
    const leasehold::schema::address_t& to,
    uint64_t deadline);
leasehold::schema::bytes_t encode_swap_exact_tokens_for_eth(
    const leasehold::schema::amount_t& amount_in,
    const leasehold::schema::amount_t& amount_out_min,
    const std::vector<leasehold::schema::address_t>& path,
    const leasehold::schema::address_t& to,
    uint64_t deadline);
leasehold::schema::bytes_t encode_swap_tokens_for_exact_eth(
    const leasehold::schema::amount_t& amount_out,
    const leasehold::schema::amount_t& amount_in_max,
    const std::vector<leasehold::schema::address_t>& path,
    const leasehold::schema::address_t& to,
    uint64_t deadline);

leasehold::schema::bytes_t encode_exact_input_single(
    const leasehold::schema::address_t& token_in,
    const leasehold::schema::address_t& token_out,
    uint32_t fee,
    const leasehold::schema::address_t& recipient,
    const leasehold::schema::amount_t& amount_in,
    const leasehold::schema::amount_t& amount_out_min);
leasehold::schema::bytes_t encode_exact_output_single(
    const leasehold::schema::address_t& token_in,
    const leasehold::schema::address_t& token_out,
    uint32_t fee,
    const leasehold::schema::address_t& recipient,
    const leasehold::schema::amount_t& amount_out,
    const leasehold::schema::amount_t& amount_in_max);

}  // namespace leasehold::tools
