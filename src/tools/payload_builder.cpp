#include <boost/multiprecision/cpp_int.hpp>
#include <leasehold/decoder/selectors.hpp>
#include <leasehold/tools/payload_builder.hpp>
#include <algorithm>
#include <iterator>

using namespace leasehold::schema;

namespace {

constexpr auto kWordSize = std::size_t{32};

namespace sel = leasehold::decoder::selector;

bytes_t v2_swap(const selector_t& selector,
                const std::optional<amount_t>& first,
                const std::optional<amount_t>& second,
                const std::vector<address_t>& path,
                const address_t& to,
                const uint64_t deadline) {
  auto writer = leasehold::tools::abi_writer{selector};
  if (first) {
    writer.uint(*first);
  }
  if (second) {
    writer.uint(*second);
  }
  return writer.address_array(path)
      .address(to)
      .uint(amount_t{deadline})
      .build();
}

}  // namespace

namespace leasehold::tools {

abi_writer::abi_writer(const selector_t& selector) : selector_{selector} {}

abi_writer& abi_writer::address(const address_t& value) {
  head_.push_back(encode_word(value));
  offsets_.emplace_back();
  return *this;
}

abi_writer& abi_writer::uint(const amount_t& value) {
  head_.push_back(encode_word(value));
  offsets_.emplace_back();
  return *this;
}

abi_writer& abi_writer::address_array(const std::vector<address_t>& values) {
  auto tail = encode_word(amount_t{values.size()});
  for (const auto& value : values) {
    auto word = encode_word(value);
    tail.insert(std::end(tail), std::begin(word), std::end(word));
  }
  head_.emplace_back();
  offsets_.push_back(tails_.size());
  tails_.push_back(std::move(tail));
  return *this;
}

bytes_t abi_writer::build() const {
  auto out = bytes_t{std::begin(selector_), std::end(selector_)};
  auto tail_offsets = std::vector<std::size_t>{};
  auto next = head_.size() * kWordSize;
  for (const auto& tail : tails_) {
    tail_offsets.push_back(next);
    next += tail.size();
  }
  for (std::size_t i = 0; i < head_.size(); ++i) {
    auto word = offsets_[i] ? encode_word(amount_t{tail_offsets[*offsets_[i]]})
                            : head_[i];
    out.insert(std::end(out), std::begin(word), std::end(word));
  }
  for (const auto& tail : tails_) {
    out.insert(std::end(out), std::begin(tail), std::end(tail));
  }
  return out;
}

bytes_t encode_word(const amount_t& value) {
  auto minimal = bytes_t{};
  if (value != 0) {
    boost::multiprecision::export_bits(value, std::back_inserter(minimal), 8);
  }
  auto word = bytes_t(kWordSize - minimal.size(), 0);
  word.insert(std::end(word), std::begin(minimal), std::end(minimal));
  return word;
}

bytes_t encode_word(const address_t& value) {
  auto word = bytes_t(kWordSize - value.size(), 0);
  word.insert(std::end(word), std::begin(value), std::end(value));
  return word;
}

bytes_t encode_transfer(const address_t& to, const amount_t& amount) {
  return abi_writer{sel::kTransfer}.address(to).uint(amount).build();
}

bytes_t encode_transfer_from(const address_t& from,
                             const address_t& to,
                             const amount_t& amount) {
  return abi_writer{sel::kTransferFrom}
      .address(from)
      .address(to)
      .uint(amount)
      .build();
}

bytes_t encode_approve(const address_t& spender, const amount_t& amount) {
  return abi_writer{sel::kApprove}.address(spender).uint(amount).build();
}

bytes_t encode_increase_allowance(const address_t& spender,
                                  const amount_t& amount) {
  return abi_writer{sel::kIncreaseAllowance}
      .address(spender)
      .uint(amount)
      .build();
}

bytes_t encode_decrease_allowance(const address_t& spender,
                                  const amount_t& amount) {
  return abi_writer{sel::kDecreaseAllowance}
      .address(spender)
      .uint(amount)
      .build();
}

bytes_t encode_permit(const address_t& owner,
                      const address_t& spender,
                      const amount_t& value,
                      const uint64_t deadline) {
  return abi_writer{sel::kPermit}
      .address(owner)
      .address(spender)
      .uint(value)
      .uint(amount_t{deadline})
      .uint(0)
      .uint(0)
      .uint(0)
      .build();
}

bytes_t encode_deposit() {
  return abi_writer{sel::kDeposit}.build();
}

bytes_t encode_withdraw(const amount_t& amount) {
  return abi_writer{sel::kWithdraw}.uint(amount).build();
}

bytes_t encode_swap_exact_tokens_for_tokens(const amount_t& amount_in,
                                            const amount_t& amount_out_min,
                                            const std::vector<address_t>& path,
                                            const address_t& to,
                                            const uint64_t deadline) {
  return v2_swap(sel::kSwapExactTokensForTokens, amount_in, amount_out_min,
                 path, to, deadline);
}

bytes_t encode_swap_tokens_for_exact_tokens(const amount_t& amount_out,
                                            const amount_t& amount_in_max,
                                            const std::vector<address_t>& path,
                                            const address_t& to,
                                            const uint64_t deadline) {
  return v2_swap(sel::kSwapTokensForExactTokens, amount_out, amount_in_max,
                 path, to, deadline);
}

bytes_t encode_swap_exact_eth_for_tokens(const amount_t& amount_out_min,
                                         const std::vector<address_t>& path,
                                         const address_t& to,
                                         const uint64_t deadline) {
  return v2_swap(sel::kSwapExactETHForTokens, amount_out_min, std::nullopt,
                 path, to, deadline);
}

bytes_t encode_swap_eth_for_exact_tokens(const amount_t& amount_out,
                                         const std::vector<address_t>& path,
                                         const address_t& to,
                                         const uint64_t deadline) {
  return v2_swap(sel::kSwapETHForExactTokens, amount_out, std::nullopt, path,
                 to, deadline);
}

bytes_t encode_swap_exact_tokens_for_eth(const amount_t& amount_in,
                                         const amount_t& amount_out_min,
                                         const std::vector<address_t>& path,
                                         const address_t& to,
                                         const uint64_t deadline) {
  return v2_swap(sel::kSwapExactTokensForETH, amount_in, amount_out_min, path,
                 to, deadline);
}

bytes_t encode_swap_tokens_for_exact_eth(const amount_t& amount_out,
                                         const amount_t& amount_in_max,
                                         const std::vector<address_t>& path,
                                         const address_t& to,
                                         const uint64_t deadline) {
  return v2_swap(sel::kSwapTokensForExactETH, amount_out, amount_in_max, path,
                 to, deadline);
}

bytes_t encode_exact_input_single(const address_t& token_in,
                                  const address_t& token_out,
                                  const uint32_t fee,
                                  const address_t& recipient,
                                  const amount_t& amount_in,
                                  const amount_t& amount_out_min) {
  return abi_writer{sel::kExactInputSingle}
      .address(token_in)
      .address(token_out)
      .uint(amount_t{fee})
      .address(recipient)
      .uint(amount_in)
      .uint(amount_out_min)
      .uint(0)
      .build();
}

bytes_t encode_exact_output_single(const address_t& token_in,
                                   const address_t& token_out,
                                   const uint32_t fee,
                                   const address_t& recipient,
                                   const amount_t& amount_out,
                                   const amount_t& amount_in_max) {
  return abi_writer{sel::kExactOutputSingle}
      .address(token_in)
      .address(token_out)
      .uint(amount_t{fee})
      .address(recipient)
      .uint(amount_out)
      .uint(amount_in_max)
      .uint(0)
      .build();
}

}  // namespace leasehold::tools
