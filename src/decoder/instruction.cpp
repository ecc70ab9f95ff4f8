#include <boost/multiprecision/cpp_int.hpp>
#include <leasehold/decoder/instruction.hpp>
#include <leasehold/decoder/selectors.hpp>
#include <algorithm>
#include <array>
#include <iterator>
#include <limits>
#include <string>
#include <tuple>
#include <optional>

using namespace leasehold::schema;

namespace {

using leasehold::decoder::decoded_instruction_t;
using leasehold::decoder::instruction_kind_t;
using leasehold::decoder::kMaxPathLength;

constexpr auto kSelectorSize = std::size_t{4};
constexpr auto kWordSize = std::size_t{32};
constexpr auto kAddressPadding = kWordSize - std::tuple_size_v<address_t>;

/// Reads 32-byte ABI words from the argument area of a call payload.
class abi_reader final {
 public:
  explicit abi_reader(const bytes_view_t& payload)
      : arguments_{payload.subspan(kSelectorSize)} {}

  std::optional<bytes_view_t> word_at_offset(const std::size_t offset) const {
    if (offset > arguments_.size() || arguments_.size() - offset < kWordSize) {
      return std::nullopt;
    }
    return arguments_.subspan(offset, kWordSize);
  }

  std::optional<bytes_view_t> word(const std::size_t index) const {
    if (index > arguments_.size() / kWordSize) {
      return std::nullopt;
    }
    return word_at_offset(index * kWordSize);
  }

  std::optional<amount_t> uint_at(const std::size_t index) const {
    auto raw = word(index);
    if (!raw) {
      return std::nullopt;
    }
    return to_amount(*raw);
  }

  /// Address words must be left padded with zeros.
  std::optional<address_t> address_at(const std::size_t index) const {
    auto raw = word(index);
    if (!raw) {
      return std::nullopt;
    }
    return to_address(*raw);
  }

  /// Dynamic address[] whose head word at `index` holds the tail offset.
  std::optional<std::vector<address_t>> address_array_at(
      const std::size_t index,
      std::string& error) const {
    auto offset = uint_at(index);
    if (!offset) {
      error = "truncated path offset";
      return std::nullopt;
    }
    if (*offset >= arguments_.size() || (*offset % kWordSize) != 0) {
      error = "path offset out of range";
      return std::nullopt;
    }
    auto start = static_cast<std::size_t>(*offset);
    auto length_word = word_at_offset(start);
    if (!length_word) {
      error = "truncated path length";
      return std::nullopt;
    }
    auto length = to_amount(*length_word);
    if (length > kMaxPathLength) {
      error = "path too long";
      return std::nullopt;
    }
    auto count = static_cast<std::size_t>(length);
    auto path = std::vector<address_t>{};
    path.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
      auto element = word_at_offset(start + kWordSize * (i + 1));
      if (!element) {
        error = "truncated path element";
        return std::nullopt;
      }
      auto address = to_address(*element);
      if (!address) {
        error = "non-canonical path address";
        return std::nullopt;
      }
      path.push_back(*address);
    }
    return path;
  }

 private:
  static amount_t to_amount(const bytes_view_t& raw) {
    auto value = amount_t{};
    boost::multiprecision::import_bits(value, std::begin(raw), std::end(raw));
    return value;
  }

  static std::optional<address_t> to_address(const bytes_view_t& raw) {
    if (!std::all_of(std::begin(raw), std::begin(raw) + kAddressPadding,
                     [](const uint8_t b) { return b == 0; })) {
      return std::nullopt;
    }
    auto address = address_t{};
    std::copy(std::begin(raw) + kAddressPadding, std::end(raw),
              std::begin(address));
    return address;
  }

  bytes_view_t arguments_;
};

uint64_t saturate_u64(const amount_t& value) {
  if (value > std::numeric_limits<uint64_t>::max()) {
    return std::numeric_limits<uint64_t>::max();
  }
  return static_cast<uint64_t>(value);
}

decoded_instruction_t& mark_malformed(decoded_instruction_t& instruction,
                                      std::string error) {
  instruction.kind = instruction_kind_t::malformed;
  instruction.error = std::move(error);
  return instruction;
}

/// Argument layout of the V2 router swap family. Negative indices are absent.
struct v2_swap_layout final {
  selector_t selector;
  instruction_kind_t kind;
  bool native_input;
  bool native_output;
  int amount_in;
  int amount_out;
  int path;
  int to;
  int deadline;
};

constexpr auto kV2SwapLayouts = std::array{
    v2_swap_layout{.selector = leasehold::decoder::selector::
                       kSwapExactTokensForTokens,
                   .kind = instruction_kind_t::swap_exact_input,
                   .native_input = false,
                   .native_output = false,
                   .amount_in = 0,
                   .amount_out = 1,
                   .path = 2,
                   .to = 3,
                   .deadline = 4},
    v2_swap_layout{.selector = leasehold::decoder::selector::
                       kSwapExactTokensForTokensFeeOnTransfer,
                   .kind = instruction_kind_t::swap_exact_input,
                   .native_input = false,
                   .native_output = false,
                   .amount_in = 0,
                   .amount_out = 1,
                   .path = 2,
                   .to = 3,
                   .deadline = 4},
    v2_swap_layout{.selector = leasehold::decoder::selector::
                       kSwapExactTokensForETH,
                   .kind = instruction_kind_t::swap_exact_input,
                   .native_input = false,
                   .native_output = true,
                   .amount_in = 0,
                   .amount_out = 1,
                   .path = 2,
                   .to = 3,
                   .deadline = 4},
    v2_swap_layout{.selector = leasehold::decoder::selector::
                       kSwapExactTokensForETHFeeOnTransfer,
                   .kind = instruction_kind_t::swap_exact_input,
                   .native_input = false,
                   .native_output = true,
                   .amount_in = 0,
                   .amount_out = 1,
                   .path = 2,
                   .to = 3,
                   .deadline = 4},
    v2_swap_layout{.selector = leasehold::decoder::selector::
                       kSwapExactETHForTokens,
                   .kind = instruction_kind_t::swap_exact_input,
                   .native_input = true,
                   .native_output = false,
                   .amount_in = -1,
                   .amount_out = 0,
                   .path = 1,
                   .to = 2,
                   .deadline = 3},
    v2_swap_layout{.selector = leasehold::decoder::selector::
                       kSwapExactETHForTokensFeeOnTransfer,
                   .kind = instruction_kind_t::swap_exact_input,
                   .native_input = true,
                   .native_output = false,
                   .amount_in = -1,
                   .amount_out = 0,
                   .path = 1,
                   .to = 2,
                   .deadline = 3},
    v2_swap_layout{.selector = leasehold::decoder::selector::
                       kSwapTokensForExactTokens,
                   .kind = instruction_kind_t::swap_exact_output,
                   .native_input = false,
                   .native_output = false,
                   .amount_in = 1,
                   .amount_out = 0,
                   .path = 2,
                   .to = 3,
                   .deadline = 4},
    v2_swap_layout{.selector = leasehold::decoder::selector::
                       kSwapTokensForExactETH,
                   .kind = instruction_kind_t::swap_exact_output,
                   .native_input = false,
                   .native_output = true,
                   .amount_in = 1,
                   .amount_out = 0,
                   .path = 2,
                   .to = 3,
                   .deadline = 4},
    v2_swap_layout{.selector = leasehold::decoder::selector::
                       kSwapETHForExactTokens,
                   .kind = instruction_kind_t::swap_exact_output,
                   .native_input = true,
                   .native_output = false,
                   .amount_in = -1,
                   .amount_out = 0,
                   .path = 1,
                   .to = 2,
                   .deadline = 3},
};

void decode_v2_swap(const v2_swap_layout& layout,
                    const abi_reader& reader,
                    decoded_instruction_t& instruction) {
  instruction.kind = layout.kind;
  instruction.native_input = layout.native_input;
  instruction.native_output = layout.native_output;

  auto amount_in = std::optional<amount_t>{amount_t{}};
  if (layout.amount_in >= 0) {
    amount_in = reader.uint_at(layout.amount_in);
  }
  auto amount_out = reader.uint_at(layout.amount_out);
  auto to = reader.address_at(layout.to);
  auto deadline = reader.uint_at(layout.deadline);
  if (!amount_in || !amount_out || !to || !deadline) {
    mark_malformed(instruction, "truncated or non-canonical swap arguments");
    return;
  }
  auto error = std::string{};
  auto path = reader.address_array_at(layout.path, error);
  if (!path) {
    mark_malformed(instruction, error);
    return;
  }
  if (path->size() < 2) {
    mark_malformed(instruction, "path too short");
    return;
  }

  instruction.path = std::move(*path);
  instruction.recipient = *to;
  instruction.deadline = saturate_u64(*deadline);
  if (layout.kind == instruction_kind_t::swap_exact_input) {
    instruction.amount = *amount_in;
    instruction.max_input = *amount_in;
    instruction.min_output = *amount_out;
  } else {
    instruction.amount = *amount_out;
    instruction.max_input = *amount_in;
    instruction.min_output = *amount_out;
  }
}

// exactInputSingle / exactOutputSingle take a static 7-word struct:
// (tokenIn, tokenOut, fee, recipient, amount, limit, sqrtPriceLimitX96).
void decode_v3_single(const bool exact_input,
                      const abi_reader& reader,
                      decoded_instruction_t& instruction) {
  instruction.kind = exact_input ? instruction_kind_t::swap_exact_input
                                 : instruction_kind_t::swap_exact_output;
  auto token_in = reader.address_at(0);
  auto token_out = reader.address_at(1);
  auto fee = reader.uint_at(2);
  auto recipient = reader.address_at(3);
  auto amount = reader.uint_at(4);
  auto limit = reader.uint_at(5);
  auto price_limit = reader.uint_at(6);
  if (!token_in || !token_out || !fee || !recipient || !amount || !limit ||
      !price_limit) {
    mark_malformed(instruction, "truncated or non-canonical swap arguments");
    return;
  }
  instruction.path = {*token_in, *token_out};
  instruction.recipient = *recipient;
  instruction.amount = *amount;
  if (exact_input) {
    instruction.max_input = *amount;
    instruction.min_output = *limit;
  } else {
    instruction.max_input = *limit;
    instruction.min_output = *amount;
  }
}

void decode_token_call(const selector_t& selector,
                       const abi_reader& reader,
                       decoded_instruction_t& instruction) {
  namespace sel = leasehold::decoder::selector;
  if (selector == sel::kTransfer) {
    instruction.kind = instruction_kind_t::transfer;
    auto to = reader.address_at(0);
    auto amount = reader.uint_at(1);
    if (!to || !amount) {
      mark_malformed(instruction, "truncated or non-canonical transfer");
      return;
    }
    instruction.recipient = *to;
    instruction.amount = *amount;
  } else if (selector == sel::kTransferFrom) {
    instruction.kind = instruction_kind_t::transfer_from;
    auto from = reader.address_at(0);
    auto to = reader.address_at(1);
    auto amount = reader.uint_at(2);
    if (!from || !to || !amount) {
      mark_malformed(instruction, "truncated or non-canonical transferFrom");
      return;
    }
    instruction.recipient = *to;
    instruction.amount = *amount;
  } else if (selector == sel::kApprove || selector == sel::kIncreaseAllowance ||
             selector == sel::kDecreaseAllowance) {
    instruction.kind =
        selector == sel::kApprove ? instruction_kind_t::approve
        : selector == sel::kIncreaseAllowance
            ? instruction_kind_t::increase_allowance
            : instruction_kind_t::decrease_allowance;
    auto spender = reader.address_at(0);
    auto amount = reader.uint_at(1);
    if (!spender || !amount) {
      mark_malformed(instruction, "truncated or non-canonical allowance");
      return;
    }
    instruction.spender = *spender;
    instruction.amount = *amount;
  } else if (selector == sel::kPermit) {
    // permit(owner, spender, value, deadline, v, r, s)
    instruction.kind = instruction_kind_t::permit;
    auto owner = reader.address_at(0);
    auto spender = reader.address_at(1);
    auto amount = reader.uint_at(2);
    auto deadline = reader.uint_at(3);
    if (!owner || !spender || !amount || !deadline || !reader.word(6)) {
      mark_malformed(instruction, "truncated or non-canonical permit");
      return;
    }
    instruction.spender = *spender;
    instruction.amount = *amount;
    instruction.deadline = saturate_u64(*deadline);
  } else if (selector == sel::kDeposit) {
    instruction.kind = instruction_kind_t::wrap_native;
  } else if (selector == sel::kWithdraw) {
    instruction.kind = instruction_kind_t::unwrap_native;
    auto amount = reader.uint_at(0);
    if (!amount) {
      mark_malformed(instruction, "truncated withdraw");
      return;
    }
    instruction.amount = *amount;
  } else {
    instruction.kind = instruction_kind_t::unknown;
  }
}

}  // namespace

namespace leasehold::decoder {

decoded_instruction_t decode_instruction(const address_t& destination,
                                         const bytes_view_t& payload) {
  auto instruction = decoded_instruction_t{};
  if (payload.size() < kSelectorSize) {
    instruction.kind = instruction_kind_t::none;
    return instruction;
  }

  auto identifier = selector_t{};
  std::copy_n(std::begin(payload), kSelectorSize, std::begin(identifier));
  instruction.selector = identifier;
  auto reader = abi_reader{payload};

  auto v2 = std::find_if(
      std::begin(kV2SwapLayouts), std::end(kV2SwapLayouts),
      [&](const v2_swap_layout& layout) { return layout.selector == identifier; });
  if (v2 != std::end(kV2SwapLayouts)) {
    decode_v2_swap(*v2, reader, instruction);
    return instruction;
  }
  if (identifier == selector::kExactInputSingle ||
      identifier == selector::kExactOutputSingle) {
    decode_v3_single(identifier == selector::kExactInputSingle, reader,
                     instruction);
    return instruction;
  }

  instruction.token = destination;
  decode_token_call(identifier, reader, instruction);
  if (instruction.kind == instruction_kind_t::unknown) {
    instruction.token.reset();
  }
  return instruction;
}

std::string instruction_id(const decoded_instruction_t& instruction) {
  if (!instruction.selector) {
    return {};
  }
  return "0x" + to_hex(bytes_view_t{instruction.selector->data(),
                                    instruction.selector->size()});
}

}  // namespace leasehold::decoder
