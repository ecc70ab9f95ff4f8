#pragma once

#include <leasehold/schema/primitives.hpp>

#include <array>
#include <optional>
#include <string_view>
#include <utility>

// Instruction identifiers understood by the decoder. Values are the 4-byte
// ABI selectors of the corresponding contract functions.
namespace leasehold::decoder::selector {

using leasehold::schema::selector_t;

// ERC-20
inline constexpr auto kTransfer = selector_t{0xa9, 0x05, 0x9c, 0xbb};
inline constexpr auto kTransferFrom = selector_t{0x23, 0xb8, 0x72, 0xdd};
inline constexpr auto kApprove = selector_t{0x09, 0x5e, 0xa7, 0xb3};
inline constexpr auto kIncreaseAllowance = selector_t{0x39, 0x50, 0x93, 0x51};
inline constexpr auto kDecreaseAllowance = selector_t{0xa4, 0x57, 0xc2, 0xd7};
inline constexpr auto kPermit = selector_t{0xd5, 0x05, 0xac, 0xcf};

// Wrapped native token
inline constexpr auto kDeposit = selector_t{0xd0, 0xe3, 0x0d, 0xb0};
inline constexpr auto kWithdraw = selector_t{0x2e, 0x1a, 0x7d, 0x4d};

// V2 style router
inline constexpr auto kSwapExactTokensForTokens =
    selector_t{0x38, 0xed, 0x17, 0x39};
inline constexpr auto kSwapTokensForExactTokens =
    selector_t{0x88, 0x03, 0xdb, 0xee};
inline constexpr auto kSwapExactETHForTokens =
    selector_t{0x7f, 0xf3, 0x6a, 0xb5};
inline constexpr auto kSwapTokensForExactETH =
    selector_t{0x4a, 0x25, 0xd9, 0x4a};
inline constexpr auto kSwapExactTokensForETH =
    selector_t{0x18, 0xcb, 0xaf, 0xe5};
inline constexpr auto kSwapETHForExactTokens =
    selector_t{0xfb, 0x3b, 0xdb, 0x41};
inline constexpr auto kSwapExactTokensForTokensFeeOnTransfer =
    selector_t{0x5c, 0x11, 0xd7, 0x95};
inline constexpr auto kSwapExactETHForTokensFeeOnTransfer =
    selector_t{0xb6, 0xf9, 0xde, 0x95};
inline constexpr auto kSwapExactTokensForETHFeeOnTransfer =
    selector_t{0x79, 0x1a, 0xc9, 0x47};

// V3 style router (no deadline in the parameter struct)
inline constexpr auto kExactInputSingle = selector_t{0x04, 0xe4, 0x5a, 0xaf};
inline constexpr auto kExactOutputSingle = selector_t{0x50, 0x23, 0xb4, 0xdf};

inline constexpr auto kSelectorNames = std::array{
    std::pair<std::string_view, selector_t>{"transfer", kTransfer},
    std::pair<std::string_view, selector_t>{"transferFrom", kTransferFrom},
    std::pair<std::string_view, selector_t>{"approve", kApprove},
    std::pair<std::string_view, selector_t>{"increaseAllowance",
                                            kIncreaseAllowance},
    std::pair<std::string_view, selector_t>{"decreaseAllowance",
                                            kDecreaseAllowance},
    std::pair<std::string_view, selector_t>{"permit", kPermit},
    std::pair<std::string_view, selector_t>{"deposit", kDeposit},
    std::pair<std::string_view, selector_t>{"withdraw", kWithdraw},
    std::pair<std::string_view, selector_t>{"swapExactTokensForTokens",
                                            kSwapExactTokensForTokens},
    std::pair<std::string_view, selector_t>{"swapTokensForExactTokens",
                                            kSwapTokensForExactTokens},
    std::pair<std::string_view, selector_t>{"swapExactETHForTokens",
                                            kSwapExactETHForTokens},
    std::pair<std::string_view, selector_t>{"swapTokensForExactETH",
                                            kSwapTokensForExactETH},
    std::pair<std::string_view, selector_t>{"swapExactTokensForETH",
                                            kSwapExactTokensForETH},
    std::pair<std::string_view, selector_t>{"swapETHForExactTokens",
                                            kSwapETHForExactTokens},
    std::pair<std::string_view, selector_t>{
        "swapExactTokensForTokensSupportingFeeOnTransferTokens",
        kSwapExactTokensForTokensFeeOnTransfer},
    std::pair<std::string_view, selector_t>{
        "swapExactETHForTokensSupportingFeeOnTransferTokens",
        kSwapExactETHForTokensFeeOnTransfer},
    std::pair<std::string_view, selector_t>{
        "swapExactTokensForETHSupportingFeeOnTransferTokens",
        kSwapExactTokensForETHFeeOnTransfer},
    std::pair<std::string_view, selector_t>{"exactInputSingle",
                                            kExactInputSingle},
    std::pair<std::string_view, selector_t>{"exactOutputSingle",
                                            kExactOutputSingle},
};

inline constexpr std::optional<std::string_view> name_of(
    const selector_t& value) {
  for (const auto& [name, known] : kSelectorNames) {
    if (known == value) {
      return name;
    }
  }
  return std::nullopt;
}

}  // namespace leasehold::decoder::selector
