#pragma once
#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace leasehold::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using address_t = std::array<uint8_t, 20>;
using selector_t = std::array<uint8_t, 4>;
using entity_id_t = uint64_t;
using amount_t = boost::multiprecision::uint256_t;
using timestamp_milliseconds_t = uint64_t;
using duration_milliseconds_t = uint64_t;

/// Compressed secp256k1 public key.
using public_key_t = std::array<uint8_t, 33>;
/// Recoverable secp256k1 signature, [r || s || v] or [v || r || s].
using signature_t = std::array<uint8_t, 65>;

inline constexpr auto kMillisecondsPerDay = duration_milliseconds_t{86'400'000};

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string_view make_string_view(const bytes_t& bytes);
std::string_view make_string_view(const bytes_view_t& bytes);
std::string make_string(const bytes_t& bytes);
std::string make_string(const bytes_view_t& bytes);

hash32_t make_hash32(const bytes_t& bytes);
std::optional<hash32_t> try_make_hash32(const std::string_view& hex);
hash32_t make_zero_hash();

std::optional<address_t> try_make_address(const std::string_view& hex);
address_t make_zero_address();
bool is_zero(const address_t& address);

/// Largest value representable by a 256-bit amount.
amount_t max_amount();

std::string to_hex(const bytes_view_t& bytes);
std::string to_hex(const address_t& address);
std::optional<bytes_t> try_from_hex(const std::string_view hex);

}  // namespace leasehold::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
