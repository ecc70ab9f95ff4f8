#pragma once
#include <leasehold/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace leasehold::storage {

using key_value_entry_t =
    std::pair<leasehold::schema::bytes_t, leasehold::schema::bytes_t>;

/// Key-value store shared by every component. Components only touch keys
/// under the prefix they own (see schema/key/state_keys.hpp).
template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const leasehold::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const leasehold::schema::bytes_view_t& key,
           const T& value) const;

  /// Delete key; missing keys are not an error.
  void erase(const leasehold::schema::bytes_view_t& key) const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const leasehold::schema::bytes_view_t& prefix) const;

  /// Atomically replace all entries under prefix with provided entries.
  void replace_by_prefix(const leasehold::schema::bytes_view_t& prefix,
                         const std::vector<key_value_entry_t>& entries) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace leasehold::storage
