#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <leasehold/common/critical.hpp>
#include <leasehold/storage/storage.hpp>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>

namespace leasehold::storage {

namespace detail {

inline leasehold::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const leasehold::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

inline constexpr auto kStorageCodespace = "leasehold.storage";

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const leasehold::schema::bytes_view_t& key) const;

  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const leasehold::schema::bytes_view_t& key,
           const T& value) const;

  void erase(const leasehold::schema::bytes_view_t& key) const;
  std::vector<key_value_entry_t> list_by_prefix(
      const leasehold::schema::bytes_view_t& prefix) const;
  void replace_by_prefix(const leasehold::schema::bytes_view_t& prefix,
                         const std::vector<key_value_entry_t>& entries) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const leasehold::schema::bytes_view_t& key) const {
  if (!database) {
    leasehold::common::critical(kStorageCodespace,
                                "RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    }
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    leasehold::common::critical(kStorageCodespace,
                                "Failed to get value from RocksDB");
  }
  return {encoder.template decode<T>(leasehold::schema::bytes_view_t{
      reinterpret_cast<const uint8_t*>(value.data()), value.size()})};
}

template <typename T, typename Encoder>
void storage<rocksdb_storage_tag>::put(
    Encoder& encoder,
    const leasehold::schema::bytes_view_t& key,
    const T& value) const {
  if (!database) {
    leasehold::common::critical(kStorageCodespace,
                                "RocksDB database is not initialized");
  }
  auto encoded_value = encoder.encode(value);
  auto value_slice = ROCKSDB_NAMESPACE::Slice{
      reinterpret_cast<const char*>(encoded_value.data()),
      encoded_value.size()};
  auto status = database->Put(ROCKSDB_NAMESPACE::WriteOptions{},
                              detail::to_slice(key), value_slice);
  if (!status.ok()) {
    spdlog::error("Failed to put value into RocksDB: {}", status.ToString());
    leasehold::common::critical(kStorageCodespace,
                                "Failed to put value into RocksDB");
  }
}

}  // namespace leasehold::storage
