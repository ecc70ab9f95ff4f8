#pragma once

#include <leasehold/schema/encoding/scale/encoder.hpp>
#include <leasehold/schema/primitives.hpp>
#include <leasehold/storage/rocksdb/storage.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace leasehold::testing {

using scale_encoder_t = leasehold::schema::encoding::encoder<
    leasehold::schema::encoding::scale_encoder_tag>;
using rocksdb_storage_t =
    leasehold::storage::storage<leasehold::storage::rocksdb_storage_tag>;

inline leasehold::schema::address_t make_address(const uint8_t seed) {
  auto out = leasehold::schema::address_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline leasehold::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = leasehold::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

/// Temporary RocksDB directory with an encoder, removed on destruction.
class storage_fixture final {
 public:
  explicit storage_fixture(const std::string_view db_prefix)
      : db_path_{make_db_path(db_prefix)},
        encoder_{},
        storage_{leasehold::storage::make_storage<
            leasehold::storage::rocksdb_storage_tag>(db_path_)} {}

  storage_fixture(const storage_fixture&) = delete;
  storage_fixture& operator=(const storage_fixture&) = delete;
  storage_fixture(storage_fixture&&) = delete;
  storage_fixture& operator=(storage_fixture&&) = delete;

  ~storage_fixture() {
    storage_.database.reset();
    remove_path(db_path_);
  }

  const std::string& db_path() const { return db_path_; }
  scale_encoder_t& encoder() { return encoder_; }
  rocksdb_storage_t& storage() { return storage_; }

 private:
  std::string db_path_;
  scale_encoder_t encoder_;
  rocksdb_storage_t storage_;
};

}  // namespace leasehold::testing
