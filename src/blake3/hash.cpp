#include <blake3.h>
#include <leasehold/blake3/hash.hpp>

namespace leasehold::blake3 {

namespace {

leasehold::schema::hash32_t digest(const void* input, const size_t size) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, input, size);
  auto output = leasehold::schema::hash32_t{};
  static_assert(std::tuple_size_v<leasehold::schema::hash32_t> ==
                BLAKE3_OUT_LEN);
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace

leasehold::schema::hash32_t hash(const std::string_view& str) {
  return digest(str.data(), str.size());
}

leasehold::schema::hash32_t hash(const std::span<const uint8_t>& bytes) {
  return digest(bytes.data(), bytes.size());
}

}  // namespace leasehold::blake3
