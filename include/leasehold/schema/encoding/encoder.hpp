#pragma once
#include <leasehold/schema/primitives.hpp>
#include <optional>
#include <span>

namespace leasehold::schema::encoding {

// Encoder selection is a build time setting: every component is written
// against encoder<Library> and the build picks the library tag.
template <typename Library>
struct encoder {
  template <typename T>
  leasehold::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, leasehold::schema::bytes_t& out);

  template <typename T>
  T decode(const leasehold::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const leasehold::schema::bytes_view_t& bytes);
};

}  // namespace leasehold::schema::encoding
