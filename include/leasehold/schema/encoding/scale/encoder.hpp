#pragma once
#include <leasehold/common/critical.hpp>
#include <leasehold/schema/encoding/encoder.hpp>
#include <leasehold/schema/encoding/scale/action.hpp>
#include <leasehold/schema/encoding/scale/audit_event.hpp>
#include <leasehold/schema/encoding/scale/cooldown_config.hpp>
#include <leasehold/schema/encoding/scale/entity_state.hpp>
#include <leasehold/schema/encoding/scale/operator_permit.hpp>
#include <leasehold/schema/encoding/scale/router_request.hpp>
#include <leasehold/schema/encoding/scale/spend_limit_config.hpp>
#include <leasehold/schema/encoding/scale/spend_window_state.hpp>
#include <leasehold/schema/encoding/scale/template_state.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace leasehold::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  leasehold::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, leasehold::schema::bytes_t& out);

  template <typename T>
  T decode(const leasehold::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const leasehold::schema::bytes_view_t& bytes);
};

template <typename T>
leasehold::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    leasehold::common::critical("leasehold.schema.encoding",
                                "failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        leasehold::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const leasehold::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    leasehold::common::critical("leasehold.schema.encoding",
                                "failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const leasehold::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace leasehold::schema::encoding
