#include <leasehold/blake3/hash.hpp>
#include <leasehold/crypto/typed_message.hpp>
#include <leasehold/schema/encoding/scale/encoder.hpp>

#include <iterator>
#include <string_view>
#include <tuple>

namespace leasehold::crypto {

namespace {

using encoder_t = leasehold::schema::encoding::encoder<
    leasehold::schema::encoding::scale_encoder_tag>;

inline constexpr auto kDomainType = std::string_view{
    "Domain(string name,string version,bytes32 networkId,address "
    "verifyingComponent)"};
inline constexpr auto kOperatorPermitType = std::string_view{
    "OperatorPermit(uint64 entityId,address renter,address operator,uint64 "
    "expiry,uint64 nonce,uint64 deadline)"};

inline constexpr auto kRouterRequestType = std::string_view{
    "RouterRequest(uint16 version,bytes32 networkId,uint64 nonce,address "
    "signer,bytes call)"};

template <typename Container>
void append(leasehold::schema::bytes_t& out, const Container& bytes) {
  out.insert(std::end(out), std::begin(bytes), std::end(bytes));
}

}  // namespace

leasehold::schema::hash32_t domain_separator(const signing_domain& domain) {
  auto material = leasehold::schema::bytes_t{};
  material.reserve(32 * 5);
  append(material, leasehold::blake3::hash(kDomainType));
  append(material, leasehold::blake3::hash(domain.name));
  append(material, leasehold::blake3::hash(domain.version));
  append(material, domain.network_id);
  append(material, domain.verifying_component);
  return leasehold::blake3::hash(
      leasehold::schema::bytes_view_t{material.data(), material.size()});
}

leasehold::schema::hash32_t struct_hash(
    const leasehold::schema::operator_permit_t& permit) {
  auto material = leasehold::schema::bytes_t{};
  append(material, leasehold::blake3::hash(kOperatorPermitType));
  auto encoder = encoder_t{};
  encoder.encode(std::tuple{permit.entity_id, permit.renter,
                            permit.operator_address, permit.expiry,
                            permit.nonce, permit.deadline},
                 material);
  return leasehold::blake3::hash(
      leasehold::schema::bytes_view_t{material.data(), material.size()});
}

leasehold::schema::bytes_t signing_message(
    const signing_domain& domain,
    const leasehold::schema::operator_permit_t& permit) {
  auto message = leasehold::schema::bytes_t{0x19, 0x01};
  message.reserve(2 + 64);
  append(message, domain_separator(domain));
  append(message, struct_hash(permit));
  return message;
}

leasehold::schema::hash32_t struct_hash(
    const leasehold::schema::router_request_t& request) {
  auto material = leasehold::schema::bytes_t{};
  append(material, leasehold::blake3::hash(kRouterRequestType));
  encoder_t{}.encode(request, material);
  return leasehold::blake3::hash(
      leasehold::schema::bytes_view_t{material.data(), material.size()});
}

leasehold::schema::bytes_t signing_message(
    const signing_domain& domain,
    const leasehold::schema::router_request_t& request) {
  auto message = leasehold::schema::bytes_t{0x19, 0x01};
  message.reserve(2 + 64);
  append(message, domain_separator(domain));
  append(message, struct_hash(request));
  return message;
}

}  // namespace leasehold::crypto
