#pragma once

#include <leasehold/schema/operator_permit.hpp>
#include <leasehold/schema/primitives.hpp>
#include <leasehold/schema/router_request.hpp>
#include <string>

namespace leasehold::crypto {

/// Domain separation for off-line signed messages. A signature produced for
/// one protocol name, version, network or verifying component never verifies
/// in another.
struct signing_domain final {
  std::string name{"Leasehold"};
  std::string version{"1"};
  leasehold::schema::hash32_t network_id{};
  leasehold::schema::address_t verifying_component{};
};

leasehold::schema::hash32_t domain_separator(const signing_domain& domain);

leasehold::schema::hash32_t struct_hash(
    const leasehold::schema::operator_permit_t& permit);

/// 0x19 0x01 || domain_separator || struct_hash. Signers sign sha256 of this
/// message.
leasehold::schema::bytes_t signing_message(
    const signing_domain& domain,
    const leasehold::schema::operator_permit_t& permit);

/// Hash of the type tag and the SCALE encoding of the whole request, call
/// included.
leasehold::schema::hash32_t struct_hash(
    const leasehold::schema::router_request_t& request);

leasehold::schema::bytes_t signing_message(
    const signing_domain& domain,
    const leasehold::schema::router_request_t& request);

}  // namespace leasehold::crypto
