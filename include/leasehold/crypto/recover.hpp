#pragma once

#include <leasehold/schema/primitives.hpp>
#include <optional>

namespace leasehold::crypto {

/// True when the OpenSSL build exposes secp256k1.
bool available();

/// Verify a [r || s || v] signature over sha256(message) against `signer`.
bool verify_signature(const leasehold::schema::bytes_view_t& message,
                      const leasehold::schema::public_key_t& signer,
                      const leasehold::schema::signature_t& signature);

/// Recover the compressed public key that produced a [r || s || v]
/// signature over sha256(message). `v` is accepted as 0..1 or 27..28.
std::optional<leasehold::schema::public_key_t> recover_public_key(
    const leasehold::schema::bytes_view_t& message,
    const leasehold::schema::signature_t& signature);

/// Account address of a public key: the trailing 20 bytes of its blake3 hash.
leasehold::schema::address_t address_from_public_key(
    const leasehold::schema::public_key_t& public_key);

/// Recover and verify in one step; std::nullopt when the signature is not
/// valid for any key.
std::optional<leasehold::schema::address_t> recover_address(
    const leasehold::schema::bytes_view_t& message,
    const leasehold::schema::signature_t& signature);

}  // namespace leasehold::crypto
