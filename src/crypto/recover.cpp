#include <leasehold/blake3/hash.hpp>
#include <leasehold/crypto/recover.hpp>

#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/ec.h>
#include <openssl/ecdsa.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>

#include <algorithm>
#include <array>
#include <iterator>
#include <memory>
#include <vector>

namespace leasehold::crypto {

namespace {

using evp_pkey_ctx_ptr =
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
using ecdsa_sig_ptr = std::unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)>;
using bignum_ptr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;
using bn_ctx_ptr = std::unique_ptr<BN_CTX, decltype(&BN_CTX_free)>;
using ec_group_ptr = std::unique_ptr<EC_GROUP, decltype(&EC_GROUP_free)>;
using ec_point_ptr = std::unique_ptr<EC_POINT, decltype(&EC_POINT_free)>;

struct compact_signature_t final {
  std::array<uint8_t, 32> r{};
  std::array<uint8_t, 32> s{};
  uint8_t recovery_id{};
};

std::optional<compact_signature_t> split_signature(
    const leasehold::schema::signature_t& signature) {
  auto out = compact_signature_t{};
  std::copy_n(signature.data(), 32, out.r.data());
  std::copy_n(signature.data() + 32, 32, out.s.data());
  auto v = signature[64];
  if (v >= 27) {
    v = static_cast<uint8_t>(v - 27);
  }
  if (v > 1) {
    return std::nullopt;
  }
  out.recovery_id = v;
  return out;
}

std::optional<std::array<uint8_t, 32>> sha256(
    const leasehold::schema::bytes_view_t& message) {
  auto out = std::array<uint8_t, 32>{};
  auto size = 0u;
  if (EVP_Digest(message.data(), message.size(), out.data(), &size,
                 EVP_sha256(), nullptr) != 1 ||
      size != out.size()) {
    return std::nullopt;
  }
  return out;
}

}  // namespace

bool available() {
  static const auto available_now = [] {
    auto group = ec_group_ptr{EC_GROUP_new_by_curve_name(NID_secp256k1),
                              EC_GROUP_free};
    return group != nullptr;
  }();
  return available_now;
}

bool verify_signature(const leasehold::schema::bytes_view_t& message,
                      const leasehold::schema::public_key_t& signer,
                      const leasehold::schema::signature_t& signature) {
  auto compact = split_signature(signature);
  if (!compact.has_value()) {
    return false;
  }

  auto key_ctx = evp_pkey_ctx_ptr{
      EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), EVP_PKEY_CTX_free};
  if (!key_ctx) {
    return false;
  }
  if (EVP_PKEY_fromdata_init(key_ctx.get()) != 1) {
    return false;
  }

  auto* group_name = const_cast<char*>("secp256k1");
  auto params =
      std::array{OSSL_PARAM_construct_utf8_string(OSSL_PKEY_PARAM_GROUP_NAME,
                                                  group_name, 0),
                 OSSL_PARAM_construct_octet_string(
                     OSSL_PKEY_PARAM_PUB_KEY,
                     const_cast<unsigned char*>(signer.data()), signer.size()),
                 OSSL_PARAM_construct_end()};

  auto* raw_pkey = static_cast<EVP_PKEY*>(nullptr);
  if (EVP_PKEY_fromdata(key_ctx.get(), &raw_pkey, EVP_PKEY_PUBLIC_KEY,
                        params.data()) != 1) {
    return false;
  }
  auto pkey = evp_pkey_ptr{raw_pkey, EVP_PKEY_free};

  auto ecdsa_sig = ecdsa_sig_ptr{ECDSA_SIG_new(), ECDSA_SIG_free};
  if (!ecdsa_sig) {
    return false;
  }
  auto r = bignum_ptr{BN_bin2bn(compact->r.data(), 32, nullptr), BN_free};
  auto s = bignum_ptr{BN_bin2bn(compact->s.data(), 32, nullptr), BN_free};
  if (!r || !s ||
      ECDSA_SIG_set0(ecdsa_sig.get(), r.release(), s.release()) != 1) {
    return false;
  }

  auto der_len = i2d_ECDSA_SIG(ecdsa_sig.get(), nullptr);
  if (der_len <= 0) {
    return false;
  }
  auto der = std::vector<uint8_t>(static_cast<size_t>(der_len));
  auto* der_ptr = der.data();
  i2d_ECDSA_SIG(ecdsa_sig.get(), &der_ptr);

  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    return false;
  }

  auto ok = false;
  if (EVP_DigestVerifyInit(ctx.get(), nullptr, EVP_sha256(), nullptr,
                           pkey.get()) == 1) {
    ok = EVP_DigestVerify(ctx.get(), der.data(), der.size(), message.data(),
                          message.size()) == 1;
  }
  return ok;
}

std::optional<leasehold::schema::public_key_t> recover_public_key(
    const leasehold::schema::bytes_view_t& message,
    const leasehold::schema::signature_t& signature) {
  auto compact = split_signature(signature);
  auto digest = sha256(message);
  if (!compact.has_value() || !digest.has_value()) {
    return std::nullopt;
  }

  auto group =
      ec_group_ptr{EC_GROUP_new_by_curve_name(NID_secp256k1), EC_GROUP_free};
  auto ctx = bn_ctx_ptr{BN_CTX_new(), BN_CTX_free};
  if (!group || !ctx) {
    return std::nullopt;
  }
  const auto* order = EC_GROUP_get0_order(group.get());

  auto r = bignum_ptr{BN_bin2bn(compact->r.data(), 32, nullptr), BN_free};
  auto s = bignum_ptr{BN_bin2bn(compact->s.data(), 32, nullptr), BN_free};
  auto e = bignum_ptr{BN_bin2bn(digest->data(), 32, nullptr), BN_free};
  if (!r || !s || !e) {
    return std::nullopt;
  }
  if (BN_is_zero(r.get()) || BN_is_zero(s.get()) ||
      BN_cmp(r.get(), order) >= 0 || BN_cmp(s.get(), order) >= 0) {
    return std::nullopt;
  }

  // R is the curve point whose x coordinate is r and whose y parity is the
  // recovery id. Q = r^-1 * (s * R - e * G).
  auto point_r = ec_point_ptr{EC_POINT_new(group.get()), EC_POINT_free};
  if (!point_r ||
      EC_POINT_set_compressed_coordinates(group.get(), point_r.get(), r.get(),
                                          compact->recovery_id,
                                          ctx.get()) != 1) {
    return std::nullopt;
  }

  auto r_inverse = bignum_ptr{BN_mod_inverse(nullptr, r.get(), order,
                                             ctx.get()),
                              BN_free};
  auto u1 = bignum_ptr{BN_new(), BN_free};
  auto u2 = bignum_ptr{BN_new(), BN_free};
  auto negated_e = bignum_ptr{BN_new(), BN_free};
  if (!r_inverse || !u1 || !u2 || !negated_e) {
    return std::nullopt;
  }
  if (BN_mod_sub(negated_e.get(), order, e.get(), order, ctx.get()) != 1 ||
      BN_mod_mul(u1.get(), negated_e.get(), r_inverse.get(), order,
                 ctx.get()) != 1 ||
      BN_mod_mul(u2.get(), s.get(), r_inverse.get(), order, ctx.get()) != 1) {
    return std::nullopt;
  }

  auto point_q = ec_point_ptr{EC_POINT_new(group.get()), EC_POINT_free};
  if (!point_q || EC_POINT_mul(group.get(), point_q.get(), u1.get(),
                               point_r.get(), u2.get(), ctx.get()) != 1) {
    return std::nullopt;
  }
  if (EC_POINT_is_at_infinity(group.get(), point_q.get()) == 1) {
    return std::nullopt;
  }

  auto public_key = leasehold::schema::public_key_t{};
  auto written = EC_POINT_point2oct(group.get(), point_q.get(),
                                    POINT_CONVERSION_COMPRESSED,
                                    public_key.data(), public_key.size(),
                                    ctx.get());
  if (written != public_key.size()) {
    return std::nullopt;
  }
  return public_key;
}

leasehold::schema::address_t address_from_public_key(
    const leasehold::schema::public_key_t& public_key) {
  auto digest = leasehold::blake3::hash(
      leasehold::schema::bytes_view_t{public_key.data(), public_key.size()});
  auto address = leasehold::schema::address_t{};
  std::copy(std::end(digest) - static_cast<std::ptrdiff_t>(address.size()),
            std::end(digest), std::begin(address));
  return address;
}

std::optional<leasehold::schema::address_t> recover_address(
    const leasehold::schema::bytes_view_t& message,
    const leasehold::schema::signature_t& signature) {
  auto public_key = recover_public_key(message, signature);
  if (!public_key.has_value()) {
    return std::nullopt;
  }
  if (!verify_signature(message, *public_key, signature)) {
    return std::nullopt;
  }
  return address_from_public_key(*public_key);
}

}  // namespace leasehold::crypto
