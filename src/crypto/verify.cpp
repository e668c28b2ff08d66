#include <chipmint/common/critical.hpp>
#include <chipmint/crypto/verify.hpp>

#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/ecdsa.h>
#include <openssl/evp.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <memory>
#include <optional>
#include <vector>

namespace chipmint::crypto {

namespace {

using evp_pkey_ctx_ptr =
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
using ecdsa_sig_ptr = std::unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)>;
using bignum_ptr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;

// Some distributions ship OpenSSL without the secp256k1 group; generating a
// throwaway key is the only reliable probe.
bool openssl_has_secp256k1() {
  auto ctx = evp_pkey_ctx_ptr{
      EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), EVP_PKEY_CTX_free};
  if (!ctx || EVP_PKEY_keygen_init(ctx.get()) <= 0 ||
      EVP_PKEY_CTX_set_group_name(ctx.get(), "secp256k1") <= 0) {
    return false;
  }
  EVP_PKEY* generated = nullptr;
  if (EVP_PKEY_generate(ctx.get(), &generated) <= 0) {
    return false;
  }
  auto key = evp_pkey_ptr{generated, EVP_PKEY_free};
  return key != nullptr;
}

bool openssl_has_sha256() {
  return EVP_sha256() != nullptr;
}

bool is_recovery_id(const uint8_t value) {
  return value <= 3 || (value >= 27 && value <= 34);
}

std::vector<std::array<uint8_t, 64>> compact_secp_signatures(
    const chipmint::schema::bytes_view_t& signature) {
  // Chips emit the compact 64-byte [r || s] form. 65-byte encodings carry a
  // recovery id either first [v || r || s] or last [r || s || v]; recovery
  // ids are accepted as small values (0..3) and legacy style values (27+).
  // When both ends look like a recovery id each reading is tried.
  auto out = std::vector<std::array<uint8_t, 64>>{};
  auto compact = std::array<uint8_t, 64>{};
  if (signature.size() == compact.size()) {
    std::copy_n(signature.data(), compact.size(), compact.data());
    out.push_back(compact);
    return out;
  }
  if (signature.size() != compact.size() + 1) {
    return out;
  }
  if (is_recovery_id(signature[64])) {
    std::copy_n(signature.data(), compact.size(), compact.data());
    out.push_back(compact);
  }
  if (is_recovery_id(signature[0])) {
    std::copy_n(signature.data() + 1, compact.size(), compact.data());
    out.push_back(compact);
  }
  return out;
}

std::optional<evp_pkey_ptr> make_secp256k1_key(
    const chipmint::schema::bytes_view_t& public_key) {
  auto key_ctx = evp_pkey_ctx_ptr{
      EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), EVP_PKEY_CTX_free};
  if (!key_ctx || EVP_PKEY_fromdata_init(key_ctx.get()) != 1) {
    return std::nullopt;
  }

  auto* group_name = const_cast<char*>("secp256k1");
  auto params =
      std::array{OSSL_PARAM_construct_utf8_string(OSSL_PKEY_PARAM_GROUP_NAME,
                                                  group_name, 0),
                 OSSL_PARAM_construct_octet_string(
                     OSSL_PKEY_PARAM_PUB_KEY,
                     const_cast<unsigned char*>(public_key.data()),
                     public_key.size()),
                 OSSL_PARAM_construct_end()};

  auto* raw_pkey = static_cast<EVP_PKEY*>(nullptr);
  if (EVP_PKEY_fromdata(key_ctx.get(), &raw_pkey, EVP_PKEY_PUBLIC_KEY,
                        params.data()) != 1) {
    return std::nullopt;
  }
  return evp_pkey_ptr{raw_pkey, EVP_PKEY_free};
}

bool verify_compact(EVP_PKEY* pkey,
                    const chipmint::schema::bytes_view_t& message,
                    const std::array<uint8_t, 64>& compact_signature) {
  auto ecdsa_sig = ecdsa_sig_ptr{ECDSA_SIG_new(), ECDSA_SIG_free};
  if (!ecdsa_sig) {
    return false;
  }

  auto r = bignum_ptr{BN_bin2bn(compact_signature.data(), 32, nullptr), BN_free};
  auto s = bignum_ptr{BN_bin2bn(compact_signature.data() + 32, 32, nullptr),
                      BN_free};
  if (!r || !s || ECDSA_SIG_set0(ecdsa_sig.get(), r.get(), s.get()) != 1) {
    return false;
  }
  // ECDSA_SIG owns r and s from here on.
  static_cast<void>(r.release());
  static_cast<void>(s.release());

  auto der_len = i2d_ECDSA_SIG(ecdsa_sig.get(), nullptr);
  if (der_len <= 0) {
    return false;
  }
  auto der = std::vector<uint8_t>(static_cast<size_t>(der_len));
  auto* der_ptr = der.data();
  if (i2d_ECDSA_SIG(ecdsa_sig.get(), &der_ptr) != der_len) {
    return false;
  }

  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    return false;
  }
  if (EVP_DigestVerifyInit(ctx.get(), nullptr, EVP_sha256(), nullptr, pkey) !=
      1) {
    return false;
  }
  return EVP_DigestVerify(ctx.get(), der.data(), der.size(), message.data(),
                          message.size()) == 1;
}

}  // namespace

bool available() {
  static const auto available_now =
      openssl_has_secp256k1() && openssl_has_sha256();
  return available_now;
}

chipmint::schema::hash32_t sha256(
    const chipmint::schema::bytes_view_t& bytes) {
  auto digest = chipmint::schema::hash32_t{};
  auto digest_size = static_cast<unsigned int>(digest.size());
  if (EVP_Digest(bytes.data(), bytes.size(), digest.data(), &digest_size,
                 EVP_sha256(), nullptr) != 1 ||
      digest_size != digest.size()) {
    chipmint::common::critical("SHA-256 digest failed");
  }
  return digest;
}

bool verify_secp256k1(const chipmint::schema::bytes_view_t& message,
                      const chipmint::schema::bytes_view_t& public_key,
                      const chipmint::schema::bytes_view_t& signature) {
  const auto candidates = compact_secp_signatures(signature);
  if (candidates.empty()) {
    spdlog::debug("Rejecting secp256k1 signature of length {}",
                  signature.size());
    return false;
  }
  if (public_key.size() != 33 && public_key.size() != 65) {
    spdlog::debug("Rejecting secp256k1 public key of length {}",
                  public_key.size());
    return false;
  }

  auto pkey = make_secp256k1_key(public_key);
  if (!pkey) {
    spdlog::debug("Rejecting secp256k1 public key not on the curve");
    return false;
  }
  return std::ranges::any_of(candidates, [&](const auto& compact) {
    return verify_compact(pkey->get(), message, compact);
  });
}

}  // namespace chipmint::crypto
