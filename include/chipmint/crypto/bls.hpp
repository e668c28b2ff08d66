#pragma once

#include <chipmint/schema/primitives.hpp>

#include <array>
#include <optional>
#include <string_view>

namespace chipmint::crypto::bls {

/// Hash-to-curve domain separation tag of the BLS12-381 minimal-pubkey
/// signature suite (public keys in G1, signatures in G2).
inline constexpr std::string_view kMinPkDst{
    "BLS_SIG_BLS12381G2_XMD:SHA-256_SSWU_RO_NUL_"};

inline constexpr std::size_t kPublicKeySize = 48;
inline constexpr std::size_t kSignatureSize = 96;

using secret_key_t = std::array<uint8_t, 32>;
using public_key_t = std::array<uint8_t, kPublicKeySize>;
using signature_t = std::array<uint8_t, kSignatureSize>;

/// True when the pairing backend is configured for BLS12-381.
bool available();

/// Verify a minimal-pubkey BLS signature.
///
/// Points use the compressed big-endian encoding with flag bits in the most
/// significant byte (compression, infinity, sign). Malformed, off-curve,
/// out-of-subgroup and identity points fail verification.
bool verify(const chipmint::schema::bytes_view_t& public_key,
            const chipmint::schema::bytes_view_t& message,
            const chipmint::schema::bytes_view_t& signature);

/// True when bytes decode to a G1 point of the prime-order subgroup.
bool is_valid_public_key(const chipmint::schema::bytes_view_t& public_key);

/// True when bytes decode to a G2 point of the prime-order subgroup.
bool is_valid_signature(const chipmint::schema::bytes_view_t& signature);

/// Derive the compressed G1 public key of a secret scalar. Used by local
/// beacons and test fixtures; std::nullopt when the scalar reduces to zero.
std::optional<public_key_t> derive_public_key(const secret_key_t& secret);

/// Produce a compressed G2 signature over message.
std::optional<signature_t> sign(const secret_key_t& secret,
                                const chipmint::schema::bytes_view_t& message);

}  // namespace chipmint::crypto::bls
