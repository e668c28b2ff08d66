#pragma once

#include <chipmint/schema/primitives.hpp>

namespace chipmint::crypto {

/// True when the OpenSSL build exposes secp256k1 and SHA-256.
bool available();

chipmint::schema::hash32_t sha256(const chipmint::schema::bytes_view_t& bytes);

/// Verify an ECDSA secp256k1 signature over SHA-256(message).
///
/// `public_key` is a SEC1 encoded point (33 byte compressed or 65 byte
/// uncompressed). `signature` is compact `r || s`, or 65 bytes carrying a
/// recovery id at either end.
bool verify_secp256k1(const chipmint::schema::bytes_view_t& message,
                      const chipmint::schema::bytes_view_t& public_key,
                      const chipmint::schema::bytes_view_t& signature);

}  // namespace chipmint::crypto
