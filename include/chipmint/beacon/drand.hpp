#pragma once

#include <chipmint/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <string_view>

namespace chipmint::beacon {

/// Group public key of the drand default (chained) mainnet chain.
inline constexpr std::string_view kDrandPublicKeyHex{
    "868f005eb8e6e4ca0a47c8a77ceaa5309a47978a7c71bc5cce96366b5d7a569937c529ee"
    "da66c7293784a9402801af31"};

/// The beacon public key every protocol operation verifies against.
const chipmint::schema::beacon_public_key_t& drand_public_key();

/// Encode round as 8 bytes, most significant first.
std::array<uint8_t, 8> encode_round(chipmint::schema::round_t round);

/// Message signed by a chained beacon for round:
/// `SHA-256(previous_signature || big_endian_u64(round))`.
chipmint::schema::hash32_t make_round_digest(
    const chipmint::schema::bytes_view_t& previous_signature,
    chipmint::schema::round_t round);

/// Verify a chained beacon signature against the fixed drand public key.
bool verify_beacon_signature(
    const chipmint::schema::bytes_view_t& signature,
    const chipmint::schema::bytes_view_t& previous_signature,
    chipmint::schema::round_t round);

/// Verify a chained beacon signature against an explicit chain key.
bool verify_beacon_signature(
    const chipmint::schema::beacon_public_key_t& public_key,
    const chipmint::schema::bytes_view_t& signature,
    const chipmint::schema::bytes_view_t& previous_signature,
    chipmint::schema::round_t round);

}  // namespace chipmint::beacon
