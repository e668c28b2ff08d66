#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace chipmint::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using address_t = hash32_t;
using token_id_t = hash32_t;
using timestamp_milliseconds_t = uint64_t;
using duration_milliseconds_t = uint64_t;
using round_t = uint64_t;

/// Raw chip public key bytes. Identity of a physical chip is exact byte
/// equality of this value.
using chip_public_key_t = bytes_t;
/// Compressed secp256k1 signature `r || s`, or 65 bytes with recovery id.
using chip_signature_t = bytes_t;
/// Compressed BLS12-381 G2 point produced by the beacon.
using beacon_signature_t = bytes_t;
/// Compressed BLS12-381 G1 point identifying a beacon chain.
using beacon_public_key_t = std::array<uint8_t, 48>;

bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

std::optional<hash32_t> try_make_hash32(const std::string_view& hex);

std::string to_hex(const bytes_view_t& bytes);
std::string to_hex(const bytes_t& bytes);
std::string to_hex(const hash32_t& bytes);
std::optional<bytes_t> try_from_hex(const std::string_view hex);

}  // namespace chipmint::schema
