#pragma once

#include <chipmint/schema/primitives.hpp>

#include <cstdint>
#include <string_view>
#include <tuple>

// Schema key type: state keys.
// Canonical key prefixes and key codecs for archive entries, tokens and the
// system records the archive and lifecycle maintain.
namespace chipmint::schema::key {

inline constexpr std::string_view kArchiveKeyPrefix{"SYS|STATE|ARCHIVE|"};
inline constexpr std::string_view kTokenKeyPrefix{"SYS|STATE|TOKEN|"};
inline constexpr std::string_view kOwnerKeyPrefix{"SYS|STATE|OWNER|"};
inline constexpr std::string_view kMintSequenceKey{"SYS|STATE|MINT_SEQ"};
inline constexpr std::string_view kAdminCapabilityKey{"SYS|STATE|ADMIN_CAP"};

template <typename Encoder, typename T>
chipmint::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                            std::string_view prefix,
                                            const T& id) {
  // SCALE product types are encoded as concatenated field bytes.
  // This is equivalent to encoding tuple{prefix, id}.
  auto key = encoder.encode(prefix);
  encoder.encode(id, key);
  return key;
}

template <typename Encoder>
chipmint::schema::bytes_t make_prefix_key(Encoder& encoder,
                                          std::string_view prefix) {
  return encoder.encode(prefix);
}

/// Archive entries are keyed by the raw chip public key bytes appended to the
/// encoded prefix, so two keys collide only on byte-identical public keys.
template <typename Encoder>
chipmint::schema::bytes_t make_archive_key(
    Encoder& encoder,
    const chipmint::schema::bytes_view_t& chip_public_key) {
  auto key = make_prefix_key(encoder, kArchiveKeyPrefix);
  key.insert(std::end(key), std::begin(chip_public_key),
             std::end(chip_public_key));
  return key;
}

template <typename Encoder>
chipmint::schema::bytes_t make_token_key(
    Encoder& encoder,
    const chipmint::schema::token_id_t& token_id) {
  return make_prefixed_key(encoder, kTokenKeyPrefix, token_id);
}

template <typename Encoder>
chipmint::schema::bytes_t make_owner_prefix(
    Encoder& encoder,
    const chipmint::schema::address_t& owner) {
  return make_prefixed_key(encoder, kOwnerKeyPrefix, owner);
}

template <typename Encoder>
chipmint::schema::bytes_t make_owner_key(
    Encoder& encoder,
    const chipmint::schema::address_t& owner,
    const chipmint::schema::token_id_t& token_id) {
  return make_prefixed_key(encoder, kOwnerKeyPrefix,
                           std::tuple{owner, token_id});
}

template <typename Encoder>
chipmint::schema::bytes_t make_mint_sequence_key(Encoder& encoder) {
  return make_prefix_key(encoder, kMintSequenceKey);
}

template <typename Encoder>
chipmint::schema::bytes_t make_admin_capability_key(Encoder& encoder) {
  return make_prefix_key(encoder, kAdminCapabilityKey);
}

}  // namespace chipmint::schema::key
