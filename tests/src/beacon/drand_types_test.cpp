#include <chipmint/beacon/drand.hpp>
#include <chipmint/crypto/bls.hpp>
#include <chipmint/crypto/verify.hpp>
#include <chipmint/testing/beacon_signer.hpp>
#include <chipmint/testing/common.hpp>
#include <gtest/gtest.h>

#include <algorithm>
#include <string_view>

namespace {

// Signature published by the mainnet chain for round 367.
constexpr auto kMainnetSignatureHex = std::string_view{
    "90957ebc0719f8bfb67640aff8ca219bf9f2c5240e60a8711c968d93370d38f87b38ed23"
    "4a8c63863eb81f234efce55b047478848c0de025527b3d3476dfe860632c1b799550de50"
    "a6b9540463e9fb66c8016b89c04a9f52dabdc988e69463c1"};

}  // namespace

TEST(beacon_drand, round_is_encoded_big_endian) {
  auto encoded = chipmint::beacon::encode_round(0x0102030405060708ULL);
  EXPECT_EQ(encoded, (std::array<uint8_t, 8>{1, 2, 3, 4, 5, 6, 7, 8}));
  EXPECT_EQ(chipmint::beacon::encode_round(1),
            (std::array<uint8_t, 8>{0, 0, 0, 0, 0, 0, 0, 1}));
}

TEST(beacon_drand, digest_hashes_previous_signature_then_round) {
  auto previous = chipmint::schema::bytes_t{0xDE, 0xAD};
  auto material = previous;
  auto round_bytes = chipmint::beacon::encode_round(77);
  material.insert(std::end(material), std::begin(round_bytes),
                  std::end(round_bytes));
  EXPECT_EQ(
      chipmint::beacon::make_round_digest(chipmint::testing::as_view(previous),
                                          77),
      chipmint::crypto::sha256(chipmint::testing::as_view(material)));
  EXPECT_NE(
      chipmint::beacon::make_round_digest(chipmint::testing::as_view(previous),
                                          77),
      chipmint::beacon::make_round_digest(chipmint::testing::as_view(previous),
                                          78));
}

TEST(beacon_drand, default_key_is_the_mainnet_chain_key) {
  const auto& key = chipmint::beacon::drand_public_key();
  EXPECT_EQ(chipmint::schema::to_hex(chipmint::testing::as_view(key)),
            chipmint::beacon::kDrandPublicKeyHex);
  // Compressed G1 point flag.
  EXPECT_EQ(key[0] & 0x80, 0x80);
}

TEST(beacon_drand, verifies_chained_beacon_with_explicit_key) {
  ASSERT_TRUE(chipmint::crypto::bls::available())
      << "relic is not configured for BLS12-381";
  auto beacon = chipmint::testing::beacon_signer{};
  auto key = beacon.public_key();
  ASSERT_TRUE(key.has_value());

  auto previous = chipmint::schema::bytes_t(96, 0x11);
  auto signature = beacon.sign(previous, 1000);
  ASSERT_EQ(signature.size(), chipmint::crypto::bls::kSignatureSize);

  EXPECT_TRUE(chipmint::beacon::verify_beacon_signature(
      *key, chipmint::testing::as_view(signature),
      chipmint::testing::as_view(previous), 1000));
  EXPECT_FALSE(chipmint::beacon::verify_beacon_signature(
      *key, chipmint::testing::as_view(signature),
      chipmint::testing::as_view(previous), 1001));

  auto other_previous = previous;
  other_previous[5] ^= 0x01;
  EXPECT_FALSE(chipmint::beacon::verify_beacon_signature(
      *key, chipmint::testing::as_view(signature),
      chipmint::testing::as_view(other_previous), 1000));
}

TEST(beacon_drand, mainnet_key_rejects_foreign_signatures) {
  ASSERT_TRUE(chipmint::crypto::bls::available())
      << "relic is not configured for BLS12-381";
  auto beacon = chipmint::testing::beacon_signer{};
  auto previous = chipmint::schema::bytes_t(96, 0x22);
  auto signature = beacon.sign(previous, 12);
  ASSERT_FALSE(signature.empty());
  EXPECT_FALSE(chipmint::beacon::verify_beacon_signature(
      chipmint::testing::as_view(signature),
      chipmint::testing::as_view(previous), 12));
}

TEST(beacon_drand, mainnet_wire_points_decode) {
  ASSERT_TRUE(chipmint::crypto::bls::available())
      << "relic is not configured for BLS12-381";
  const auto& key = chipmint::beacon::drand_public_key();
  EXPECT_TRUE(
      chipmint::crypto::bls::is_valid_public_key(chipmint::testing::as_view(key)));

  auto signature = chipmint::schema::try_from_hex(kMainnetSignatureHex);
  ASSERT_TRUE(signature.has_value());
  ASSERT_EQ(signature->size(), chipmint::crypto::bls::kSignatureSize);
  EXPECT_TRUE(chipmint::crypto::bls::is_valid_signature(
      chipmint::testing::as_view(*signature)));

  // Reading x as (c0 || c1) lands on the curve but outside the subgroup.
  constexpr auto kHalf = chipmint::crypto::bls::kSignatureSize / 2;
  const auto flags = static_cast<uint8_t>((*signature)[0] & 0xE0);
  auto swapped = chipmint::schema::bytes_t{};
  swapped.insert(std::end(swapped), std::begin(*signature) + kHalf,
                 std::end(*signature));
  swapped.insert(std::end(swapped), std::begin(*signature),
                 std::begin(*signature) + kHalf);
  swapped[kHalf] = static_cast<uint8_t>(swapped[kHalf] & 0x1F);
  swapped[0] = static_cast<uint8_t>(swapped[0] | flags);
  EXPECT_FALSE(chipmint::crypto::bls::is_valid_signature(
      chipmint::testing::as_view(swapped)));

  // A mainnet point never verifies under a foreign previous signature.
  auto previous = chipmint::schema::bytes_t(96, 0x00);
  EXPECT_FALSE(chipmint::beacon::verify_beacon_signature(
      chipmint::testing::as_view(*signature),
      chipmint::testing::as_view(previous), 367));
}
