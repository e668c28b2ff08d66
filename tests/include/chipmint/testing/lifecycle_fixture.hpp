#pragma once

#include <chipmint/archive/archive.hpp>
#include <chipmint/crypto/bls.hpp>
#include <chipmint/crypto/verify.hpp>
#include <chipmint/lifecycle/token_lifecycle.hpp>
#include <chipmint/schema/encoding/scale/encoder.hpp>
#include <chipmint/schema/primitives.hpp>
#include <chipmint/storage/rocksdb/storage.hpp>
#include <chipmint/testing/beacon_signer.hpp>
#include <chipmint/testing/chip_signer.hpp>
#include <chipmint/testing/common.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace chipmint::testing {

using scale_encoder_t = chipmint::schema::encoding::encoder<
    chipmint::schema::encoding::scale_encoder_tag>;

/// Beacon output for one round: the signature and the one it chains on.
struct beacon_round_t final {
  chipmint::schema::round_t round{};
  chipmint::schema::bytes_t previous_signature;
  chipmint::schema::bytes_t signature;
};

inline const chipmint::schema::hash32_t& admin_secret() {
  static const auto secret = make_hash(0xA0);
  return secret;
}

/// Fresh RocksDB store with an initialized archive, a lifecycle that checks
/// beacons against a local test key, and the admin capability in hand.
class lifecycle_fixture final {
 public:
  explicit lifecycle_fixture(const std::string_view db_prefix)
      : db_path_{make_db_path(db_prefix)},
        encoder_{},
        storage_{chipmint::storage::make_storage<
            chipmint::storage::rocksdb_storage_tag>(db_path_)},
        archive_{encoder_, storage_},
        lifecycle_{encoder_, storage_},
        capability_{archive_.initialize(admin_secret())} {
    lifecycle_.set_beacon_verifier(beacon_.verifier());
  }

  lifecycle_fixture(const lifecycle_fixture&) = delete;
  lifecycle_fixture& operator=(const lifecycle_fixture&) = delete;
  lifecycle_fixture(lifecycle_fixture&&) = delete;
  lifecycle_fixture& operator=(lifecycle_fixture&&) = delete;

  ~lifecycle_fixture() {
    storage_.database.reset();
    remove_path(db_path_);
  }

  scale_encoder_t& encoder() { return encoder_; }
  chipmint::storage::storage<chipmint::storage::rocksdb_storage_tag>&
  storage() {
    return storage_;
  }
  chipmint::archive::archive& archive() { return archive_; }
  chipmint::lifecycle::token_lifecycle& lifecycle() { return lifecycle_; }
  const beacon_signer& beacon() const { return beacon_; }

  const chipmint::archive::admin_capability& capability() const {
    return *capability_;
  }

  /// Provision a chip key in the archive; returns false if the archive
  /// refused.
  bool provision(const chipmint::schema::bytes_t& chip_public_key) {
    return archive_.add_entry(*capability_, as_view(chip_public_key)).ok();
  }

  bool provision(const chip_signer& chip) {
    return provision(chip.public_key());
  }

  chipmint::schema::mint_status_t status_of(
      const chipmint::schema::bytes_t& chip_public_key,
      chipmint::schema::error_code& code) const {
    auto status = chipmint::schema::mint_status_t{};
    code = archive_.get_status(as_view(chip_public_key), status);
    return status;
  }

  beacon_round_t publish(const chipmint::schema::round_t round) const {
    auto out = beacon_round_t{};
    out.round = round;
    const auto seed = make_hash(static_cast<uint8_t>(round));
    out.previous_signature =
        chipmint::schema::bytes_t{std::begin(seed), std::end(seed)};
    out.signature = beacon_.sign(out.previous_signature, round);
    return out;
  }

  chipmint::schema::mint_t make_mint(
      const chip_signer& chip,
      const chipmint::schema::address_t& caller,
      const beacon_round_t& beacon) const {
    auto request = chipmint::schema::mint_t{};
    request.proof.chip_signature = chip.sign_for(caller, beacon.signature);
    request.proof.chip_public_key = chip.public_key();
    request.proof.beacon_signature = beacon.signature;
    request.proof.previous_beacon_signature = beacon.previous_signature;
    request.proof.round = beacon.round;
    request.metadata.name = "chip token";
    request.metadata.url = "https://example.com/token";
    return request;
  }

  chipmint::schema::transfer_t make_transfer(
      const chip_signer& chip,
      const chipmint::schema::address_t& caller,
      const chipmint::schema::token_id_t& token_id,
      const chipmint::schema::address_t& receiver,
      const beacon_round_t& beacon) const {
    auto request = chipmint::schema::transfer_t{};
    request.chip_signature = chip.sign_for(caller, beacon.signature);
    request.beacon_signature = beacon.signature;
    request.previous_beacon_signature = beacon.previous_signature;
    request.round = beacon.round;
    request.token_id = token_id;
    request.receiver = receiver;
    return request;
  }

  chipmint::schema::rebind_t make_rebind(
      const chip_signer& new_chip,
      const chipmint::schema::address_t& caller,
      const chipmint::schema::token_id_t& token_id,
      const beacon_round_t& beacon) const {
    auto request = chipmint::schema::rebind_t{};
    request.chip_signature = new_chip.sign_for(caller, beacon.signature);
    request.new_chip_public_key = new_chip.public_key();
    request.beacon_signature = beacon.signature;
    request.previous_beacon_signature = beacon.previous_signature;
    request.round = beacon.round;
    request.token_id = token_id;
    return request;
  }

  chipmint::schema::token_t decode_token(
      const chipmint::schema::operation_result_t& result) {
    return encoder_.decode<chipmint::schema::token_t>(as_view(result.data));
  }

 private:
  std::string db_path_;
  scale_encoder_t encoder_;
  chipmint::storage::storage<chipmint::storage::rocksdb_storage_tag> storage_;
  chipmint::archive::archive archive_;
  chipmint::lifecycle::token_lifecycle lifecycle_;
  beacon_signer beacon_;
  std::optional<chipmint::archive::admin_capability> capability_;
};

inline chipmint::lifecycle::beacon_verifier_t allow_all_beacons() {
  return [](const chipmint::schema::bytes_view_t&,
            const chipmint::schema::bytes_view_t&,
            const chipmint::schema::round_t) { return true; };
}

inline chipmint::lifecycle::chip_verifier_t allow_all_chips() {
  return [](const chipmint::schema::bytes_view_t&,
            const chipmint::schema::bytes_view_t&,
            const chipmint::schema::bytes_view_t&,
            const chipmint::schema::bytes_view_t&) { return true; };
}

}  // namespace chipmint::testing
