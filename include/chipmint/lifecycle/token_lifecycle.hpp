#pragma once

#include <chipmint/archive/archive.hpp>
#include <chipmint/lifecycle/verifiers.hpp>
#include <chipmint/schema/encoding/scale/encoder.hpp>
#include <chipmint/schema/error_code.hpp>
#include <chipmint/schema/mint.hpp>
#include <chipmint/schema/operation_result.hpp>
#include <chipmint/schema/primitives.hpp>
#include <chipmint/schema/rebind.hpp>
#include <chipmint/schema/token.hpp>
#include <chipmint/schema/transfer.hpp>
#include <chipmint/storage/rocksdb/storage.hpp>

#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace chipmint::lifecycle {

/// Token state machine bound to physical chips.
///
/// Every mutating call proves possession of the chip by a secp256k1 signature
/// over the caller address and a fresh drand beacon output. Checks run in a
/// fixed order and the first failure is returned; nothing is written unless
/// every check passes, and then all records change in one write batch.
class token_lifecycle final {
 public:
  token_lifecycle(
      chipmint::schema::encoding::encoder<
          chipmint::schema::encoding::scale_encoder_tag>& encoder,
      chipmint::storage::storage<chipmint::storage::rocksdb_storage_tag>&
          storage);

  /// Create a token for a provisioned, not yet minted chip, owned by caller.
  /// `archive` must sit on the lifecycle's own store, else `storage_mismatch`.
  ///
  /// Order: archive status, metadata shape, round freshness, beacon
  /// signature, chip signature.
  chipmint::schema::operation_result_t mint(
      const chipmint::schema::address_t& caller,
      const chipmint::schema::mint_t& request,
      chipmint::archive::archive& archive,
      chipmint::schema::timestamp_milliseconds_t now_ms);

  /// Move a token from caller to `request.receiver`. Self transfers are
  /// refused before any signature work.
  chipmint::schema::operation_result_t transfer(
      const chipmint::schema::address_t& caller,
      const chipmint::schema::transfer_t& request,
      chipmint::schema::timestamp_milliseconds_t now_ms);

  /// Re-associate a token with a replacement chip. The new key must be
  /// provisioned and unminted; the old archive entry is removed.
  chipmint::schema::operation_result_t rebind(
      const chipmint::schema::address_t& caller,
      const chipmint::schema::rebind_t& request,
      chipmint::archive::archive& archive,
      chipmint::schema::timestamp_milliseconds_t now_ms);

  std::optional<chipmint::schema::token_t> token(
      const chipmint::schema::token_id_t& token_id) const;

  std::vector<chipmint::schema::token_t> tokens_owned_by(
      const chipmint::schema::address_t& owner) const;

  /// Replace the drand beacon check. Defaults to the mainnet chain key.
  void set_beacon_verifier(beacon_verifier_t verifier);

  /// Replace the chip signature check. Defaults to secp256k1/SHA-256.
  void set_chip_verifier(chip_verifier_t verifier);

 private:
  bool shares_storage(const chipmint::archive::archive& archive) const;

  /// Freshness, beacon and chip checks shared by every mutating call.
  chipmint::schema::error_code verify_proof(
      const chipmint::schema::address_t& caller,
      const chipmint::schema::bytes_view_t& chip_signature,
      const chipmint::schema::bytes_view_t& chip_public_key,
      const chipmint::schema::bytes_view_t& beacon_signature,
      const chipmint::schema::bytes_view_t& previous_beacon_signature,
      chipmint::schema::round_t round,
      chipmint::schema::timestamp_milliseconds_t now_ms) const;

  chipmint::schema::token_id_t next_token_id(
      const chipmint::schema::bytes_view_t& chip_public_key,
      const chipmint::schema::address_t& caller,
      uint64_t sequence);

  uint64_t load_mint_sequence() const;

  void stage_token(chipmint::storage::write_batch_t& batch,
                   const chipmint::schema::token_t& token);

  mutable std::mutex mutex_;
  chipmint::schema::encoding::encoder<
      chipmint::schema::encoding::scale_encoder_tag>& encoder_;
  chipmint::storage::storage<chipmint::storage::rocksdb_storage_tag>& storage_;
  beacon_verifier_t beacon_verifier_;
  chip_verifier_t chip_verifier_;
};

}  // namespace chipmint::lifecycle
