#pragma once

#include <chipmint/archive/admin_capability.hpp>
#include <chipmint/schema/encoding/scale/encoder.hpp>
#include <chipmint/schema/error_code.hpp>
#include <chipmint/schema/mint_status.hpp>
#include <chipmint/schema/operation_result.hpp>
#include <chipmint/schema/primitives.hpp>
#include <chipmint/storage/rocksdb/storage.hpp>

#include <optional>

namespace chipmint::archive {

/// Keyed store of chip public key -> mint status.
///
/// Every physical chip must be provisioned here by the admin before a token
/// can be minted for it. Reads always go to the backing store; the `stage_*`
/// variants validate against the current store state and append the change to
/// a write batch so callers can commit it together with other records.
class archive final {
 public:
  using encoder_t = chipmint::schema::encoding::encoder<
      chipmint::schema::encoding::scale_encoder_tag>;
  using storage_t =
      chipmint::storage::storage<chipmint::storage::rocksdb_storage_tag>;

  archive(encoder_t& encoder, storage_t& storage);

  /// Create the admin record for this store and return its capability.
  ///
  /// Only the first call on a store yields a capability; the secret's BLAKE3
  /// digest is persisted so the holder can later reclaim it with
  /// `claim_capability`.
  std::optional<admin_capability> initialize(
      const chipmint::schema::hash32_t& admin_secret);

  /// Reissue the capability to whoever presents the admin secret.
  std::optional<admin_capability> claim_capability(
      const chipmint::schema::hash32_t& admin_secret) const;

  bool initialized() const;

  /// Provision a chip. Fails with `duplicate_entry` when already present and
  /// `capability_mismatch` when the capability belongs to another store.
  chipmint::schema::operation_result_t add_entry(
      const admin_capability& capability,
      const chipmint::schema::bytes_view_t& chip_public_key);

  bool exists(const chipmint::schema::bytes_view_t& chip_public_key) const;

  /// `missing_entry` when absent, `type_mismatch` when the stored value is not
  /// a status byte.
  chipmint::schema::error_code get_status(
      const chipmint::schema::bytes_view_t& chip_public_key,
      chipmint::schema::mint_status_t& status) const;

  chipmint::schema::error_code set_status(
      const chipmint::schema::bytes_view_t& chip_public_key,
      chipmint::schema::mint_status_t status);

  chipmint::schema::error_code remove_entry(
      const chipmint::schema::bytes_view_t& chip_public_key);

  chipmint::schema::error_code stage_set_status(
      chipmint::storage::write_batch_t& batch,
      const chipmint::schema::bytes_view_t& chip_public_key,
      chipmint::schema::mint_status_t status) const;

  chipmint::schema::error_code stage_remove_entry(
      chipmint::storage::write_batch_t& batch,
      const chipmint::schema::bytes_view_t& chip_public_key) const;

  /// Store that staged batches must be committed to.
  const storage_t& storage() const;

 private:
  chipmint::schema::bytes_t entry_key(
      const chipmint::schema::bytes_view_t& chip_public_key) const;
  std::optional<chipmint::schema::hash32_t> stored_capability_digest() const;

  encoder_t& encoder_;
  storage_t& storage_;
};

}  // namespace chipmint::archive
