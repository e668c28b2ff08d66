#include <chipmint/archive/archive.hpp>
#include <chipmint/blake3/hash.hpp>
#include <chipmint/schema/key/state_keys.hpp>

#include <spdlog/spdlog.h>

#include <iterator>

namespace chipmint::archive {

namespace {

constexpr auto kCodespace = std::string_view{"chipmint.archive"};

chipmint::schema::operation_result_t make_error(
    const chipmint::schema::error_code code,
    const std::string_view log,
    const std::string_view info) {
  auto result = chipmint::schema::operation_result_t{};
  result.code = chipmint::schema::to_code(code);
  result.log = std::string{log};
  result.info = std::string{info};
  result.codespace = std::string{kCodespace};
  return result;
}

chipmint::schema::hash32_t digest_secret(
    const chipmint::schema::hash32_t& secret) {
  return chipmint::blake3::hash(
      chipmint::schema::bytes_view_t{secret.data(), secret.size()});
}

}  // namespace

archive::archive(encoder_t& encoder, storage_t& storage)
    : encoder_{encoder}, storage_{storage} {}

std::optional<admin_capability> archive::initialize(
    const chipmint::schema::hash32_t& admin_secret) {
  if (initialized()) {
    spdlog::warn("Archive already initialized; no capability issued");
    return std::nullopt;
  }
  const auto digest = digest_secret(admin_secret);
  const auto key = chipmint::schema::key::make_admin_capability_key(encoder_);
  storage_.put(encoder_,
               chipmint::schema::bytes_view_t{key.data(), key.size()}, digest);
  spdlog::info("Archive initialized");
  return admin_capability{digest};
}

std::optional<admin_capability> archive::claim_capability(
    const chipmint::schema::hash32_t& admin_secret) const {
  const auto stored = stored_capability_digest();
  if (!stored) {
    return std::nullopt;
  }
  const auto digest = digest_secret(admin_secret);
  if (digest != *stored) {
    spdlog::warn("Admin secret does not match this archive");
    return std::nullopt;
  }
  return admin_capability{digest};
}

bool archive::initialized() const {
  return stored_capability_digest().has_value();
}

chipmint::schema::operation_result_t archive::add_entry(
    const admin_capability& capability,
    const chipmint::schema::bytes_view_t& chip_public_key) {
  const auto stored = stored_capability_digest();
  if (!stored || *stored != capability.digest_) {
    return make_error(chipmint::schema::error_code::capability_mismatch,
                      "capability rejected",
                      "capability was not issued by this archive");
  }
  if (exists(chip_public_key)) {
    return make_error(chipmint::schema::error_code::duplicate_entry,
                      "duplicate archive entry",
                      "chip public key already provisioned");
  }

  const auto key = entry_key(chip_public_key);
  storage_.write(chipmint::storage::write_batch_t{chipmint::storage::write_entry_t{
      .key = key,
      .value = encoder_.encode(chipmint::schema::mint_status_t::not_minted)}});

  auto hex = chipmint::schema::to_hex(chip_public_key);
  spdlog::info("Archive entry added for chip {}", hex);

  auto result = chipmint::schema::operation_result_t{};
  result.info = "archive entry added";
  result.codespace = std::string{kCodespace};
  result.events.push_back(chipmint::schema::operation_event_t{
      .type = "archive_entry_added",
      .attributes = {chipmint::schema::operation_event_attribute_t{
          .key = "chip_public_key", .value = std::move(hex), .index = true}}});
  return result;
}

bool archive::exists(
    const chipmint::schema::bytes_view_t& chip_public_key) const {
  const auto key = entry_key(chip_public_key);
  return storage_.contains(
      chipmint::schema::bytes_view_t{key.data(), key.size()});
}

chipmint::schema::error_code archive::get_status(
    const chipmint::schema::bytes_view_t& chip_public_key,
    chipmint::schema::mint_status_t& status) const {
  const auto key = entry_key(chip_public_key);
  const auto raw =
      storage_.get_raw(chipmint::schema::bytes_view_t{key.data(), key.size()});
  if (!raw) {
    return chipmint::schema::error_code::missing_entry;
  }
  if (raw->size() != 1) {
    return chipmint::schema::error_code::type_mismatch;
  }
  const auto decoded = chipmint::schema::try_make_mint_status(raw->front());
  if (!decoded) {
    return chipmint::schema::error_code::type_mismatch;
  }
  status = *decoded;
  return chipmint::schema::error_code::ok;
}

chipmint::schema::error_code archive::set_status(
    const chipmint::schema::bytes_view_t& chip_public_key,
    const chipmint::schema::mint_status_t status) {
  auto batch = chipmint::storage::write_batch_t{};
  const auto code = stage_set_status(batch, chip_public_key, status);
  if (code == chipmint::schema::error_code::ok) {
    storage_.write(batch);
  }
  return code;
}

chipmint::schema::error_code archive::remove_entry(
    const chipmint::schema::bytes_view_t& chip_public_key) {
  auto batch = chipmint::storage::write_batch_t{};
  const auto code = stage_remove_entry(batch, chip_public_key);
  if (code == chipmint::schema::error_code::ok) {
    storage_.write(batch);
  }
  return code;
}

chipmint::schema::error_code archive::stage_set_status(
    chipmint::storage::write_batch_t& batch,
    const chipmint::schema::bytes_view_t& chip_public_key,
    const chipmint::schema::mint_status_t status) const {
  if (!exists(chip_public_key)) {
    return chipmint::schema::error_code::missing_entry;
  }
  batch.push_back(chipmint::storage::write_entry_t{
      .key = entry_key(chip_public_key),
      .value = encoder_.encode(status)});
  return chipmint::schema::error_code::ok;
}

chipmint::schema::error_code archive::stage_remove_entry(
    chipmint::storage::write_batch_t& batch,
    const chipmint::schema::bytes_view_t& chip_public_key) const {
  if (!exists(chip_public_key)) {
    return chipmint::schema::error_code::missing_entry;
  }
  batch.push_back(chipmint::storage::write_entry_t{
      .key = entry_key(chip_public_key), .value = std::nullopt});
  return chipmint::schema::error_code::ok;
}

const archive::storage_t& archive::storage() const {
  return storage_;
}

chipmint::schema::bytes_t archive::entry_key(
    const chipmint::schema::bytes_view_t& chip_public_key) const {
  return chipmint::schema::key::make_archive_key(encoder_, chip_public_key);
}

std::optional<chipmint::schema::hash32_t> archive::stored_capability_digest()
    const {
  const auto key = chipmint::schema::key::make_admin_capability_key(encoder_);
  return storage_.get<chipmint::schema::hash32_t>(
      encoder_, chipmint::schema::bytes_view_t{key.data(), key.size()});
}

}  // namespace chipmint::archive
