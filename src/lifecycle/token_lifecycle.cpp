#include <chipmint/beacon/drand.hpp>
#include <chipmint/beacon/freshness.hpp>
#include <chipmint/blake3/hash.hpp>
#include <chipmint/common/critical.hpp>
#include <chipmint/crypto/chip_authenticator.hpp>
#include <chipmint/lifecycle/token_lifecycle.hpp>
#include <chipmint/schema/key/state_keys.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <string>
#include <utility>

using namespace chipmint::schema;

namespace chipmint::lifecycle {

namespace {

constexpr auto kCodespace = std::string_view{"chipmint.lifecycle"};
constexpr auto kTokenIdDomain = std::string_view{"TOKEN"};

operation_result_t make_error(const error_code code,
                              const std::string_view log,
                              const std::string_view info) {
  spdlog::warn("{} rejected: {} ({})", log, to_string(code), info);
  auto result = operation_result_t{};
  result.code = to_code(code);
  result.log = std::string{log};
  result.info = std::string{info};
  result.codespace = std::string{kCodespace};
  return result;
}

operation_event_attribute_t make_attribute(const std::string_view key,
                                           std::string value) {
  return operation_event_attribute_t{
      .key = std::string{key}, .value = std::move(value), .index = true};
}

bytes_view_t as_view(const bytes_t& bytes) {
  return bytes_view_t{bytes.data(), bytes.size()};
}

template <typename T, std::size_t N>
bytes_view_t as_view(const std::array<T, N>& bytes) {
  return bytes_view_t{bytes.data(), bytes.size()};
}

}  // namespace

token_lifecycle::token_lifecycle(
    encoding::encoder<encoding::scale_encoder_tag>& encoder,
    storage::storage<storage::rocksdb_storage_tag>& storage)
    : encoder_{encoder},
      storage_{storage},
      beacon_verifier_{[](const bytes_view_t& signature,
                          const bytes_view_t& previous_signature,
                          const round_t round) {
        return chipmint::beacon::verify_beacon_signature(
            signature, previous_signature, round);
      }},
      chip_verifier_{&chipmint::crypto::verify_chip_signature} {}

operation_result_t token_lifecycle::mint(const address_t& caller,
                                         const mint_t& request,
                                         chipmint::archive::archive& archive,
                                         const timestamp_milliseconds_t now_ms) {
  auto lock = std::scoped_lock{mutex_};
  if (!shares_storage(archive)) {
    return make_error(error_code::storage_mismatch, "mint",
                      "archive is backed by another store");
  }
  const auto& proof = request.proof;
  const auto chip_public_key = as_view(proof.chip_public_key);

  auto status = mint_status_t{};
  auto code = archive.get_status(chip_public_key, status);
  if (code != error_code::ok) {
    return make_error(code, "mint", "chip public key is not provisioned");
  }
  if (status == mint_status_t::minted) {
    return make_error(error_code::artifact_already_minted, "mint",
                      "chip already bound to a token");
  }
  if (request.metadata.attribute_keys.size() !=
      request.metadata.attribute_values.size()) {
    return make_error(error_code::invalid_metadata, "mint",
                      "attribute keys and values differ in length");
  }
  code = verify_proof(caller, as_view(proof.chip_signature), chip_public_key,
                      as_view(proof.beacon_signature),
                      as_view(proof.previous_beacon_signature), proof.round,
                      now_ms);
  if (code != error_code::ok) {
    return make_error(code, "mint", "proof of possession failed");
  }

  auto batch = storage::write_batch_t{};
  code = archive.stage_set_status(batch, chip_public_key, mint_status_t::minted);
  if (code != error_code::ok) {
    return make_error(code, "mint", "archive entry changed during mint");
  }

  const auto sequence = load_mint_sequence();
  auto minted = token_t{};
  minted.token_id = next_token_id(chip_public_key, caller, sequence);
  minted.chip_public_key = proof.chip_public_key;
  minted.owner = caller;
  minted.metadata = request.metadata;
  if (storage_.contains(as_view(key::make_token_key(encoder_, minted.token_id)))) {
    chipmint::common::critical("token id collision");
  }

  stage_token(batch, minted);
  batch.push_back(storage::write_entry_t{
      .key = key::make_owner_key(encoder_, minted.owner, minted.token_id),
      .value = encoder_.encode(minted.token_id)});
  batch.push_back(storage::write_entry_t{
      .key = key::make_mint_sequence_key(encoder_),
      .value = encoder_.encode(sequence + 1)});
  storage_.write(batch);

  const auto token_hex = to_hex(minted.token_id);
  spdlog::info("Minted token {} for chip {}", token_hex,
               chipmint::schema::to_hex(chip_public_key));

  auto result = operation_result_t{};
  result.data = encoder_.encode(minted);
  result.info = "token minted";
  result.codespace = std::string{kCodespace};
  result.events.push_back(operation_event_t{
      .type = "token_minted",
      .attributes = {
          make_attribute("token_id", token_hex),
          make_attribute("owner", to_hex(minted.owner)),
          make_attribute("chip_public_key",
                         chipmint::schema::to_hex(chip_public_key))}});
  return result;
}

operation_result_t token_lifecycle::transfer(
    const address_t& caller,
    const transfer_t& request,
    const timestamp_milliseconds_t now_ms) {
  auto lock = std::scoped_lock{mutex_};
  if (caller == request.receiver) {
    return make_error(error_code::transfer_not_allowed, "transfer",
                      "receiver is the caller");
  }

  const auto token_key = key::make_token_key(encoder_, request.token_id);
  auto current = storage_.get<token_t>(encoder_, as_view(token_key));
  if (!current) {
    return make_error(error_code::token_missing, "transfer", "unknown token");
  }
  if (current->owner != caller) {
    return make_error(error_code::not_token_owner, "transfer",
                      "caller does not own the token");
  }
  const auto code = verify_proof(
      caller, as_view(request.chip_signature),
      as_view(current->chip_public_key), as_view(request.beacon_signature),
      as_view(request.previous_beacon_signature), request.round, now_ms);
  if (code != error_code::ok) {
    return make_error(code, "transfer", "proof of possession failed");
  }

  auto batch = storage::write_batch_t{};
  batch.push_back(storage::write_entry_t{
      .key = key::make_owner_key(encoder_, current->owner, current->token_id),
      .value = std::nullopt});
  current->owner = request.receiver;
  stage_token(batch, *current);
  batch.push_back(storage::write_entry_t{
      .key = key::make_owner_key(encoder_, current->owner, current->token_id),
      .value = encoder_.encode(current->token_id)});
  storage_.write(batch);

  const auto token_hex = to_hex(current->token_id);
  spdlog::info("Transferred token {} to {}", token_hex,
               to_hex(request.receiver));

  auto result = operation_result_t{};
  result.data = encoder_.encode(*current);
  result.info = "token transferred";
  result.codespace = std::string{kCodespace};
  result.events.push_back(operation_event_t{
      .type = "token_transferred",
      .attributes = {make_attribute("token_id", token_hex),
                     make_attribute("from", to_hex(caller)),
                     make_attribute("to", to_hex(request.receiver))}});
  return result;
}

operation_result_t token_lifecycle::rebind(
    const address_t& caller,
    const rebind_t& request,
    chipmint::archive::archive& archive,
    const timestamp_milliseconds_t now_ms) {
  auto lock = std::scoped_lock{mutex_};
  if (!shares_storage(archive)) {
    return make_error(error_code::storage_mismatch, "rebind",
                      "archive is backed by another store");
  }
  const auto new_chip_public_key = as_view(request.new_chip_public_key);
  if (!archive.exists(new_chip_public_key)) {
    return make_error(error_code::unknown_artifact, "rebind",
                      "replacement chip is not provisioned");
  }

  const auto token_key = key::make_token_key(encoder_, request.token_id);
  auto current = storage_.get<token_t>(encoder_, as_view(token_key));
  if (!current) {
    return make_error(error_code::token_missing, "rebind", "unknown token");
  }
  if (current->owner != caller) {
    return make_error(error_code::not_token_owner, "rebind",
                      "caller does not own the token");
  }

  auto status = mint_status_t{};
  auto code = archive.get_status(new_chip_public_key, status);
  if (code != error_code::ok) {
    return make_error(code, "rebind", "replacement chip entry unreadable");
  }
  if (status == mint_status_t::minted ||
      current->chip_public_key == request.new_chip_public_key) {
    return make_error(error_code::artifact_already_minted, "rebind",
                      "replacement chip already bound to a token");
  }
  code = verify_proof(caller, as_view(request.chip_signature),
                      new_chip_public_key, as_view(request.beacon_signature),
                      as_view(request.previous_beacon_signature), request.round,
                      now_ms);
  if (code != error_code::ok) {
    return make_error(code, "rebind", "proof of possession failed");
  }

  auto batch = storage::write_batch_t{};
  const auto old_chip_public_key = current->chip_public_key;
  if (archive.stage_remove_entry(batch, as_view(old_chip_public_key)) !=
      error_code::ok) {
    spdlog::warn("Token {} was bound to a chip with no archive entry",
                 to_hex(current->token_id));
  }
  code = archive.stage_set_status(batch, new_chip_public_key,
                                  mint_status_t::minted);
  if (code != error_code::ok) {
    return make_error(code, "rebind", "archive entry changed during rebind");
  }
  current->chip_public_key = request.new_chip_public_key;
  stage_token(batch, *current);
  storage_.write(batch);

  const auto token_hex = to_hex(current->token_id);
  spdlog::info("Rebound token {} to chip {}", token_hex,
               chipmint::schema::to_hex(new_chip_public_key));

  auto result = operation_result_t{};
  result.data = encoder_.encode(*current);
  result.info = "token rebound";
  result.codespace = std::string{kCodespace};
  result.events.push_back(operation_event_t{
      .type = "token_rebound",
      .attributes = {
          make_attribute("token_id", token_hex),
          make_attribute("old_chip_public_key",
                         chipmint::schema::to_hex(as_view(old_chip_public_key))),
          make_attribute("new_chip_public_key",
                         chipmint::schema::to_hex(new_chip_public_key))}});
  return result;
}

std::optional<token_t> token_lifecycle::token(const token_id_t& token_id) const {
  auto lock = std::scoped_lock{mutex_};
  const auto token_key = key::make_token_key(encoder_, token_id);
  return storage_.get<token_t>(encoder_, as_view(token_key));
}

std::vector<token_t> token_lifecycle::tokens_owned_by(
    const address_t& owner) const {
  auto lock = std::scoped_lock{mutex_};
  const auto prefix = key::make_owner_prefix(encoder_, owner);
  auto tokens = std::vector<token_t>{};
  for (const auto& entry : storage_.list_by_prefix(as_view(prefix))) {
    const auto token_id = encoder_.decode<token_id_t>(as_view(entry.second));
    const auto token_key = key::make_token_key(encoder_, token_id);
    auto owned = storage_.get<token_t>(encoder_, as_view(token_key));
    if (!owned) {
      chipmint::common::critical("owner index references a missing token");
    }
    tokens.push_back(std::move(*owned));
  }
  return tokens;
}

void token_lifecycle::set_beacon_verifier(beacon_verifier_t verifier) {
  auto lock = std::scoped_lock{mutex_};
  beacon_verifier_ = std::move(verifier);
}

void token_lifecycle::set_chip_verifier(chip_verifier_t verifier) {
  auto lock = std::scoped_lock{mutex_};
  chip_verifier_ = std::move(verifier);
}

bool token_lifecycle::shares_storage(
    const chipmint::archive::archive& archive) const {
  return &archive.storage() == &storage_;
}

error_code token_lifecycle::verify_proof(
    const address_t& caller,
    const bytes_view_t& chip_signature,
    const bytes_view_t& chip_public_key,
    const bytes_view_t& beacon_signature,
    const bytes_view_t& previous_beacon_signature,
    const round_t round,
    const timestamp_milliseconds_t now_ms) const {
  const auto freshness = chipmint::beacon::check_freshness(round, now_ms);
  if (freshness != error_code::ok) {
    spdlog::debug("Round {} failed freshness at {}: {}", round, now_ms,
                  to_string(freshness));
    return freshness;
  }
  if (!beacon_verifier_(beacon_signature, previous_beacon_signature, round)) {
    spdlog::debug("Beacon signature for round {} did not verify", round);
    return error_code::invalid_signature;
  }
  if (!chip_verifier_(chip_signature, chip_public_key, beacon_signature,
                      as_view(caller))) {
    spdlog::debug("Chip signature did not verify");
    return error_code::invalid_signature;
  }
  return error_code::ok;
}

token_id_t token_lifecycle::next_token_id(const bytes_view_t& chip_public_key,
                                          const address_t& caller,
                                          const uint64_t sequence) {
  auto preimage = encoder_.encode(kTokenIdDomain);
  preimage.insert(std::end(preimage), std::begin(chip_public_key),
                  std::end(chip_public_key));
  preimage.insert(std::end(preimage), std::begin(caller), std::end(caller));
  encoder_.encode(sequence, preimage);
  return chipmint::blake3::hash(as_view(preimage));
}

uint64_t token_lifecycle::load_mint_sequence() const {
  const auto sequence_key = key::make_mint_sequence_key(encoder_);
  return storage_.get<uint64_t>(encoder_, as_view(sequence_key)).value_or(0);
}

void token_lifecycle::stage_token(storage::write_batch_t& batch,
                                  const token_t& token) {
  batch.push_back(storage::write_entry_t{
      .key = key::make_token_key(encoder_, token.token_id),
      .value = encoder_.encode(token)});
}

}  // namespace chipmint::lifecycle
