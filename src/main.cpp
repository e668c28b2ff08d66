#include <openssl/rand.h>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <chipmint/archive/archive.hpp>
#include <chipmint/beacon/freshness.hpp>
#include <chipmint/common/critical.hpp>
#include <chipmint/lifecycle/token_lifecycle.hpp>
#include <chipmint/schema/encoding/scale/encoder.hpp>
#include <chipmint/schema/key/state_keys.hpp>
#include <chipmint/storage/rocksdb/storage.hpp>
#include <chrono>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using encoder_t = chipmint::schema::encoding::encoder<
    chipmint::schema::encoding::scale_encoder_tag>;
using storage_t =
    chipmint::storage::storage<chipmint::storage::rocksdb_storage_tag>;

struct cli_options final {
  std::string db_path;
  std::string command;
  std::string admin_secret;
  std::string caller;
  std::string receiver;
  std::string owner;
  std::string token_id;
  std::string chip_public_key;
  std::string new_chip_public_key;
  std::string chip_signature;
  std::string beacon_signature;
  std::string previous_beacon_signature;
  chipmint::schema::round_t round{};
  std::optional<chipmint::schema::timestamp_milliseconds_t> now_ms;
  chipmint::schema::token_metadata_t metadata;
};

class usage_error final : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

chipmint::schema::bytes_t require_bytes(const std::string& value,
                                        const std::string_view name) {
  if (value.empty()) {
    throw usage_error{fmt::format("--{} is required", name)};
  }
  auto bytes = chipmint::schema::try_from_hex(value);
  if (!bytes) {
    throw usage_error{fmt::format("--{} is not valid hex", name)};
  }
  return *bytes;
}

chipmint::schema::hash32_t require_hash(const std::string& value,
                                        const std::string_view name) {
  if (value.empty()) {
    throw usage_error{fmt::format("--{} is required", name)};
  }
  auto hash = chipmint::schema::try_make_hash32(value);
  if (!hash) {
    throw usage_error{fmt::format("--{} must be 32 bytes of hex", name)};
  }
  return *hash;
}

chipmint::schema::timestamp_milliseconds_t now_ms(const cli_options& options) {
  if (options.now_ms) {
    return *options.now_ms;
  }
  return static_cast<chipmint::schema::timestamp_milliseconds_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

void print_token(const chipmint::schema::token_t& token) {
  std::cout << "token_id: " << chipmint::schema::to_hex(token.token_id) << '\n'
            << "owner: " << chipmint::schema::to_hex(token.owner) << '\n'
            << "chip_public_key: "
            << chipmint::schema::to_hex(token.chip_public_key) << '\n'
            << "name: " << token.metadata.name << '\n'
            << "description: " << token.metadata.description << '\n'
            << "url: " << token.metadata.url << '\n'
            << "animation_url: " << token.metadata.animation_url << '\n'
            << "external_url: " << token.metadata.external_url << '\n';
  for (auto i = std::size_t{}; i < token.metadata.attribute_keys.size(); ++i) {
    std::cout << "attribute: " << token.metadata.attribute_keys[i] << '='
              << token.metadata.attribute_values[i] << '\n';
  }
}

int print_result(encoder_t& encoder,
                 const chipmint::schema::operation_result_t& result) {
  std::cout << "code: " << result.code << " ("
            << chipmint::schema::to_string(result.error()) << ")\n"
            << "codespace: " << result.codespace << '\n';
  if (!result.log.empty()) {
    std::cout << "log: " << result.log << '\n';
  }
  std::cout << "info: " << result.info << '\n';
  for (const auto& event : result.events) {
    std::cout << "event: " << event.type << '\n';
    for (const auto& attribute : event.attributes) {
      std::cout << "  " << attribute.key << '=' << attribute.value << '\n';
    }
  }
  if (!result.data.empty()) {
    print_token(encoder.decode<chipmint::schema::token_t>(
        chipmint::schema::bytes_view_t{result.data.data(),
                                       result.data.size()}));
  }
  return result.ok() ? 0 : 1;
}

int run_init(chipmint::archive::archive& archive, const cli_options& options) {
  auto secret = chipmint::schema::hash32_t{};
  if (options.admin_secret.empty()) {
    if (RAND_bytes(secret.data(), static_cast<int>(secret.size())) != 1) {
      chipmint::common::critical("failed to generate admin secret");
    }
  } else {
    secret = require_hash(options.admin_secret, "admin-secret");
  }
  if (!archive.initialize(secret)) {
    std::cerr << "archive already initialized" << std::endl;
    return 1;
  }
  std::cout << "admin_secret: " << chipmint::schema::to_hex(secret) << '\n';
  return 0;
}

int run_add_entry(encoder_t& encoder,
                  chipmint::archive::archive& archive,
                  const cli_options& options) {
  auto capability = archive.claim_capability(
      require_hash(options.admin_secret, "admin-secret"));
  if (!capability) {
    std::cerr << "admin secret rejected" << std::endl;
    return 1;
  }
  const auto chip_public_key =
      require_bytes(options.chip_public_key, "chip-public-key");
  return print_result(
      encoder, archive.add_entry(*capability,
                                 chipmint::schema::bytes_view_t{
                                     chip_public_key.data(),
                                     chip_public_key.size()}));
}

int run_status(const chipmint::archive::archive& archive,
               const cli_options& options) {
  const auto chip_public_key =
      require_bytes(options.chip_public_key, "chip-public-key");
  auto status = chipmint::schema::mint_status_t{};
  const auto code = archive.get_status(
      chipmint::schema::bytes_view_t{chip_public_key.data(),
                                     chip_public_key.size()},
      status);
  if (code != chipmint::schema::error_code::ok) {
    std::cout << "status: " << chipmint::schema::to_string(code) << '\n';
    return 1;
  }
  std::cout << "status: " << chipmint::schema::to_string(status) << '\n';
  return 0;
}

int run_mint(encoder_t& encoder,
             chipmint::archive::archive& archive,
             chipmint::lifecycle::token_lifecycle& lifecycle,
             const cli_options& options) {
  auto request = chipmint::schema::mint_t{};
  request.proof.chip_signature =
      require_bytes(options.chip_signature, "chip-signature");
  request.proof.chip_public_key =
      require_bytes(options.chip_public_key, "chip-public-key");
  request.proof.beacon_signature =
      require_bytes(options.beacon_signature, "beacon-signature");
  request.proof.previous_beacon_signature = require_bytes(
      options.previous_beacon_signature, "previous-beacon-signature");
  request.proof.round = options.round;
  request.metadata = options.metadata;
  return print_result(
      encoder, lifecycle.mint(require_hash(options.caller, "caller"), request,
                              archive, now_ms(options)));
}

int run_transfer(encoder_t& encoder,
                 chipmint::lifecycle::token_lifecycle& lifecycle,
                 const cli_options& options) {
  auto request = chipmint::schema::transfer_t{};
  request.chip_signature =
      require_bytes(options.chip_signature, "chip-signature");
  request.beacon_signature =
      require_bytes(options.beacon_signature, "beacon-signature");
  request.previous_beacon_signature = require_bytes(
      options.previous_beacon_signature, "previous-beacon-signature");
  request.round = options.round;
  request.token_id = require_hash(options.token_id, "token-id");
  request.receiver = require_hash(options.receiver, "receiver");
  return print_result(
      encoder, lifecycle.transfer(require_hash(options.caller, "caller"),
                                  request, now_ms(options)));
}

int run_rebind(encoder_t& encoder,
               chipmint::archive::archive& archive,
               chipmint::lifecycle::token_lifecycle& lifecycle,
               const cli_options& options) {
  auto request = chipmint::schema::rebind_t{};
  request.chip_signature =
      require_bytes(options.chip_signature, "chip-signature");
  request.new_chip_public_key =
      require_bytes(options.new_chip_public_key, "new-chip-public-key");
  request.beacon_signature =
      require_bytes(options.beacon_signature, "beacon-signature");
  request.previous_beacon_signature = require_bytes(
      options.previous_beacon_signature, "previous-beacon-signature");
  request.round = options.round;
  request.token_id = require_hash(options.token_id, "token-id");
  return print_result(
      encoder, lifecycle.rebind(require_hash(options.caller, "caller"),
                                request, archive, now_ms(options)));
}

int run_token(const chipmint::lifecycle::token_lifecycle& lifecycle,
              const cli_options& options) {
  if (!options.owner.empty()) {
    for (const auto& token :
         lifecycle.tokens_owned_by(require_hash(options.owner, "owner"))) {
      print_token(token);
    }
    return 0;
  }
  auto token = lifecycle.token(require_hash(options.token_id, "token-id"));
  if (!token) {
    std::cout << "token: "
              << chipmint::schema::to_string(
                     chipmint::schema::error_code::token_missing)
              << '\n';
    return 1;
  }
  print_token(*token);
  return 0;
}

int run_round(const cli_options& options) {
  const auto now = now_ms(options);
  const auto current = chipmint::beacon::current_round(now);
  if (!current) {
    std::cout << "current_round: none (before genesis)\n";
  } else {
    std::cout << "current_round: " << *current << '\n';
  }
  const auto round = options.round != 0 ? options.round : current.value_or(0);
  const auto published = chipmint::beacon::round_time(round);
  if (!published) {
    std::cout << "round " << round << ": "
              << chipmint::schema::to_string(
                     chipmint::schema::error_code::invalid_round)
              << '\n';
    return 1;
  }
  std::cout << "round: " << round << '\n'
            << "round_time_ms: " << *published << '\n'
            << "fresh: "
            << (chipmint::beacon::check_freshness(round, now) ==
                        chipmint::schema::error_code::ok
                    ? "yes"
                    : "no")
            << '\n';
  return 0;
}

void parse_attributes(const std::vector<std::string>& attributes,
                      chipmint::schema::token_metadata_t& metadata) {
  for (const auto& attribute : attributes) {
    const auto split = attribute.find('=');
    if (split == std::string::npos) {
      throw usage_error{"--attribute expects key=value"};
    }
    metadata.attribute_keys.push_back(attribute.substr(0, split));
    metadata.attribute_values.push_back(attribute.substr(split + 1));
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  auto options = cli_options{};
  auto log_file = std::string{};
  auto attributes = std::vector<std::string>{};
  auto now = chipmint::schema::timestamp_milliseconds_t{};

  auto vm = boost::program_options::variables_map{};
  auto description = boost::program_options::options_description{"Chipmint"};
  description.add_options()("help,h", "Show the help message")(
      "db,d",
      boost::program_options::value<std::string>(&options.db_path)
          ->default_value("chipmint.db"),
      "RocksDB directory")(
      "command,c", boost::program_options::value<std::string>(&options.command),
      "init | add-entry | status | mint | transfer | rebind | token | round")(
      "admin-secret",
      boost::program_options::value<std::string>(&options.admin_secret),
      "32 byte admin secret (hex)")(
      "caller", boost::program_options::value<std::string>(&options.caller),
      "Caller address (hex)")(
      "receiver", boost::program_options::value<std::string>(&options.receiver),
      "Transfer receiver address (hex)")(
      "owner", boost::program_options::value<std::string>(&options.owner),
      "List tokens held by this address (hex)")(
      "token-id", boost::program_options::value<std::string>(&options.token_id),
      "Token id (hex)")(
      "chip-public-key",
      boost::program_options::value<std::string>(&options.chip_public_key),
      "Chip secp256k1 public key (hex)")(
      "new-chip-public-key",
      boost::program_options::value<std::string>(&options.new_chip_public_key),
      "Replacement chip public key (hex)")(
      "chip-signature",
      boost::program_options::value<std::string>(&options.chip_signature),
      "Chip signature over caller and beacon signature (hex)")(
      "beacon-signature",
      boost::program_options::value<std::string>(&options.beacon_signature),
      "drand signature for --round (hex)")(
      "previous-beacon-signature",
      boost::program_options::value<std::string>(
          &options.previous_beacon_signature),
      "drand signature of the previous round (hex)")(
      "round",
      boost::program_options::value<chipmint::schema::round_t>(&options.round),
      "drand round")("name",
                     boost::program_options::value<std::string>(
                         &options.metadata.name),
                     "Token name")(
      "description",
      boost::program_options::value<std::string>(
          &options.metadata.description),
      "Token description")(
      "url", boost::program_options::value<std::string>(&options.metadata.url),
      "Token url")("animation-url",
                   boost::program_options::value<std::string>(
                       &options.metadata.animation_url),
                   "Token animation url")(
      "external-url",
      boost::program_options::value<std::string>(
          &options.metadata.external_url),
      "Token external url")(
      "attribute",
      boost::program_options::value<std::vector<std::string>>(&attributes),
      "Token attribute as key=value, repeatable")(
      "now-ms",
      boost::program_options::value<chipmint::schema::timestamp_milliseconds_t>(
          &now),
      "Override the current time in unix milliseconds")(
      "log-file", boost::program_options::value<std::string>(&log_file),
      "Also write logs to this file")("verbose,v", "Enable verbose output");

  try {
    boost::program_options::store(
        boost::program_options::parse_command_line(argc, argv, description),
        vm);
    boost::program_options::notify(vm);
  } catch (const boost::program_options::error& e) {
    std::cerr << e.what() << '\n' << description << std::endl;
    return 2;
  }

  if (vm.contains("help") || options.command.empty()) {
    std::cout << description << std::endl;
    return vm.contains("help") ? 0 : 2;
  }
  if (vm.contains("now-ms")) {
    options.now_ms = now;
  }

  spdlog::init_thread_pool(8192, 1);
  auto sinks = std::vector<spdlog::sink_ptr>{
      std::make_shared<spdlog::sinks::stderr_color_sink_mt>()};
  if (!log_file.empty()) {
    sinks.push_back(
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false));
  }
  auto logger = std::make_shared<spdlog::async_logger>(
      "chipmint", std::begin(sinks), std::end(sinks), spdlog::thread_pool(),
      spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(vm.contains("verbose") ? spdlog::level::debug
                                           : spdlog::level::warn);

  auto exit_code = 0;
  try {
    parse_attributes(attributes, options.metadata);

    auto encoder = encoder_t{};
    auto storage = chipmint::storage::make_storage<
        chipmint::storage::rocksdb_storage_tag>(options.db_path);
    auto archive = chipmint::archive::archive{encoder, storage};
    auto lifecycle = chipmint::lifecycle::token_lifecycle{encoder, storage};

    if (options.command == "init") {
      exit_code = run_init(archive, options);
    } else if (options.command == "add-entry") {
      exit_code = run_add_entry(encoder, archive, options);
    } else if (options.command == "status") {
      exit_code = run_status(archive, options);
    } else if (options.command == "mint") {
      exit_code = run_mint(encoder, archive, lifecycle, options);
    } else if (options.command == "transfer") {
      exit_code = run_transfer(encoder, lifecycle, options);
    } else if (options.command == "rebind") {
      exit_code = run_rebind(encoder, archive, lifecycle, options);
    } else if (options.command == "token") {
      exit_code = run_token(lifecycle, options);
    } else if (options.command == "round") {
      exit_code = run_round(options);
    } else {
      throw usage_error{fmt::format("unknown command '{}'", options.command)};
    }
  } catch (const usage_error& e) {
    std::cerr << e.what() << std::endl;
    exit_code = 2;
  }

  spdlog::shutdown();
  return exit_code;
}
