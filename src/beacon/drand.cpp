#include <chipmint/beacon/drand.hpp>
#include <chipmint/common/critical.hpp>
#include <chipmint/crypto/bls.hpp>
#include <chipmint/crypto/verify.hpp>

#include <boost/endian/buffers.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>

namespace chipmint::beacon {

const chipmint::schema::beacon_public_key_t& drand_public_key() {
  static const auto key = [] {
    auto decoded = chipmint::schema::try_from_hex(kDrandPublicKeyHex);
    auto out = chipmint::schema::beacon_public_key_t{};
    if (!decoded || decoded->size() != out.size()) {
      chipmint::common::critical("drand public key constant is malformed");
    }
    std::copy(std::begin(*decoded), std::end(*decoded), std::begin(out));
    return out;
  }();
  return key;
}

std::array<uint8_t, 8> encode_round(const chipmint::schema::round_t round) {
  auto buffer = boost::endian::big_uint64_buf_t{round};
  auto out = std::array<uint8_t, 8>{};
  std::copy_n(buffer.data(), out.size(), std::begin(out));
  return out;
}

chipmint::schema::hash32_t make_round_digest(
    const chipmint::schema::bytes_view_t& previous_signature,
    const chipmint::schema::round_t round) {
  const auto round_bytes = encode_round(round);
  auto material = chipmint::schema::bytes_t{};
  material.reserve(previous_signature.size() + round_bytes.size());
  material.insert(std::end(material), std::begin(previous_signature),
                  std::end(previous_signature));
  material.insert(std::end(material), std::begin(round_bytes),
                  std::end(round_bytes));
  return chipmint::crypto::sha256(
      chipmint::schema::bytes_view_t{material.data(), material.size()});
}

bool verify_beacon_signature(
    const chipmint::schema::bytes_view_t& signature,
    const chipmint::schema::bytes_view_t& previous_signature,
    const chipmint::schema::round_t round) {
  return verify_beacon_signature(drand_public_key(), signature,
                                 previous_signature, round);
}

bool verify_beacon_signature(
    const chipmint::schema::beacon_public_key_t& public_key,
    const chipmint::schema::bytes_view_t& signature,
    const chipmint::schema::bytes_view_t& previous_signature,
    const chipmint::schema::round_t round) {
  const auto digest = make_round_digest(previous_signature, round);
  const auto verified = chipmint::crypto::bls::verify(
      chipmint::schema::bytes_view_t{public_key.data(), public_key.size()},
      chipmint::schema::bytes_view_t{digest.data(), digest.size()},
      signature);
  if (!verified) {
    if (!chipmint::crypto::bls::is_valid_signature(signature)) {
      spdlog::debug("Beacon signature for round {} is not a G2 point", round);
    } else {
      spdlog::debug("Beacon signature for round {} failed verification",
                    round);
    }
  }
  return verified;
}

}  // namespace chipmint::beacon
