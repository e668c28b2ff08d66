#include <chipmint/crypto/chip_authenticator.hpp>
#include <chipmint/crypto/verify.hpp>

#include <iterator>

namespace chipmint::crypto {

chipmint::schema::bytes_t make_chip_message(
    const chipmint::schema::bytes_view_t& sender_address,
    const chipmint::schema::bytes_view_t& beacon_signature) {
  auto message = chipmint::schema::bytes_t{};
  message.reserve(sender_address.size() + beacon_signature.size());
  message.insert(std::end(message), std::begin(sender_address),
                 std::end(sender_address));
  message.insert(std::end(message), std::begin(beacon_signature),
                 std::end(beacon_signature));
  return message;
}

bool verify_chip_signature(
    const chipmint::schema::bytes_view_t& chip_signature,
    const chipmint::schema::bytes_view_t& chip_public_key,
    const chipmint::schema::bytes_view_t& beacon_signature,
    const chipmint::schema::bytes_view_t& sender_address) {
  auto message = make_chip_message(sender_address, beacon_signature);
  return verify_secp256k1(
      chipmint::schema::bytes_view_t{message.data(), message.size()},
      chip_public_key, chip_signature);
}

}  // namespace chipmint::crypto
