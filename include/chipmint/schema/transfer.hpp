#pragma once
#include <chipmint/schema/primitives.hpp>

namespace chipmint::schema {

template <uint16_t Version>
struct transfer;

/// The chip public key is taken from the token being transferred.
template <>
struct transfer<1> final {
  uint16_t version{1};
  chip_signature_t chip_signature;
  beacon_signature_t beacon_signature;
  beacon_signature_t previous_beacon_signature;
  round_t round{};
  token_id_t token_id{};
  address_t receiver{};
};

using transfer_t = transfer<1>;

}  // namespace chipmint::schema
