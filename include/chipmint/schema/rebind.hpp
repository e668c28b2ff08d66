#pragma once
#include <chipmint/schema/primitives.hpp>

namespace chipmint::schema {

template <uint16_t Version>
struct rebind;

template <>
struct rebind<1> final {
  uint16_t version{1};
  chip_signature_t chip_signature;
  chip_public_key_t new_chip_public_key;
  beacon_signature_t beacon_signature;
  beacon_signature_t previous_beacon_signature;
  round_t round{};
  token_id_t token_id{};
};

using rebind_t = rebind<1>;

}  // namespace chipmint::schema
