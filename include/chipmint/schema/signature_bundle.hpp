#pragma once
#include <chipmint/schema/primitives.hpp>

// Schema type: signature bundle.
// Per-call proof material: the chip's signature over the caller address and
// the current beacon output, plus the beacon values needed to check it.
// Never persisted.
namespace chipmint::schema {

template <uint16_t Version>
struct signature_bundle;

template <>
struct signature_bundle<1> final {
  uint16_t version{1};
  chip_signature_t chip_signature;
  chip_public_key_t chip_public_key;
  beacon_signature_t beacon_signature;
  beacon_signature_t previous_beacon_signature;
  round_t round{};
};

using signature_bundle_t = signature_bundle<1>;

}  // namespace chipmint::schema
