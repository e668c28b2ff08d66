#pragma once

#include <chipmint/schema/primitives.hpp>

namespace chipmint::crypto {

/// Build the message a chip signs: `sender_address || beacon_signature`.
chipmint::schema::bytes_t make_chip_message(
    const chipmint::schema::bytes_view_t& sender_address,
    const chipmint::schema::bytes_view_t& beacon_signature);

/// Verify the chip's secp256k1 signature over the sender address and the
/// beacon output it was shown. Binding both values prevents a signature from
/// being precomputed ahead of the beacon or replayed by another sender.
bool verify_chip_signature(
    const chipmint::schema::bytes_view_t& chip_signature,
    const chipmint::schema::bytes_view_t& chip_public_key,
    const chipmint::schema::bytes_view_t& beacon_signature,
    const chipmint::schema::bytes_view_t& sender_address);

}  // namespace chipmint::crypto
