#pragma once

#include <chipmint/schema/primitives.hpp>
#include <functional>

namespace chipmint::lifecycle {

using beacon_verifier_t =
    std::function<bool(const chipmint::schema::bytes_view_t& signature,
                       const chipmint::schema::bytes_view_t& previous_signature,
                       chipmint::schema::round_t round)>;

using chip_verifier_t =
    std::function<bool(const chipmint::schema::bytes_view_t& chip_signature,
                       const chipmint::schema::bytes_view_t& chip_public_key,
                       const chipmint::schema::bytes_view_t& beacon_signature,
                       const chipmint::schema::bytes_view_t& sender_address)>;

}  // namespace chipmint::lifecycle
