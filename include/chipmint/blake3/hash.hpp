#pragma once
#include <chipmint/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace chipmint::blake3 {

chipmint::schema::hash32_t hash(const chipmint::schema::bytes_view_t& bytes);

}  // namespace chipmint::blake3
