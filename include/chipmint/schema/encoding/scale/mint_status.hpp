#pragma once
#include <chipmint/schema/mint_status.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace chipmint::schema::encoding::scale {

void encode(mint_status_t&& o, ::scale::Encoder& encoder);
void decode(mint_status_t&& o, ::scale::Decoder& decoder);

}  // namespace chipmint::schema::encoding::scale
