#pragma once
#include <chipmint/schema/token.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace chipmint::schema::encoding::scale {

void encode(token_metadata<1>&& o, ::scale::Encoder& encoder);
void decode(token_metadata<1>&& o, ::scale::Decoder& decoder);

void encode(token<1>&& o, ::scale::Encoder& encoder);
void decode(token<1>&& o, ::scale::Decoder& decoder);

}  // namespace chipmint::schema::encoding::scale
