#include <chipmint/schema/encoding/scale/mint_status.hpp>

using namespace chipmint::schema;

namespace chipmint::schema::encoding::scale {

void encode(mint_status_t&& o, ::scale::Encoder& encoder) {
  encode(static_cast<uint8_t>(o), encoder);
}

void decode(mint_status_t&& o, ::scale::Decoder& decoder) {
  auto raw = uint8_t{};
  decode(raw, decoder);
  o = static_cast<mint_status_t>(raw);
}

}  // namespace chipmint::schema::encoding::scale
