#include <chipmint/schema/encoding/scale/token.hpp>

using namespace chipmint::schema;

namespace chipmint::schema::encoding::scale {

void encode(token_metadata<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.name, encoder);
  encode(o.description, encoder);
  encode(o.url, encoder);
  encode(o.animation_url, encoder);
  encode(o.external_url, encoder);
  encode(o.attribute_keys, encoder);
  encode(o.attribute_values, encoder);
}

void decode(token_metadata<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.name, decoder);
  decode(o.description, decoder);
  decode(o.url, decoder);
  decode(o.animation_url, decoder);
  decode(o.external_url, decoder);
  decode(o.attribute_keys, decoder);
  decode(o.attribute_values, decoder);
}

void encode(token<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.token_id, encoder);
  encode(o.chip_public_key, encoder);
  encode(o.owner, encoder);
  encode(std::move(o.metadata), encoder);
}

void decode(token<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.token_id, decoder);
  decode(o.chip_public_key, decoder);
  decode(o.owner, decoder);
  decode(std::move(o.metadata), decoder);
}

}  // namespace chipmint::schema::encoding::scale
