#pragma once
#include <chipmint/schema/primitives.hpp>
#include <string>
#include <vector>

// Schema type: token.
// Ownership record bound to one physical chip. Descriptive fields are opaque
// payload supplied at mint time.
namespace chipmint::schema {

template <uint16_t Version>
struct token_metadata;

template <>
struct token_metadata<1> final {
  uint16_t version{1};
  std::string name;
  std::string description;
  std::string url;
  std::string animation_url;
  std::string external_url;
  std::vector<std::string> attribute_keys;
  std::vector<std::string> attribute_values;
};

using token_metadata_t = token_metadata<1>;

template <uint16_t Version>
struct token;

template <>
struct token<1> final {
  uint16_t version{1};
  token_id_t token_id{};
  chip_public_key_t chip_public_key;
  address_t owner{};
  token_metadata_t metadata;
};

using token_t = token<1>;

}  // namespace chipmint::schema
