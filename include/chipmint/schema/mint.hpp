#pragma once
#include <chipmint/schema/signature_bundle.hpp>
#include <chipmint/schema/token.hpp>

namespace chipmint::schema {

template <uint16_t Version>
struct mint;

template <>
struct mint<1> final {
  uint16_t version{1};
  signature_bundle_t proof;
  token_metadata_t metadata;
};

using mint_t = mint<1>;

}  // namespace chipmint::schema
