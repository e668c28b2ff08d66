#pragma once
#include <chipmint/schema/primitives.hpp>
#include <optional>
#include <span>

namespace chipmint::schema::encoding {

// The wire format is a build time choice expressed through the Library tag;
// persisted archive entries and tokens all go through this interface.
template <typename Library>
struct encoder {
  template <typename T>
  chipmint::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, chipmint::schema::bytes_t& out);

  template <typename T>
  T decode(const chipmint::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const chipmint::schema::bytes_view_t& bytes);
};

}  // namespace chipmint::schema::encoding
