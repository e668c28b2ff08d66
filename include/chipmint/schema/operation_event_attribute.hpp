#pragma once

#include <cstdint>
#include <string>

// Schema type: operation event attribute.
// Key/value/index tuple attached to an emitted event.
namespace chipmint::schema {

template <uint16_t Version>
struct operation_event_attribute;

template <>
struct operation_event_attribute<1> final {
  uint16_t version{1};
  std::string key;
  std::string value;
  bool index{};
};

using operation_event_attribute_t = operation_event_attribute<1>;

}  // namespace chipmint::schema
