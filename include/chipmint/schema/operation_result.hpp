#pragma once

#include <chipmint/schema/error_code.hpp>
#include <chipmint/schema/operation_event.hpp>
#include <chipmint/schema/primitives.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace chipmint::schema {

template <uint16_t Version>
struct operation_result;

/// Outcome of one archive or lifecycle call. `code` is zero on success and
/// an `error_code` value otherwise; `data` carries the SCALE encoded payload
/// of a successful call (the token for mint, transfer and rebind).
template <>
struct operation_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  bytes_t data;
  std::string log;
  std::string info;
  std::string codespace;
  std::vector<operation_event_t> events;

  bool ok() const { return code == 0; }
  error_code error() const { return static_cast<error_code>(code); }
};

using operation_result_t = operation_result<1>;

}  // namespace chipmint::schema
