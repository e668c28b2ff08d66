#pragma once

#include <chipmint/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace chipmint::testing {

inline chipmint::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = chipmint::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline chipmint::schema::address_t make_address(const uint8_t seed) {
  return make_hash(seed);
}

inline chipmint::schema::bytes_view_t as_view(
    const chipmint::schema::bytes_t& bytes) {
  return chipmint::schema::bytes_view_t{bytes.data(), bytes.size()};
}

template <std::size_t N>
chipmint::schema::bytes_view_t as_view(const std::array<uint8_t, N>& bytes) {
  return chipmint::schema::bytes_view_t{bytes.data(), bytes.size()};
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace chipmint::testing
