#pragma once

#include <chipmint/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: mint status.
// Archive value: whether a token has been minted for a chip public key.
namespace chipmint::schema {

enum class mint_status_t : uint8_t { not_minted = 0, minted = 1 };

inline constexpr auto kMintStatusMappings =
    std::array{std::pair<std::string_view, mint_status_t>{
                   "not_minted", mint_status_t::not_minted},
               std::pair<std::string_view, mint_status_t>{
                   "minted", mint_status_t::minted}};

inline constexpr std::string_view to_string(const mint_status_t value) {
  return to_string(value, kMintStatusMappings).value_or("unknown");
}

/// Interpret a persisted status byte; std::nullopt when the byte is not a
/// known status.
inline constexpr std::optional<mint_status_t> try_make_mint_status(
    const uint8_t value) {
  switch (value) {
    case static_cast<uint8_t>(mint_status_t::not_minted):
      return mint_status_t::not_minted;
    case static_cast<uint8_t>(mint_status_t::minted):
      return mint_status_t::minted;
    default:
      return std::nullopt;
  }
}

}  // namespace chipmint::schema
