#pragma once

#include <chipmint/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>
#include <utility>

namespace chipmint::schema {

enum class error_code : uint32_t {
  ok = 0,
  invalid_signature = 1,
  signature_expired = 2,
  unknown_artifact = 3,
  artifact_already_minted = 4,
  transfer_not_allowed = 5,
  duplicate_entry = 6,
  missing_entry = 7,
  type_mismatch = 8,
  invalid_round = 9,
  invalid_metadata = 10,
  token_missing = 11,
  not_token_owner = 12,
  capability_mismatch = 13,
  storage_mismatch = 14,
};

inline constexpr auto kErrorCodeMappings = std::array{
    std::pair<std::string_view, error_code>{"ok", error_code::ok},
    std::pair<std::string_view, error_code>{"invalid_signature",
                                            error_code::invalid_signature},
    std::pair<std::string_view, error_code>{"signature_expired",
                                            error_code::signature_expired},
    std::pair<std::string_view, error_code>{"unknown_artifact",
                                            error_code::unknown_artifact},
    std::pair<std::string_view, error_code>{
        "artifact_already_minted", error_code::artifact_already_minted},
    std::pair<std::string_view, error_code>{"transfer_not_allowed",
                                            error_code::transfer_not_allowed},
    std::pair<std::string_view, error_code>{"duplicate_entry",
                                            error_code::duplicate_entry},
    std::pair<std::string_view, error_code>{"missing_entry",
                                            error_code::missing_entry},
    std::pair<std::string_view, error_code>{"type_mismatch",
                                            error_code::type_mismatch},
    std::pair<std::string_view, error_code>{"invalid_round",
                                            error_code::invalid_round},
    std::pair<std::string_view, error_code>{"invalid_metadata",
                                            error_code::invalid_metadata},
    std::pair<std::string_view, error_code>{"token_missing",
                                            error_code::token_missing},
    std::pair<std::string_view, error_code>{"not_token_owner",
                                            error_code::not_token_owner},
    std::pair<std::string_view, error_code>{"capability_mismatch",
                                            error_code::capability_mismatch},
    std::pair<std::string_view, error_code>{"storage_mismatch",
                                            error_code::storage_mismatch}};

inline constexpr std::string_view to_string(const error_code value) {
  return to_string(value, kErrorCodeMappings).value_or("unknown");
}

inline constexpr uint32_t to_code(const error_code value) {
  return static_cast<uint32_t>(value);
}

}  // namespace chipmint::schema
