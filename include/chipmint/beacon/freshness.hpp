#pragma once

#include <chipmint/schema/error_code.hpp>
#include <chipmint/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <stdexcept>

namespace chipmint::beacon {

/// Unix time of round 1 on the drand default chain.
inline constexpr uint64_t kGenesisSeconds = 1595431050;
/// Seconds between consecutive rounds.
inline constexpr uint64_t kPeriodSeconds = 30;
/// Maximum age of a round before signatures bound to it are refused.
inline constexpr chipmint::schema::duration_milliseconds_t kTtlMilliseconds =
    60000;
inline constexpr chipmint::schema::round_t kGenesisRound = 1;

/// Raised when a round precedes the genesis round or its nominal time does
/// not fit in 64-bit milliseconds.
class invalid_round_error final : public std::invalid_argument {
 public:
  explicit invalid_round_error(chipmint::schema::round_t round);

  chipmint::schema::round_t round() const { return round_; }

 private:
  chipmint::schema::round_t round_;
};

/// Nominal publication time of round in milliseconds:
/// `(genesis + period * (round - 1)) * 1000`. std::nullopt for round 0 and
/// for rounds whose time overflows.
std::optional<chipmint::schema::timestamp_milliseconds_t> round_time(
    chipmint::schema::round_t round);

/// Latest round published at or before now_ms; std::nullopt before genesis.
std::optional<chipmint::schema::round_t> current_round(
    chipmint::schema::timestamp_milliseconds_t now_ms);

/// Freshness check used by the lifecycle. Returns `ok`, `signature_expired`
/// or `invalid_round`. A round whose nominal time is still in the future
/// relative to now_ms is accepted to tolerate clock skew.
chipmint::schema::error_code check_freshness(
    chipmint::schema::round_t round,
    chipmint::schema::timestamp_milliseconds_t now_ms);

/// Boolean form of `check_freshness`. Throws `invalid_round_error` for rounds
/// `check_freshness` reports as `invalid_round`.
bool is_within_ttl(chipmint::schema::round_t round,
                   chipmint::schema::timestamp_milliseconds_t now_ms);

}  // namespace chipmint::beacon
