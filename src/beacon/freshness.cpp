#include <chipmint/beacon/freshness.hpp>

#include <spdlog/spdlog.h>

#include <limits>
#include <string>

namespace chipmint::beacon {

namespace {

constexpr uint64_t kMillisecondsPerSecond = 1000;
constexpr uint64_t kMaxRoundOffset =
    ((std::numeric_limits<uint64_t>::max() / kMillisecondsPerSecond) -
     kGenesisSeconds) /
    kPeriodSeconds;

}  // namespace

invalid_round_error::invalid_round_error(const chipmint::schema::round_t round)
    : std::invalid_argument{"invalid beacon round " + std::to_string(round)},
      round_{round} {}

std::optional<chipmint::schema::timestamp_milliseconds_t> round_time(
    const chipmint::schema::round_t round) {
  if (round < kGenesisRound) {
    return std::nullopt;
  }
  const auto offset = round - kGenesisRound;
  if (offset > kMaxRoundOffset) {
    return std::nullopt;
  }
  return (kGenesisSeconds + (kPeriodSeconds * offset)) *
         kMillisecondsPerSecond;
}

std::optional<chipmint::schema::round_t> current_round(
    const chipmint::schema::timestamp_milliseconds_t now_ms) {
  const auto genesis_ms = kGenesisSeconds * kMillisecondsPerSecond;
  if (now_ms < genesis_ms) {
    return std::nullopt;
  }
  const auto period_ms = kPeriodSeconds * kMillisecondsPerSecond;
  return kGenesisRound + ((now_ms - genesis_ms) / period_ms);
}

chipmint::schema::error_code check_freshness(
    const chipmint::schema::round_t round,
    const chipmint::schema::timestamp_milliseconds_t now_ms) {
  const auto expected = round_time(round);
  if (!expected) {
    spdlog::debug("Beacon round {} is outside the chain's valid range", round);
    return chipmint::schema::error_code::invalid_round;
  }
  if (now_ms < *expected) {
    return chipmint::schema::error_code::ok;
  }
  if ((now_ms - *expected) <= kTtlMilliseconds) {
    return chipmint::schema::error_code::ok;
  }
  spdlog::debug("Beacon round {} expired: round time {} ms, now {} ms", round,
                *expected, now_ms);
  return chipmint::schema::error_code::signature_expired;
}

bool is_within_ttl(const chipmint::schema::round_t round,
                   const chipmint::schema::timestamp_milliseconds_t now_ms) {
  const auto result = check_freshness(round, now_ms);
  if (result == chipmint::schema::error_code::invalid_round) {
    throw invalid_round_error{round};
  }
  return result == chipmint::schema::error_code::ok;
}

}  // namespace chipmint::beacon
