#include <chipmint/beacon/freshness.hpp>
#include <gtest/gtest.h>

#include <limits>

namespace {

constexpr auto kGenesisMs = chipmint::beacon::kGenesisSeconds * 1000;

}  // namespace

TEST(beacon_freshness, round_time_follows_genesis_and_period) {
  EXPECT_EQ(chipmint::beacon::round_time(1), kGenesisMs);
  EXPECT_EQ(chipmint::beacon::round_time(2), kGenesisMs + 30000);
  EXPECT_EQ(chipmint::beacon::round_time(1001), kGenesisMs + 30000000);
  EXPECT_FALSE(chipmint::beacon::round_time(0).has_value());
  EXPECT_FALSE(chipmint::beacon::round_time(
                   std::numeric_limits<chipmint::schema::round_t>::max())
                   .has_value());
}

TEST(beacon_freshness, window_closes_after_sixty_seconds) {
  const auto round = chipmint::schema::round_t{1000};
  const auto published = *chipmint::beacon::round_time(round);

  EXPECT_TRUE(chipmint::beacon::is_within_ttl(round, published));
  EXPECT_TRUE(chipmint::beacon::is_within_ttl(round, published + 60000));
  EXPECT_FALSE(chipmint::beacon::is_within_ttl(round, published + 60001));
  EXPECT_EQ(chipmint::beacon::check_freshness(round, published + 60001),
            chipmint::schema::error_code::signature_expired);
}

TEST(beacon_freshness, future_rounds_are_accepted) {
  const auto round = chipmint::schema::round_t{5000};
  const auto published = *chipmint::beacon::round_time(round);
  EXPECT_TRUE(chipmint::beacon::is_within_ttl(round, published - 1));
  EXPECT_TRUE(chipmint::beacon::is_within_ttl(round, 0));
}

TEST(beacon_freshness, freshness_is_monotonic_in_time) {
  const auto round = chipmint::schema::round_t{42};
  const auto published = *chipmint::beacon::round_time(round);
  auto was_fresh = true;
  for (auto now = published - 30000; now <= published + 120000; now += 7500) {
    const auto fresh = chipmint::beacon::is_within_ttl(round, now);
    EXPECT_TRUE(was_fresh || !fresh) << "freshness returned at " << now;
    was_fresh = fresh;
  }
  EXPECT_FALSE(was_fresh);
}

TEST(beacon_freshness, round_zero_is_invalid) {
  EXPECT_THROW(chipmint::beacon::is_within_ttl(0, kGenesisMs),
               chipmint::beacon::invalid_round_error);
  EXPECT_EQ(chipmint::beacon::check_freshness(0, kGenesisMs),
            chipmint::schema::error_code::invalid_round);
  try {
    chipmint::beacon::is_within_ttl(0, kGenesisMs);
  } catch (const chipmint::beacon::invalid_round_error& e) {
    EXPECT_EQ(e.round(), 0u);
  }
}

TEST(beacon_freshness, overflowing_round_is_invalid) {
  const auto round = std::numeric_limits<chipmint::schema::round_t>::max();
  EXPECT_EQ(chipmint::beacon::check_freshness(round, kGenesisMs),
            chipmint::schema::error_code::invalid_round);
  EXPECT_THROW(chipmint::beacon::is_within_ttl(round, kGenesisMs),
               chipmint::beacon::invalid_round_error);
}

TEST(beacon_freshness, current_round_tracks_the_clock) {
  EXPECT_FALSE(chipmint::beacon::current_round(kGenesisMs - 1).has_value());
  EXPECT_EQ(chipmint::beacon::current_round(kGenesisMs), 1u);
  EXPECT_EQ(chipmint::beacon::current_round(kGenesisMs + 29999), 1u);
  EXPECT_EQ(chipmint::beacon::current_round(kGenesisMs + 30000), 2u);

  const auto round = chipmint::schema::round_t{123456};
  EXPECT_EQ(chipmint::beacon::current_round(
                *chipmint::beacon::round_time(round)),
            round);
}
