/**
 * @file test_ping_clock.cpp
 * @brief Unit tests for compressed ping timestamps and RTT smoothing
 */

#include <gtest/gtest.h>

#include "networking/PingClock.hpp"

#include <chrono>

using namespace Vigilant;
using namespace std::chrono;

namespace {

system_clock::time_point At(int64_t secs, int64_t millis = 0) {
    return system_clock::time_point(duration_cast<system_clock::duration>(seconds(secs) + milliseconds(millis)));
}

} // anonymous namespace

// =============================================================================
// Encoding
// =============================================================================

TEST(PingClockTest, EncodeLayout) {
    // 5 s + 0.5 s: nanos 500'000'000 >> 22 == 119
    uint32_t encoded = EncodePingTime(At(5, 500));

    EXPECT_EQ((5u << 10) | 119u, encoded);
}

TEST(PingClockTest, DecodeIsWithinResolution) {
    uint32_t encoded = EncodePingTime(At(1234, 250));
    auto decoded = DecodePingTime(encoded);

    auto expected = duration_cast<nanoseconds>(seconds(1234) + milliseconds(250));
    EXPECT_LE(decoded, expected);
    EXPECT_LT(expected - decoded, nanoseconds(1 << 22));
}

TEST(PingClockTest, SecondsWrapAtTwentyTwoBits) {
    constexpr int64_t window = int64_t{1} << 22;

    EXPECT_EQ(EncodePingTime(At(17, 100)), EncodePingTime(At(window + 17, 100)));
}

// =============================================================================
// Elapsed Time
// =============================================================================

TEST(PingClockTest, ElapsedIsNonNegativeForOwnPing) {
    auto sent = At(1'700'000'000, 10);
    uint32_t encoded = EncodePingTime(sent);

    auto elapsed = PingElapsedSeconds(encoded, sent);
    ASSERT_TRUE(elapsed.has_value());
    EXPECT_GE(*elapsed, 0.0);
    EXPECT_LT(*elapsed, 0.005);
}

TEST(PingClockTest, ElapsedMeasuresRoundTrip) {
    auto sent = At(1'700'000'000, 100);
    uint32_t encoded = EncodePingTime(sent);

    auto elapsed = PingElapsedSeconds(encoded, sent + milliseconds(80));
    ASSERT_TRUE(elapsed.has_value());
    EXPECT_NEAR(0.080, *elapsed, 0.005);
}

TEST(PingClockTest, FutureTimestampIsIgnored) {
    auto now = At(1'700'000'000, 0);
    uint32_t encoded = EncodePingTime(now + seconds(3));

    EXPECT_FALSE(PingElapsedSeconds(encoded, now).has_value());
}

TEST(PingClockTest, SampleAcrossWindowWrapIsIgnored) {
    constexpr int64_t window = int64_t{1} << 22;
    auto sent = At(window - 1, 900);
    uint32_t encoded = EncodePingTime(sent);

    EXPECT_FALSE(PingElapsedSeconds(encoded, At(window, 100)).has_value());
}

// =============================================================================
// PingEstimator
// =============================================================================

TEST(PingEstimatorTest, FirstSampleTakenAsIs) {
    PingEstimator estimator;

    EXPECT_FALSE(estimator.HasSample());
    estimator.AddSample(0.2);

    EXPECT_TRUE(estimator.HasSample());
    EXPECT_DOUBLE_EQ(0.2, estimator.GetSeconds());
}

TEST(PingEstimatorTest, LaterSamplesAreSmoothed) {
    PingEstimator estimator;
    estimator.AddSample(0.1);
    estimator.AddSample(0.9);

    EXPECT_DOUBLE_EQ(0.875 * 0.1 + 0.125 * 0.9, estimator.GetSeconds());
}

TEST(PingEstimatorTest, CustomAlpha) {
    PingEstimator estimator(0.5);
    estimator.AddSample(1.0);
    estimator.AddSample(0.0);

    EXPECT_DOUBLE_EQ(0.5, estimator.GetSeconds());
}
