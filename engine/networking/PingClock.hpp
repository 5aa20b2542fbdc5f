#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>

namespace Vigilant {

/// Source of wall-clock time; injectable so tests can control it
using WallClock = std::function<std::chrono::system_clock::time_point()>;

[[nodiscard]] WallClock SystemWallClock();

// ============================================================================
// Compressed ping timestamps
// ============================================================================

/**
 * @brief Encode a wall-clock time into a 32-bit ping payload
 *
 * Layout is (seconds << 10) | (nanoseconds >> 22): the low 22 bits of the
 * Unix seconds and roughly millisecond resolution for the fraction.
 */
[[nodiscard]] uint32_t EncodePingTime(std::chrono::system_clock::time_point time) noexcept;

/**
 * @brief Decode a ping payload into an offset within the 22-bit seconds window
 */
[[nodiscard]] std::chrono::nanoseconds DecodePingTime(uint32_t encoded) noexcept;

/**
 * @brief Seconds elapsed between an encoded timestamp and now
 *
 * "now" is reduced to the same seconds window before subtracting. Returns
 * nothing if the encoded time lies in the future, which includes samples
 * taken just before the window wrapped.
 */
[[nodiscard]] std::optional<double> PingElapsedSeconds(uint32_t encoded,
                                                       std::chrono::system_clock::time_point now) noexcept;

/**
 * @brief Exponentially weighted moving average of round-trip times
 *
 * The first sample is taken as-is.
 */
class PingEstimator {
public:
    static constexpr double DEFAULT_ALPHA = 0.125;

    explicit PingEstimator(double alpha = DEFAULT_ALPHA) noexcept : m_alpha(alpha) {}

    void AddSample(double seconds) noexcept;

    [[nodiscard]] bool HasSample() const noexcept { return m_hasSample; }
    [[nodiscard]] double GetSeconds() const noexcept { return m_estimate; }

private:
    double m_alpha;
    double m_estimate = 0.0;
    bool m_hasSample = false;
};

} // namespace Vigilant
