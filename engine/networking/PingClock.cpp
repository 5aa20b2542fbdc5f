#include "networking/PingClock.hpp"

namespace Vigilant {

namespace {

constexpr int FRACTION_BITS = 10;
constexpr int NANOS_SHIFT = 22;
constexpr uint64_t SECONDS_WINDOW = uint64_t{1} << (32 - FRACTION_BITS);

} // anonymous namespace

WallClock SystemWallClock() {
    return [] { return std::chrono::system_clock::now(); };
}

uint32_t EncodePingTime(std::chrono::system_clock::time_point time) noexcept {
    using namespace std::chrono;
    auto sinceEpoch = duration_cast<nanoseconds>(time.time_since_epoch());
    if (sinceEpoch.count() < 0) {
        return 0;
    }
    auto secs = duration_cast<seconds>(sinceEpoch);
    auto nanos = static_cast<uint32_t>((sinceEpoch - secs).count());
    return (static_cast<uint32_t>(secs.count()) << FRACTION_BITS) | (nanos >> NANOS_SHIFT);
}

std::chrono::nanoseconds DecodePingTime(uint32_t encoded) noexcept {
    using namespace std::chrono;
    auto secs = seconds(encoded >> FRACTION_BITS);
    auto nanos = nanoseconds(static_cast<uint64_t>(encoded & ((1u << FRACTION_BITS) - 1)) << NANOS_SHIFT);
    return duration_cast<nanoseconds>(secs) + nanos;
}

std::optional<double> PingElapsedSeconds(uint32_t encoded,
                                         std::chrono::system_clock::time_point now) noexcept {
    using namespace std::chrono;
    auto sinceEpoch = duration_cast<nanoseconds>(now.time_since_epoch());
    if (sinceEpoch.count() < 0) {
        return std::nullopt;
    }
    auto secs = duration_cast<seconds>(sinceEpoch);
    auto nowInWindow = duration_cast<nanoseconds>(seconds(static_cast<uint64_t>(secs.count()) % SECONDS_WINDOW))
                     + (sinceEpoch - secs);

    auto sent = DecodePingTime(encoded);
    if (sent > nowInWindow) {
        return std::nullopt;
    }
    return duration<double>(nowInWindow - sent).count();
}

void PingEstimator::AddSample(double seconds) noexcept {
    if (!m_hasSample) {
        m_estimate = seconds;
        m_hasSample = true;
        return;
    }
    m_estimate = (1.0 - m_alpha) * m_estimate + m_alpha * seconds;
}

} // namespace Vigilant
