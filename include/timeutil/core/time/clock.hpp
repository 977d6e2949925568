// ============================================================================
// WALL CLOCK SOURCES
// ============================================================================
// The core never reads the system time by itself. Whoever needs "now"
// passes a Clock, and the Instant is built from its reading.
// ============================================================================

#pragma once

#include <cstdint>

namespace TimeUtil {

/**
 * @struct ClockReading
 * @brief Raw wall clock value: seconds since the Unix epoch plus nanoseconds.
 * nanos is expected in [0, 1e9) but is normalised again by Instant.
 */
struct ClockReading {
    int64_t seconds = 0;
    int64_t nanos = 0;
};

class Clock {
public:
    virtual ~Clock() = default;
    virtual ClockReading now() const = 0;
};

/**
 * @class SystemClock
 * @brief std::chrono::system_clock (UTC, not monotonic)
 */
class SystemClock : public Clock {
public:
    ClockReading now() const override;

    static const SystemClock& instance();
};

/**
 * @class FixedClock
 * @brief Always returns the reading it was built with (tests, replay).
 */
class FixedClock : public Clock {
public:
    explicit FixedClock(ClockReading reading) : reading_(reading) {}

    ClockReading now() const override { return reading_; }

private:
    ClockReading reading_;
};

} // namespace TimeUtil
