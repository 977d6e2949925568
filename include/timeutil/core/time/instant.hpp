#pragma once

#include <timeutil/core/time/clock.hpp>
#include <timeutil/core/time/duration.hpp>
#include <timeutil/core/time/errors.hpp>
#include <timeutil/core/time/expected.hpp>
#include <chrono>
#include <cstdint>

namespace TimeUtil {

/**
 * @class Instant
 * @brief Zone-independent point in time with nanosecond precision.
 *
 * Representation: whole seconds since 1970-01-01T00:00:00Z plus a
 * nanosecond fraction in [0, 1e9). Ordering is lexicographic on
 * (seconds, nanos).
 *
 * Representable range is UTC years 0001 through 9998:
 *   MIN_SECONDS = 0001-01-01T00:00:00Z
 *   MAX_SECONDS = 9998-12-31T23:59:59Z (with nanos up to 999999999)
 * Under any RFC 3339 offset (|offset| < 24h) the wall time of every
 * representable instant keeps a four-digit year, so text round-trips are
 * total. Anything that would leave the range fails with OUT_OF_RANGE.
 */
class Instant {
public:
    static constexpr int64_t MIN_SECONDS = -62135596800LL;
    static constexpr int64_t MAX_SECONDS = 253370764799LL;
    static constexpr int64_t NANOS_PER_SECOND = Duration::NANOS_PER_SECOND;

    // The Unix epoch
    Instant() = default;

    static Instant epoch() { return Instant(); }
    static Instant min() { return Instant(MIN_SECONDS, 0); }
    static Instant max() { return Instant(MAX_SECONDS, NANOS_PER_SECOND - 1); }

    /**
     * @brief Build from seconds plus an arbitrary nanosecond count; whole
     * seconds are carried out of nanos (negative nanos borrow).
     */
    static Expected<Instant, ArithmeticError> fromParts(int64_t seconds, int64_t nanos);

    static Expected<Instant, ArithmeticError> fromUnixSeconds(int64_t seconds);
    static Expected<Instant, ArithmeticError> fromUnixMillis(int64_t millis);
    static Expected<Instant, ArithmeticError> fromUnixNanos(int64_t nanos);
    static Expected<Instant, ArithmeticError> fromClockReading(const ClockReading& reading);
    static Expected<Instant, ArithmeticError> fromSystemTime(std::chrono::system_clock::time_point tp);

    static Expected<Instant, ArithmeticError> now(const Clock& clock);

    int64_t seconds() const { return seconds_; }
    uint32_t nanos() const { return nanos_; }

    // Floor of the value in milliseconds since the Unix epoch
    int64_t unixMillis() const;

    static bool inRange(int64_t seconds) {
        return seconds >= MIN_SECONDS && seconds <= MAX_SECONDS;
    }

    bool operator==(const Instant& other) const {
        return seconds_ == other.seconds_ && nanos_ == other.nanos_;
    }
    bool operator!=(const Instant& other) const { return !(*this == other); }
    bool operator<(const Instant& other) const {
        return seconds_ < other.seconds_ || (seconds_ == other.seconds_ && nanos_ < other.nanos_);
    }
    bool operator>(const Instant& other) const { return other < *this; }
    bool operator<=(const Instant& other) const { return !(other < *this); }
    bool operator>=(const Instant& other) const { return !(*this < other); }

private:
    Instant(int64_t seconds, uint32_t nanos) : seconds_(seconds), nanos_(nanos) {}

    int64_t seconds_ = 0;
    uint32_t nanos_ = 0;

    friend Expected<Instant, ArithmeticError> add(const Instant& instant, const Duration& duration);
    friend Duration difference(const Instant& a, const Instant& b);
};

/**
 * @brief instant + duration
 * @return OUT_OF_RANGE if the result leaves the representable range
 */
Expected<Instant, ArithmeticError> add(const Instant& instant, const Duration& duration);

/**
 * @brief instant - duration
 * @return OUT_OF_RANGE if the result leaves the representable range
 */
Expected<Instant, ArithmeticError> subtract(const Instant& instant, const Duration& duration);

/**
 * @brief a - b, exact. Always representable for two representable instants.
 */
Duration difference(const Instant& a, const Instant& b);

} // namespace TimeUtil
