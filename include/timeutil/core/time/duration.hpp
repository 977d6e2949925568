#pragma once

#include <timeutil/core/time/errors.hpp>
#include <timeutil/core/time/expected.hpp>
#include <cstdint>

namespace TimeUtil {

class Instant;

/**
 * @class Duration
 * @brief Signed elapsed-time delta with nanosecond resolution.
 *
 * Stored in floor form: value = seconds() + nanos() / 1e9 with nanos() in
 * [0, 1e9). The sign therefore belongs to the whole value; -1.5s is
 * {seconds = -2, nanos = 500000000}.
 */
class Duration {
public:
    static constexpr int64_t NANOS_PER_SECOND = 1000000000;

    Duration() = default;

    static Duration fromSeconds(int64_t seconds);
    static Duration fromMillis(int64_t millis);
    static Duration fromMicros(int64_t micros);
    static Duration fromNanos(int64_t nanos);
    static Duration fromMinutes(int32_t minutes);
    static Duration fromHours(int32_t hours);
    static Duration fromDays(int32_t days);

    /**
     * @brief Build from an arbitrary (seconds, nanos) pair, carrying whole
     * seconds out of nanos.
     * @return OUT_OF_RANGE if the carried seconds overflow int64
     */
    static Expected<Duration, ArithmeticError> fromParts(int64_t seconds, int64_t nanos);

    int64_t seconds() const { return seconds_; }
    uint32_t nanos() const { return nanos_; }

    bool isNegative() const { return seconds_ < 0; }
    bool isZero() const { return seconds_ == 0 && nanos_ == 0; }

    // Floor of the value in milliseconds (saturates at the int64 limits)
    int64_t totalMillis() const;

    // Fails only for the most negative representable duration
    Expected<Duration, ArithmeticError> negated() const;

    bool operator==(const Duration& other) const {
        return seconds_ == other.seconds_ && nanos_ == other.nanos_;
    }
    bool operator!=(const Duration& other) const { return !(*this == other); }
    bool operator<(const Duration& other) const {
        return seconds_ < other.seconds_ || (seconds_ == other.seconds_ && nanos_ < other.nanos_);
    }
    bool operator>(const Duration& other) const { return other < *this; }
    bool operator<=(const Duration& other) const { return !(other < *this); }
    bool operator>=(const Duration& other) const { return !(*this < other); }

private:
    Duration(int64_t seconds, uint32_t nanos) : seconds_(seconds), nanos_(nanos) {}

    int64_t seconds_ = 0;
    uint32_t nanos_ = 0;

    friend class Instant;
    friend Duration difference(const Instant& a, const Instant& b);
};

} // namespace TimeUtil
