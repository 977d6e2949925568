#include <timeutil/core/time/instant.hpp>
#include <timeutil/core/time/calendar.hpp>
#include <limits>
#include <string>

namespace TimeUtil {

namespace {

constexpr int64_t INT64_MAX_VALUE = std::numeric_limits<int64_t>::max();
constexpr int64_t INT64_MIN_VALUE = std::numeric_limits<int64_t>::min();

// Widest span between two representable instants, in seconds
constexpr int64_t MAX_SPAN_SECONDS = Instant::MAX_SECONDS - Instant::MIN_SECONDS + 1;

ArithmeticError outOfRange(std::string detail) {
    ArithmeticError e;
    e.kind = ArithmeticErrorKind::OUT_OF_RANGE;
    e.detail = std::move(detail);
    return e;
}

// seconds + carry without wrapping; false on int64 overflow
bool checkedCarry(int64_t seconds, int64_t carry, int64_t& out) {
    if (carry > 0 && seconds > INT64_MAX_VALUE - carry) return false;
    if (carry < 0 && seconds < INT64_MIN_VALUE - carry) return false;
    out = seconds + carry;
    return true;
}

} // anonymous namespace

// ============================================================================
// DURATION
// ============================================================================

Duration Duration::fromSeconds(int64_t seconds) {
    return Duration(seconds, 0);
}

Duration Duration::fromMillis(int64_t millis) {
    return Duration(Calendar::floorDiv(millis, 1000),
                    static_cast<uint32_t>(Calendar::floorMod(millis, 1000) * 1000000));
}

Duration Duration::fromMicros(int64_t micros) {
    return Duration(Calendar::floorDiv(micros, 1000000),
                    static_cast<uint32_t>(Calendar::floorMod(micros, 1000000) * 1000));
}

Duration Duration::fromNanos(int64_t nanos) {
    return Duration(Calendar::floorDiv(nanos, NANOS_PER_SECOND),
                    static_cast<uint32_t>(Calendar::floorMod(nanos, NANOS_PER_SECOND)));
}

Duration Duration::fromMinutes(int32_t minutes) {
    return Duration(static_cast<int64_t>(minutes) * Calendar::SECONDS_PER_MINUTE, 0);
}

Duration Duration::fromHours(int32_t hours) {
    return Duration(static_cast<int64_t>(hours) * Calendar::SECONDS_PER_HOUR, 0);
}

Duration Duration::fromDays(int32_t days) {
    return Duration(static_cast<int64_t>(days) * Calendar::SECONDS_PER_DAY, 0);
}

Expected<Duration, ArithmeticError> Duration::fromParts(int64_t seconds, int64_t nanos) {
    int64_t total = 0;
    if (!checkedCarry(seconds, Calendar::floorDiv(nanos, NANOS_PER_SECOND), total)) {
        return outOfRange("duration seconds overflow");
    }
    return Duration(total, static_cast<uint32_t>(Calendar::floorMod(nanos, NANOS_PER_SECOND)));
}

int64_t Duration::totalMillis() const {
    constexpr int64_t limit = INT64_MAX_VALUE / 1000 - 1;
    if (seconds_ > limit) return INT64_MAX_VALUE;
    if (seconds_ < -limit) return INT64_MIN_VALUE;
    return seconds_ * 1000 + static_cast<int64_t>(nanos_ / 1000000);
}

Expected<Duration, ArithmeticError> Duration::negated() const {
    if (nanos_ == 0) {
        if (seconds_ == INT64_MIN_VALUE) {
            return outOfRange("cannot negate the most negative duration");
        }
        return Duration(-seconds_, 0);
    }
    // -(s + n) == (-1 - s) + (1 - n); -1 - s cannot overflow for any int64_t s
    return Duration(-1 - seconds_, static_cast<uint32_t>(NANOS_PER_SECOND - nanos_));
}

// ============================================================================
// INSTANT
// ============================================================================

Expected<Instant, ArithmeticError> Instant::fromParts(int64_t seconds, int64_t nanos) {
    int64_t total = 0;
    if (!checkedCarry(seconds, Calendar::floorDiv(nanos, NANOS_PER_SECOND), total) || !inRange(total)) {
        return outOfRange("instant seconds " + std::to_string(seconds) + " outside years 0001..9998");
    }
    return Instant(total, static_cast<uint32_t>(Calendar::floorMod(nanos, NANOS_PER_SECOND)));
}

Expected<Instant, ArithmeticError> Instant::fromUnixSeconds(int64_t seconds) {
    return fromParts(seconds, 0);
}

Expected<Instant, ArithmeticError> Instant::fromUnixMillis(int64_t millis) {
    return fromParts(Calendar::floorDiv(millis, 1000), Calendar::floorMod(millis, 1000) * 1000000);
}

Expected<Instant, ArithmeticError> Instant::fromUnixNanos(int64_t nanos) {
    return fromParts(Calendar::floorDiv(nanos, NANOS_PER_SECOND), Calendar::floorMod(nanos, NANOS_PER_SECOND));
}

Expected<Instant, ArithmeticError> Instant::fromClockReading(const ClockReading& reading) {
    return fromParts(reading.seconds, reading.nanos);
}

Expected<Instant, ArithmeticError> Instant::fromSystemTime(std::chrono::system_clock::time_point tp) {
    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch());
    return fromUnixNanos(static_cast<int64_t>(nanos.count()));
}

Expected<Instant, ArithmeticError> Instant::now(const Clock& clock) {
    return fromClockReading(clock.now());
}

int64_t Instant::unixMillis() const {
    return seconds_ * 1000 + static_cast<int64_t>(nanos_ / 1000000);
}

// ============================================================================
// ARITHMETIC
// ============================================================================

Expected<Instant, ArithmeticError> add(const Instant& instant, const Duration& duration) {
    // Anything longer than the whole range cannot land inside it; this also
    // keeps the sum below from overflowing.
    if (duration.seconds() > MAX_SPAN_SECONDS || duration.seconds() < -MAX_SPAN_SECONDS) {
        return outOfRange("duration exceeds the representable span");
    }

    int64_t seconds = instant.seconds_ + duration.seconds();
    int64_t nanos = static_cast<int64_t>(instant.nanos_) + duration.nanos();
    if (nanos >= Instant::NANOS_PER_SECOND) {
        nanos -= Instant::NANOS_PER_SECOND;
        ++seconds;
    }

    if (!Instant::inRange(seconds)) {
        return outOfRange("result seconds " + std::to_string(seconds) + " outside years 0001..9998");
    }
    return Instant(seconds, static_cast<uint32_t>(nanos));
}

Expected<Instant, ArithmeticError> subtract(const Instant& instant, const Duration& duration) {
    auto negated = duration.negated();
    if (!negated) {
        return negated.error();
    }
    return add(instant, negated.value());
}

Duration difference(const Instant& a, const Instant& b) {
    int64_t seconds = a.seconds_ - b.seconds_;
    int64_t nanos = static_cast<int64_t>(a.nanos_) - static_cast<int64_t>(b.nanos_);
    if (nanos < 0) {
        nanos += Instant::NANOS_PER_SECOND;
        --seconds;
    }
    return Duration(seconds, static_cast<uint32_t>(nanos));
}

} // namespace TimeUtil
