#include <timeutil/core/time/day_math.hpp>
#include <timeutil/core/time/calendar.hpp>

namespace TimeUtil {

Instant startOfDay(const Instant& instant) {
    int64_t day = Calendar::floorDiv(instant.seconds(), Calendar::SECONDS_PER_DAY);
    // Year 0001 starts on a day boundary, so the floor never leaves the range
    return Instant::fromUnixSeconds(day * Calendar::SECONDS_PER_DAY).value();
}

Expected<Instant, ArithmeticError> nextDay(const Instant& instant) {
    return add(startOfDay(instant), Duration::fromDays(1));
}

Expected<Instant, ArithmeticError> daysBack(const Instant& instant, uint32_t count) {
    return subtract(startOfDay(instant),
                    Duration::fromSeconds(static_cast<int64_t>(count) * Calendar::SECONDS_PER_DAY));
}

Expected<Instant, ArithmeticError> tomorrow(const Clock& clock) {
    auto now = Instant::now(clock);
    if (!now) {
        return now.error();
    }
    return nextDay(now.value());
}

Expected<Instant, ArithmeticError> daysBack(const Clock& clock, uint32_t count) {
    auto now = Instant::now(clock);
    if (!now) {
        return now.error();
    }
    return daysBack(now.value(), count);
}

} // namespace TimeUtil
