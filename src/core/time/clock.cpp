#include <timeutil/core/time/clock.hpp>
#include <chrono>

namespace TimeUtil {

ClockReading SystemClock::now() const {
    auto sinceEpoch = std::chrono::system_clock::now().time_since_epoch();
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(sinceEpoch);
    if (secs > sinceEpoch) {
        // duration_cast truncates toward zero; keep nanos non-negative
        secs -= std::chrono::seconds(1);
    }
    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(sinceEpoch - secs);

    ClockReading reading;
    reading.seconds = static_cast<int64_t>(secs.count());
    reading.nanos = static_cast<int64_t>(nanos.count());
    return reading;
}

const SystemClock& SystemClock::instance() {
    static SystemClock instance;
    return instance;
}

} // namespace TimeUtil
