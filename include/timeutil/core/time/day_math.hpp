#pragma once

#include <timeutil/core/time/clock.hpp>
#include <timeutil/core/time/errors.hpp>
#include <timeutil/core/time/expected.hpp>
#include <timeutil/core/time/instant.hpp>
#include <cstdint>

// UTC day boundaries. All results sit exactly on 00:00:00.000000000Z.

namespace TimeUtil {

Instant startOfDay(const Instant& instant);

/**
 * @brief Midnight starting the day after `instant`'s day. An instant already
 * at midnight moves forward a full day.
 */
Expected<Instant, ArithmeticError> nextDay(const Instant& instant);

/**
 * @brief Midnight starting the day `count` days before `instant`'s day
 * (count = 0 gives startOfDay).
 */
Expected<Instant, ArithmeticError> daysBack(const Instant& instant, uint32_t count);

Expected<Instant, ArithmeticError> tomorrow(const Clock& clock);
Expected<Instant, ArithmeticError> daysBack(const Clock& clock, uint32_t count);

} // namespace TimeUtil
