#pragma once

#include <timeutil/core/time/errors.hpp>
#include <timeutil/core/time/expected.hpp>
#include <timeutil/core/time/instant.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace TimeUtil {

/**
 * @struct FixedZone
 * @brief A named zone with a constant offset (seconds east of UTC).
 */
struct FixedZone {
    const char* name;
    int32_t offsetSeconds;
};

constexpr FixedZone UTC_ZONE{"UTC", 0};
constexpr FixedZone EST_ZONE{"EST", -5 * 3600};

/**
 * @brief Correct a stamp by the zone's offset: the result is `stamp` moved
 * by `zone.offsetSeconds` (EST stamps move back five hours, UTC stamps are
 * unchanged).
 */
Expected<Instant, ArithmeticError> applyZoneOffset(const Instant& stamp, const FixedZone& zone);

/**
 * @brief Parse a fixed-offset zone identifier.
 *
 * Accepts "UTC", "UT", "GMT", "Z", and an optional "UTC"/"GMT" prefix
 * followed by +HH, +HHMM or +HH:MM (or '-'). Offsets beyond 23:59 are
 * rejected.
 * @return offset in seconds east of UTC, or nullopt if `text` is not a
 *         fixed-offset identifier
 */
std::optional<int32_t> parseFixedOffset(std::string_view text);

// "+05:30" / "-08:00" / "+00:00" (whole minutes, truncated toward zero)
std::string formatFixedOffset(int32_t offsetSeconds);

} // namespace TimeUtil
