#pragma once

#include <timeutil/core/time/errors.hpp>
#include <timeutil/core/time/expected.hpp>
#include <timeutil/core/time/instant.hpp>
#include <cstdint>
#include <string>
#include <string_view>

// ============================================================================
// RFC 3339 TEXT CODEC
// ============================================================================
// Output:   YYYY-MM-DDTHH:MM:SS[.fffffffff](Z|+HH:MM|-HH:MM)
//
// Input grammar (superset of the output):
//   date-time = full-date sep full-time
//   full-date = 4DIGIT "-" 2DIGIT "-" 2DIGIT
//   sep       = "T" / "t" / " "
//   full-time = 2DIGIT ":" 2DIGIT ":" 2DIGIT [ "." 1*9DIGIT ] offset
//   offset    = "Z" / "z" / ( "+" / "-" ) 2DIGIT ":" 2DIGIT
//
// Leap seconds (SS = 60) are rejected as OUT_OF_RANGE.
// ============================================================================

namespace TimeUtil {

// Largest offset RFC 3339 can express: 23:59
constexpr int32_t MAX_OFFSET_SECONDS = 23 * 3600 + 59 * 60;

enum class SubsecondPrecision : uint8_t {
    AUTO = 0,       // nine digits when the fraction is non-zero, none otherwise
    SECONDS = 1,    // no fraction (truncates)
    MILLIS = 2,     // exactly 3 digits (truncates)
    MICROS = 3,     // exactly 6 digits (truncates)
    NANOS = 4       // exactly 9 digits
};

const char* toString(SubsecondPrecision precision);

/**
 * @brief Format an instant as RFC 3339 wall time at the given offset.
 *
 * The offset is applied in whole minutes truncated toward zero, and a zero
 * offset is written as "Z". With AUTO precision the output parses back to
 * the identical instant.
 *
 * @param offsetSeconds seconds east of UTC
 * @throws std::out_of_range if |offsetSeconds| >= 24h
 */
std::string formatRfc3339(const Instant& instant,
                          int32_t offsetSeconds = 0,
                          SubsecondPrecision precision = SubsecondPrecision::AUTO);

/**
 * @brief Strict RFC 3339 parse.
 * @return MALFORMED on syntax errors, OUT_OF_RANGE on invalid field values
 *         or an instant outside the representable range
 */
Expected<Instant, ParseError> parseRfc3339(std::string_view text);

} // namespace TimeUtil
