#include <timeutil/core/codec/rfc3339.hpp>
#include <timeutil/core/time/calendar.hpp>
#include "text_scanner.hpp"
#include <cstdio>
#include <stdexcept>

namespace TimeUtil {

namespace {

constexpr int32_t SECONDS_PER_DAY = static_cast<int32_t>(Calendar::SECONDS_PER_DAY);

// Number of fraction digits written for a given precision and fraction
int fractionDigits(SubsecondPrecision precision, uint32_t nanos) {
    switch (precision) {
        case SubsecondPrecision::AUTO:    return nanos == 0 ? 0 : 9;
        case SubsecondPrecision::SECONDS: return 0;
        case SubsecondPrecision::MILLIS:  return 3;
        case SubsecondPrecision::MICROS:  return 6;
        case SubsecondPrecision::NANOS:   return 9;
        default:                          return 9;
    }
}

} // anonymous namespace

const char* toString(SubsecondPrecision precision) {
    switch (precision) {
        case SubsecondPrecision::AUTO:    return "auto";
        case SubsecondPrecision::SECONDS: return "seconds";
        case SubsecondPrecision::MILLIS:  return "millis";
        case SubsecondPrecision::MICROS:  return "micros";
        case SubsecondPrecision::NANOS:   return "nanos";
        default:                          return "unknown";
    }
}

std::string formatRfc3339(const Instant& instant, int32_t offsetSeconds, SubsecondPrecision precision) {
    if (offsetSeconds <= -SECONDS_PER_DAY || offsetSeconds >= SECONDS_PER_DAY) {
        throw std::out_of_range("UTC offset of " + std::to_string(offsetSeconds) + "s is not below 24h");
    }

    // Whole minutes only; C++ division truncates toward zero
    const int32_t offsetMinutes = offsetSeconds / 60;
    const CivilDateTime wall = Calendar::toCivil(instant.seconds() + offsetMinutes * 60);

    char buffer[48];
    int len = std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02uT%02u:%02u:%02u",
                            wall.year, wall.month, wall.day, wall.hour, wall.minute, wall.second);

    const int digits = fractionDigits(precision, instant.nanos());
    if (digits > 0) {
        char fraction[16];
        std::snprintf(fraction, sizeof(fraction), "%09u", instant.nanos());
        len += std::snprintf(buffer + len, sizeof(buffer) - len, ".%.*s", digits, fraction);
    }

    if (offsetMinutes == 0) {
        len += std::snprintf(buffer + len, sizeof(buffer) - len, "Z");
    } else {
        const int32_t magnitude = offsetMinutes < 0 ? -offsetMinutes : offsetMinutes;
        len += std::snprintf(buffer + len, sizeof(buffer) - len, "%c%02d:%02d",
                             offsetMinutes < 0 ? '-' : '+', magnitude / 60, magnitude % 60);
    }

    return std::string(buffer, static_cast<size_t>(len));
}

Expected<Instant, ParseError> parseRfc3339(std::string_view text) {
    auto scanned = detail::scanRfc3339(text);
    if (!scanned) {
        return scanned.error();
    }
    const ParsedDate& date = scanned.value().date;
    return detail::toInstant(date, *date.offsetSeconds);
}

} // namespace TimeUtil
