#pragma once

#include <cstdint>

// Proleptic Gregorian civil date arithmetic. Every decomposition of an
// Instant into wall fields and every composition back goes through here.

namespace TimeUtil {

struct CivilDateTime {
    int year = 1970;
    unsigned month = 1;      // 1..12
    unsigned day = 1;        // 1..daysInMonth
    unsigned hour = 0;
    unsigned minute = 0;
    unsigned second = 0;
    uint32_t nanosecond = 0;
};

namespace Calendar {

constexpr int64_t SECONDS_PER_MINUTE = 60;
constexpr int64_t SECONDS_PER_HOUR = 60 * SECONDS_PER_MINUTE;
constexpr int64_t SECONDS_PER_DAY = 24 * SECONDS_PER_HOUR;

bool isLeapYear(int year);
unsigned daysInMonth(int year, unsigned month);

// Days since 1970-01-01 for a (valid) civil date.
int64_t daysFromCivil(int year, unsigned month, unsigned day);
void civilFromDays(int64_t days, int& year, unsigned& month, unsigned& day);

// 0 = Sunday .. 6 = Saturday
unsigned weekdayFromDays(int64_t days);
// 1-based ordinal day in the year
unsigned dayOfYear(int year, unsigned month, unsigned day);

/**
 * @brief Decompose seconds since the Unix epoch into wall fields
 * (nanosecond is left at 0).
 */
CivilDateTime toCivil(int64_t epochSeconds);

/**
 * @brief Seconds since the Unix epoch for wall fields read as UTC.
 * Fields must already be validated; nanosecond is ignored.
 */
int64_t toEpochSeconds(const CivilDateTime& civil);

// Floor division helpers used for normalisation
int64_t floorDiv(int64_t value, int64_t divisor);
int64_t floorMod(int64_t value, int64_t divisor);

} // namespace Calendar
} // namespace TimeUtil
