#include <timeutil/core/time/calendar.hpp>

namespace TimeUtil {
namespace Calendar {

namespace {

constexpr unsigned MONTH_DAYS[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
constexpr unsigned MONTH_OFFSETS[12] = {0, 31, 59, 90, 120, 151, 181, 212, 243, 273, 304, 334};

// 0000-03-01 to 1970-01-01
constexpr int64_t EPOCH_SHIFT_DAYS = 719468;
constexpr int64_t DAYS_PER_ERA = 146097;

} // anonymous namespace

bool isLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || (year % 400 == 0);
}

unsigned daysInMonth(int year, unsigned month) {
    if (month == 2 && isLeapYear(year)) {
        return 29;
    }
    return MONTH_DAYS[month - 1];
}

int64_t daysFromCivil(int year, unsigned month, unsigned day) {
    const int64_t y = static_cast<int64_t>(year) - (month <= 2 ? 1 : 0);
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153u * (month > 2 ? month - 3 : month + 9) + 2u) / 5u + day - 1u;
    const unsigned doe = yoe * 365u + yoe / 4u - yoe / 100u + doy;
    return era * DAYS_PER_ERA + static_cast<int64_t>(doe) - EPOCH_SHIFT_DAYS;
}

void civilFromDays(int64_t days, int& year, unsigned& month, unsigned& day) {
    days += EPOCH_SHIFT_DAYS;
    const int64_t era = (days >= 0 ? days : days - (DAYS_PER_ERA - 1)) / DAYS_PER_ERA;
    const unsigned doe = static_cast<unsigned>(days - era * DAYS_PER_ERA);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    day = doy - (153 * mp + 2) / 5 + 1;
    month = mp < 10 ? mp + 3 : mp - 9;
    year = static_cast<int>(static_cast<int64_t>(yoe) + era * 400 + (month <= 2 ? 1 : 0));
}

unsigned weekdayFromDays(int64_t days) {
    // 1970-01-01 was a Thursday
    return static_cast<unsigned>(floorMod(days + 4, 7));
}

unsigned dayOfYear(int year, unsigned month, unsigned day) {
    unsigned ordinal = MONTH_OFFSETS[month - 1] + day;
    if (month > 2 && isLeapYear(year)) {
        ++ordinal;
    }
    return ordinal;
}

CivilDateTime toCivil(int64_t epochSeconds) {
    CivilDateTime civil;
    const int64_t days = floorDiv(epochSeconds, SECONDS_PER_DAY);
    const int64_t secondOfDay = epochSeconds - days * SECONDS_PER_DAY;
    civilFromDays(days, civil.year, civil.month, civil.day);
    civil.hour = static_cast<unsigned>(secondOfDay / SECONDS_PER_HOUR);
    civil.minute = static_cast<unsigned>((secondOfDay % SECONDS_PER_HOUR) / SECONDS_PER_MINUTE);
    civil.second = static_cast<unsigned>(secondOfDay % SECONDS_PER_MINUTE);
    civil.nanosecond = 0;
    return civil;
}

int64_t toEpochSeconds(const CivilDateTime& civil) {
    return daysFromCivil(civil.year, civil.month, civil.day) * SECONDS_PER_DAY
         + static_cast<int64_t>(civil.hour) * SECONDS_PER_HOUR
         + static_cast<int64_t>(civil.minute) * SECONDS_PER_MINUTE
         + static_cast<int64_t>(civil.second);
}

int64_t floorDiv(int64_t value, int64_t divisor) {
    int64_t q = value / divisor;
    if ((value % divisor != 0) && ((value < 0) != (divisor < 0))) {
        --q;
    }
    return q;
}

int64_t floorMod(int64_t value, int64_t divisor) {
    return value - floorDiv(value, divisor) * divisor;
}

} // namespace Calendar
} // namespace TimeUtil
