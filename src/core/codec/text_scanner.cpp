#include "text_scanner.hpp"
#include <timeutil/core/time/calendar.hpp>
#include <string>

namespace TimeUtil {
namespace detail {

namespace {

inline bool isDigit(char c) {
    return c >= '0' && c <= '9';
}

constexpr uint32_t POW10[10] = {
    1u, 10u, 100u, 1000u, 10000u, 100000u, 1000000u, 10000000u, 100000000u, 1000000000u
};

constexpr size_t MAX_FRACTION_DIGITS = 9;

} // anonymous namespace

bool TextScanner::consume(char c) {
    if (atEnd() || text_[pos_] != c) return false;
    ++pos_;
    return true;
}

bool TextScanner::digits(size_t count, unsigned& value) {
    if (text_.size() - pos_ < count) return false;
    unsigned v = 0;
    for (size_t i = 0; i < count; ++i) {
        char c = text_[pos_ + i];
        if (!isDigit(c)) return false;
        v = v * 10 + static_cast<unsigned>(c - '0');
    }
    pos_ += count;
    value = v;
    return true;
}

size_t TextScanner::fraction(uint32_t& nanos, size_t& digitCount) {
    uint32_t value = 0;
    size_t count = 0;
    while (!atEnd() && isDigit(text_[pos_])) {
        if (count < MAX_FRACTION_DIGITS) {
            value = value * 10 + static_cast<uint32_t>(text_[pos_] - '0');
        }
        ++count;
        ++pos_;
    }
    digitCount = count;
    nanos = count <= MAX_FRACTION_DIGITS ? value * POW10[MAX_FRACTION_DIGITS - count] : value;
    return count;
}

ParseError TextScanner::unexpected(const char* expected) const {
    std::string found = atEnd() ? std::string() : std::string(1, text_[pos_]);
    return ParseError::malformed(pos_, std::move(found), std::string("expected ") + expected);
}

bool isDateTimeSeparator(char c) {
    return c == 'T' || c == 't' || c == ' ';
}

std::optional<ParseError> scanDatePart(TextScanner& scanner, ScannedDate& out, bool extended) {
    unsigned year = 0;
    unsigned month = 0;
    unsigned day = 0;

    out.positions[FIELD_YEAR] = scanner.position();
    if (!scanner.digits(4, year)) return scanner.unexpected("4-digit year");
    if (extended && !scanner.consume('-')) return scanner.unexpected("'-'");

    out.positions[FIELD_MONTH] = scanner.position();
    if (!scanner.digits(2, month)) return scanner.unexpected("2-digit month");
    if (extended && !scanner.consume('-')) return scanner.unexpected("'-'");

    out.positions[FIELD_DAY] = scanner.position();
    if (!scanner.digits(2, day)) return scanner.unexpected("2-digit day");

    out.date.year = static_cast<int>(year);
    out.date.month = month;
    out.date.day = day;
    return std::nullopt;
}

std::optional<ParseError> scanTimePart(TextScanner& scanner, ScannedDate& out, bool secondsRequired) {
    out.positions[FIELD_HOUR] = scanner.position();
    if (!scanner.digits(2, out.date.hour)) return scanner.unexpected("2-digit hour");
    if (!scanner.consume(':')) return scanner.unexpected("':'");

    out.positions[FIELD_MINUTE] = scanner.position();
    if (!scanner.digits(2, out.date.minute)) return scanner.unexpected("2-digit minute");
    out.date.hasTime = true;

    if (!scanner.consume(':')) {
        if (secondsRequired) return scanner.unexpected("':'");
        return std::nullopt;
    }

    out.positions[FIELD_SECOND] = scanner.position();
    if (!scanner.digits(2, out.date.second)) return scanner.unexpected("2-digit second");
    out.date.hasSeconds = true;

    if (scanner.consume('.')) {
        size_t digitCount = 0;
        if (scanner.fraction(out.date.nanosecond, digitCount) == 0) {
            return scanner.unexpected("fraction digit");
        }
        if (digitCount > MAX_FRACTION_DIGITS) {
            size_t tenth = scanner.position() - digitCount + MAX_FRACTION_DIGITS;
            return ParseError::malformed(tenth, std::string(1, scanner.text()[tenth]),
                                         "at most 9 fraction digits");
        }
    }
    return std::nullopt;
}

std::optional<ParseError> scanOffsetPart(TextScanner& scanner, ScannedDate& out, bool lenient) {
    out.positions[FIELD_OFFSET] = scanner.position();

    if (scanner.consume('Z') || scanner.consume('z')) {
        out.offsetHours = 0;
        out.offsetMinutes = 0;
        out.date.offsetSeconds = 0;
        return std::nullopt;
    }

    int sign = 0;
    if (scanner.consume('+')) {
        sign = 1;
    } else if (scanner.consume('-')) {
        sign = -1;
    } else {
        return scanner.unexpected("'Z' or numeric offset");
    }

    unsigned hours = 0;
    unsigned minutes = 0;
    if (!scanner.digits(2, hours)) return scanner.unexpected("2-digit offset hour");

    if (scanner.consume(':')) {
        if (!scanner.digits(2, minutes)) return scanner.unexpected("2-digit offset minute");
    } else if (!lenient) {
        return scanner.unexpected("':'");
    } else if (!scanner.atEnd()) {
        if (!scanner.digits(2, minutes)) return scanner.unexpected("2-digit offset minute");
    }

    out.offsetHours = static_cast<int>(hours);
    out.offsetMinutes = static_cast<int>(minutes);
    out.date.offsetSeconds = sign * static_cast<int32_t>(hours * 3600 + minutes * 60);
    return std::nullopt;
}

std::optional<ParseError> validate(const ScannedDate& scanned) {
    const ParsedDate& d = scanned.date;

    if (d.month < 1 || d.month > 12) {
        return ParseError::outOfRange(scanned.positions[FIELD_MONTH], "month",
                                      "month " + std::to_string(d.month) + " not in 1..12");
    }
    unsigned maxDay = Calendar::daysInMonth(d.year, d.month);
    if (d.day < 1 || d.day > maxDay) {
        return ParseError::outOfRange(scanned.positions[FIELD_DAY], "day",
                                      "day " + std::to_string(d.day) + " not in 1.." + std::to_string(maxDay));
    }
    if (d.hasTime) {
        if (d.hour > 23) {
            return ParseError::outOfRange(scanned.positions[FIELD_HOUR], "hour",
                                          "hour " + std::to_string(d.hour) + " not in 0..23");
        }
        if (d.minute > 59) {
            return ParseError::outOfRange(scanned.positions[FIELD_MINUTE], "minute",
                                          "minute " + std::to_string(d.minute) + " not in 0..59");
        }
        if (d.second > 59) {
            return ParseError::outOfRange(scanned.positions[FIELD_SECOND], "second",
                                          d.second == 60 ? "leap seconds are not representable"
                                                         : "second " + std::to_string(d.second) + " not in 0..59");
        }
    }
    if (d.offsetSeconds) {
        if (scanned.offsetHours > 23 || scanned.offsetMinutes > 59) {
            return ParseError::outOfRange(scanned.positions[FIELD_OFFSET], "offset",
                                          "offset must be within 23:59");
        }
    }
    return std::nullopt;
}

Expected<Instant, ParseError> toInstant(const ParsedDate& date, int32_t offsetSeconds) {
    int64_t local = Calendar::toEpochSeconds(date.civil());
    auto instant = Instant::fromParts(local - offsetSeconds, date.nanosecond);
    if (!instant) {
        return ParseError::outOfRange(0, "instant", instant.error().detail);
    }
    return instant.value();
}

Expected<ScannedDate, ParseError> scanRfc3339(std::string_view text) {
    TextScanner scanner(text);
    ScannedDate scanned;

    if (auto err = scanDatePart(scanner, scanned, true)) return *err;
    if (!scanner.consume('T') && !scanner.consume('t') && !scanner.consume(' ')) {
        return scanner.unexpected("'T' or ' ' separator");
    }
    if (auto err = scanTimePart(scanner, scanned, true)) return *err;
    if (auto err = scanOffsetPart(scanner, scanned, false)) return *err;
    if (!scanner.atEnd()) return scanner.unexpected("end of input");

    if (auto err = validate(scanned)) return *err;
    return scanned;
}

} // namespace detail
} // namespace TimeUtil
