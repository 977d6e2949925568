#include <timeutil/core/codec/date_parser.hpp>
#include <timeutil/core/codec/rfc3339.hpp>
#include <timeutil/core/zone/zoned_projection.hpp>
#include "text_scanner.hpp"
#include <spdlog/spdlog.h>
#include <string>

namespace TimeUtil {

namespace {

bool allDigits(std::string_view text) {
    for (char c : text) {
        if (c < '0' || c > '9') return false;
    }
    return true;
}

// YYYY-MM-DD[(T|t| )HH:MM[:SS[.f]][offset]]
Expected<detail::ScannedDate, ParseError> scanExtended(std::string_view text, bool timeRequired) {
    detail::TextScanner scanner(text);
    detail::ScannedDate scanned;

    if (auto err = detail::scanDatePart(scanner, scanned, true)) return *err;

    if (scanner.atEnd()) {
        if (timeRequired) return scanner.unexpected("time of day");
    } else {
        if (!detail::isDateTimeSeparator(scanner.peek())) {
            return scanner.unexpected("'T' or ' ' separator");
        }
        if (!scanner.consume(scanner.peek())) return scanner.unexpected("separator");
        if (auto err = detail::scanTimePart(scanner, scanned, false)) return *err;
        if (!scanner.atEnd()) {
            if (auto err = detail::scanOffsetPart(scanner, scanned, true)) return *err;
        }
        if (!scanner.atEnd()) return scanner.unexpected("end of input");
    }

    if (auto err = detail::validate(scanned)) return *err;
    return scanned;
}

Expected<detail::ScannedDate, ParseError> scanBasicDate(std::string_view text) {
    detail::TextScanner scanner(text);
    detail::ScannedDate scanned;

    if (auto err = detail::scanDatePart(scanner, scanned, false)) return *err;
    if (!scanner.atEnd()) return scanner.unexpected("end of input");

    if (auto err = detail::validate(scanned)) return *err;
    return scanned;
}

Expected<detail::ScannedDate, ParseError> scanExtendedDateOnly(std::string_view text) {
    detail::TextScanner scanner(text);
    detail::ScannedDate scanned;

    if (auto err = detail::scanDatePart(scanner, scanned, true)) return *err;
    if (!scanner.atEnd()) return scanner.unexpected("end of input");

    if (auto err = detail::validate(scanned)) return *err;
    return scanned;
}

Expected<detail::ScannedDate, ParseError> scanByFormat(std::string_view text, DateFormat format) {
    switch (format) {
        case DateFormat::RFC3339:      return detail::scanRfc3339(text);
        case DateFormat::DATE:         return scanExtendedDateOnly(text);
        case DateFormat::COMPACT_DATE: return scanBasicDate(text);
        case DateFormat::DATE_TIME:    return scanExtended(text, true);
        case DateFormat::AUTO:
        default:
            if (text.size() == 8 && allDigits(text)) {
                return scanBasicDate(text);
            }
            return scanExtended(text, false);
    }
}

ParseError fromZoneError(const ZoneError& error) {
    if (error.kind == ZoneErrorKind::OUT_OF_RANGE) {
        return ParseError::outOfRange(0, "instant", error.message());
    }
    return ParseError::ambiguousOffset(error.message());
}

} // anonymous namespace

const char* toString(DateFormat format) {
    switch (format) {
        case DateFormat::AUTO:         return "AUTO";
        case DateFormat::RFC3339:      return "RFC3339";
        case DateFormat::DATE:         return "DATE";
        case DateFormat::COMPACT_DATE: return "COMPACT_DATE";
        case DateFormat::DATE_TIME:    return "DATE_TIME";
        default:                       return "UNKNOWN";
    }
}

const char* toString(MissingOffset policy) {
    switch (policy) {
        case MissingOffset::ASSUME_UTC:   return "utc";
        case MissingOffset::ASSUME_FIXED: return "fixed";
        case MissingOffset::ASSUME_ZONE:  return "zone";
        case MissingOffset::REJECT:       return "reject";
        default:                          return "unknown";
    }
}

CivilDateTime ParsedDate::civil() const {
    CivilDateTime c;
    c.year = year;
    c.month = month;
    c.day = day;
    c.hour = hour;
    c.minute = minute;
    c.second = second;
    c.nanosecond = nanosecond;
    return c;
}

Expected<ParsedDate, ParseError> scanDate(std::string_view text, DateFormat format) {
    auto scanned = scanByFormat(text, format);
    if (!scanned) {
        return scanned.error();
    }
    return scanned.value().date;
}

Expected<Instant, ParseError> parseDate(std::string_view text, const DateParseOptions& options, DateFormat format) {
    auto scanned = scanDate(text, format);
    if (!scanned) {
        spdlog::debug("[DateParser] '{}' rejected as {}: {}", text, toString(format), scanned.error().message());
        return scanned.error();
    }
    const ParsedDate& date = scanned.value();

    if (date.offsetSeconds) {
        return detail::toInstant(date, *date.offsetSeconds);
    }

    switch (options.missingOffset) {
        case MissingOffset::ASSUME_UTC:
            return detail::toInstant(date, 0);

        case MissingOffset::ASSUME_FIXED:
            if (options.fixedOffsetSeconds > MAX_OFFSET_SECONDS || options.fixedOffsetSeconds < -MAX_OFFSET_SECONDS) {
                return ParseError::outOfRange(0, "offset", "configured fixed offset exceeds 23:59");
            }
            return detail::toInstant(date, options.fixedOffsetSeconds);

        case MissingOffset::ASSUME_ZONE: {
            const ZoneDatabase& db = options.zoneDatabase ? *options.zoneDatabase : defaultZoneDatabase();
            auto instant = localToInstant(date.civil(), TimeZoneRef(options.zone), db);
            if (!instant) {
                return fromZoneError(instant.error());
            }
            return instant.value();
        }

        case MissingOffset::REJECT:
        default:
            return ParseError::ambiguousOffset("'" + std::string(text) + "' has no UTC offset and none may be assumed");
    }
}

} // namespace TimeUtil
