#pragma once

#include <timeutil/core/time/calendar.hpp>
#include <timeutil/core/time/errors.hpp>
#include <timeutil/core/time/expected.hpp>
#include <timeutil/core/time/instant.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace TimeUtil {

class ZoneDatabase;

/**
 * Shapes understood by parseDate():
 *
 *   RFC3339       strict RFC 3339 date-time (see rfc3339.hpp)
 *   DATE          YYYY-MM-DD
 *   COMPACT_DATE  YYYYMMDD
 *   DATE_TIME     YYYY-MM-DD(T|t| )HH:MM[:SS[.1*9DIGIT]][offset]
 *                 offset = Z | z | (+|-)HH:MM | (+|-)HHMM | (+|-)HH
 *   AUTO          any of the above, picked by shape
 */
enum class DateFormat : uint8_t {
    AUTO = 0,
    RFC3339 = 1,
    DATE = 2,
    COMPACT_DATE = 3,
    DATE_TIME = 4
};

/**
 * What to do when the input carries no UTC offset.
 */
enum class MissingOffset : uint8_t {
    ASSUME_UTC = 0,     // read the wall time as UTC
    ASSUME_FIXED = 1,   // read it with DateParseOptions::fixedOffsetSeconds
    ASSUME_ZONE = 2,    // resolve it in DateParseOptions::zone
    REJECT = 3          // fail with AMBIGUOUS_OFFSET
};

const char* toString(DateFormat format);
const char* toString(MissingOffset policy);

/**
 * @struct ParsedDate
 * @brief Fields recognised in a date string before defaults are applied.
 *
 * A missing time reads as midnight, missing seconds and fraction as zero.
 */
struct ParsedDate {
    int year = 0;
    unsigned month = 1;
    unsigned day = 1;

    bool hasTime = false;
    bool hasSeconds = false;
    unsigned hour = 0;
    unsigned minute = 0;
    unsigned second = 0;
    uint32_t nanosecond = 0;

    std::optional<int32_t> offsetSeconds;

    CivilDateTime civil() const;
};

struct DateParseOptions {
    MissingOffset missingOffset = MissingOffset::ASSUME_UTC;
    int32_t fixedOffsetSeconds = 0;
    std::string zone;
    // nullptr selects the process-wide system database
    const ZoneDatabase* zoneDatabase = nullptr;
};

/**
 * @brief Recognise and validate the calendar fields of a date string.
 * @return MALFORMED when the shape is not recognised (or does not match
 *         a non-AUTO hint), OUT_OF_RANGE for invalid calendar values
 */
Expected<ParsedDate, ParseError> scanDate(std::string_view text, DateFormat format = DateFormat::AUTO);

/**
 * @brief Parse a date / date-time string into an Instant, filling missing
 * fields with the defaults above and resolving a missing offset through
 * options.missingOffset.
 */
Expected<Instant, ParseError> parseDate(std::string_view text,
                                        const DateParseOptions& options = DateParseOptions(),
                                        DateFormat format = DateFormat::AUTO);

} // namespace TimeUtil
