#pragma once

#include <timeutil/core/codec/date_parser.hpp>
#include <timeutil/core/time/errors.hpp>
#include <timeutil/core/time/expected.hpp>
#include <timeutil/core/time/instant.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

// Shared lexer for the RFC 3339 and free-form date parsers. Scanning is
// purely syntactic; range checks happen afterwards in validate() so a
// malformed string is always reported as MALFORMED first.

namespace TimeUtil {
namespace detail {

enum DateField : size_t {
    FIELD_YEAR = 0,
    FIELD_MONTH,
    FIELD_DAY,
    FIELD_HOUR,
    FIELD_MINUTE,
    FIELD_SECOND,
    FIELD_OFFSET,
    FIELD_COUNT
};

struct ScannedDate {
    ParsedDate date;
    // Input position of every scanned field, for diagnostics
    size_t positions[FIELD_COUNT] = {};
    int offsetHours = 0;
    int offsetMinutes = 0;
};

class TextScanner {
public:
    explicit TextScanner(std::string_view text) : text_(text) {}

    size_t position() const { return pos_; }
    bool atEnd() const { return pos_ >= text_.size(); }
    char peek() const { return atEnd() ? '\0' : text_[pos_]; }
    std::string_view text() const { return text_; }

    bool consume(char c);

    // Exactly `count` ASCII digits
    bool digits(size_t count, unsigned& value);

    // Run of ASCII digits after '.', scaled to nanoseconds. Returns the
    // number of digits consumed (0 if none).
    size_t fraction(uint32_t& nanos, size_t& digitCount);

    // MALFORMED at the current position
    ParseError unexpected(const char* expected) const;

private:
    std::string_view text_;
    size_t pos_ = 0;
};

// YYYY-MM-DD (extended) or YYYYMMDD (basic)
std::optional<ParseError> scanDatePart(TextScanner& scanner, ScannedDate& out, bool extended);

// HH:MM:SS[.f] when secondsRequired, otherwise HH:MM[:SS[.f]]
std::optional<ParseError> scanTimePart(TextScanner& scanner, ScannedDate& out, bool secondsRequired);

// Z | z | (+|-)HH:MM; lenient also accepts (+|-)HHMM and (+|-)HH
std::optional<ParseError> scanOffsetPart(TextScanner& scanner, ScannedDate& out, bool lenient);

bool isDateTimeSeparator(char c);

std::optional<ParseError> validate(const ScannedDate& scanned);

// Wall fields minus offset; OUT_OF_RANGE if outside the representable range
Expected<Instant, ParseError> toInstant(const ParsedDate& date, int32_t offsetSeconds);

Expected<ScannedDate, ParseError> scanRfc3339(std::string_view text);

} // namespace detail
} // namespace TimeUtil
