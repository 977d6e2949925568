// ============================================================================
// RFC 3339 CODEC TEST SUITE
// ============================================================================
// Tests for the strict text codec
// - Formatting: offsets, sub-second precision, range bounds
// - Parsing: accepted variants, error kinds and positions
// - Round trip through the formatter
// ============================================================================

#include <gtest/gtest.h>
#include <stdexcept>
#include <timeutil/core/codec/rfc3339.hpp>

using namespace TimeUtil;

namespace {

Instant at(int64_t seconds, int64_t nanos = 0) {
    return Instant::fromParts(seconds, nanos).value();
}

ParseError parseFailure(const char* text) {
    auto parsed = parseRfc3339(text);
    EXPECT_FALSE(parsed.has_value()) << text;
    return parsed ? ParseError() : parsed.error();
}

} // namespace

// ============================================================================
// FORMATTING TESTS
// ============================================================================

TEST(Rfc3339FormatTest, EpochAndWholeSeconds) {
    EXPECT_EQ(formatRfc3339(Instant::epoch()), "1970-01-01T00:00:00Z");
    EXPECT_EQ(formatRfc3339(at(1544129220)), "2018-12-06T20:47:00Z");
    EXPECT_EQ(formatRfc3339(at(-1)), "1969-12-31T23:59:59Z");
}

TEST(Rfc3339FormatTest, AutoPrecisionWritesNineDigitsForFractions) {
    EXPECT_EQ(formatRfc3339(at(1522584257, 50000000)), "2018-04-01T12:04:17.050000000Z");
    EXPECT_EQ(formatRfc3339(at(0, 1)), "1970-01-01T00:00:00.000000001Z");
}

TEST(Rfc3339FormatTest, FixedPrecisions) {
    Instant i = at(1522584257, 50000000);
    EXPECT_EQ(formatRfc3339(i, 0, SubsecondPrecision::MILLIS), "2018-04-01T12:04:17.050Z");
    EXPECT_EQ(formatRfc3339(i, 0, SubsecondPrecision::SECONDS), "2018-04-01T12:04:17Z");

    Instant j = at(0, 123456789);
    EXPECT_EQ(formatRfc3339(j, 0, SubsecondPrecision::MICROS), "1970-01-01T00:00:00.123456Z");
    EXPECT_EQ(formatRfc3339(at(0), 0, SubsecondPrecision::NANOS), "1970-01-01T00:00:00.000000000Z");
}

TEST(Rfc3339FormatTest, PositiveAndNegativeOffsets) {
    EXPECT_EQ(formatRfc3339(at(1544129220), 19800), "2018-12-07T02:17:00+05:30");
    EXPECT_EQ(formatRfc3339(at(1544129220), -8 * 3600), "2018-12-06T12:47:00-08:00");
    EXPECT_EQ(formatRfc3339(at(0), 23 * 3600 + 59 * 60), "1970-01-01T23:59:00+23:59");
}

TEST(Rfc3339FormatTest, OffsetTruncatesToWholeMinutes) {
    EXPECT_EQ(formatRfc3339(at(0), -3599), "1969-12-31T23:01:00-00:59");
    EXPECT_EQ(formatRfc3339(at(0), 59), "1970-01-01T00:00:00Z");
    EXPECT_EQ(formatRfc3339(at(0), -59), "1970-01-01T00:00:00Z");
}

TEST(Rfc3339FormatTest, OffsetOfADayOrMoreThrows) {
    EXPECT_THROW(formatRfc3339(at(0), 86400), std::out_of_range);
    EXPECT_THROW(formatRfc3339(at(0), -86400), std::out_of_range);
    EXPECT_NO_THROW(formatRfc3339(at(0), 86399));
}

TEST(Rfc3339FormatTest, RangeBounds) {
    EXPECT_EQ(formatRfc3339(Instant::min()), "0001-01-01T00:00:00Z");
    EXPECT_EQ(formatRfc3339(Instant::max()), "9998-12-31T23:59:59.999999999Z");
    EXPECT_EQ(formatRfc3339(Instant::max(), 23 * 3600 + 59 * 60), "9999-01-01T23:58:59.999999999+23:59");
    EXPECT_EQ(formatRfc3339(Instant::min(), -(23 * 3600 + 59 * 60)), "0000-12-31T00:01:00-23:59");
}

// ============================================================================
// PARSING TESTS
// ============================================================================

TEST(Rfc3339ParseTest, UtcWithMillis) {
    auto parsed = parseRfc3339("2018-04-01T12:00:00.000Z");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed.value(), at(1522584000));
}

TEST(Rfc3339ParseTest, NegativeOffset) {
    EXPECT_EQ(parseRfc3339("1996-12-19T16:39:57-08:00").value(), at(851042397));
    EXPECT_EQ(parseRfc3339("2019-08-01T12:00:00+05:30").value(), parseRfc3339("2019-08-01T06:30:00Z").value());
}

TEST(Rfc3339ParseTest, AcceptedVariants) {
    const Instant expected = at(1564617600);
    EXPECT_EQ(parseRfc3339("2019-08-01T00:00:00Z").value(), expected);
    EXPECT_EQ(parseRfc3339("2019-08-01t00:00:00z").value(), expected);
    EXPECT_EQ(parseRfc3339("2019-08-01 00:00:00Z").value(), expected);
    EXPECT_EQ(parseRfc3339("2019-08-01T00:00:00+00:00").value(), expected);
    EXPECT_EQ(parseRfc3339("2019-08-01T00:00:00-00:00").value(), expected);
}

TEST(Rfc3339ParseTest, FractionScaling) {
    EXPECT_EQ(parseRfc3339("1970-01-01T00:00:00.1Z").value(), at(0, 100000000));
    EXPECT_EQ(parseRfc3339("1970-01-01T00:00:00.000000001Z").value(), at(0, 1));
    EXPECT_EQ(parseRfc3339("1970-01-01T00:00:00.123456789Z").value(), at(0, 123456789));
    EXPECT_EQ(parseRfc3339("1969-12-31T23:59:59.5Z").value(), at(-1, 500000000));
}

TEST(Rfc3339ParseTest, RangeBounds) {
    EXPECT_EQ(parseRfc3339("0001-01-01T00:00:00Z").value(), Instant::min());
    EXPECT_EQ(parseRfc3339("9998-12-31T23:59:59.999999999Z").value(), Instant::max());
    EXPECT_EQ(parseRfc3339("9999-01-01T23:58:59.999999999+23:59").value(), Instant::max());
}

// ============================================================================
// PARSE ERROR TESTS
// ============================================================================

TEST(Rfc3339ParseErrorTest, EmptyInput) {
    ParseError e = parseFailure("");
    EXPECT_EQ(e.kind, ParseErrorKind::MALFORMED);
    EXPECT_EQ(e.position, 0u);
}

TEST(Rfc3339ParseErrorTest, NonDateText) {
    ParseError e = parseFailure("not-a-date");
    EXPECT_EQ(e.kind, ParseErrorKind::MALFORMED);
    EXPECT_EQ(e.position, 0u);
}

TEST(Rfc3339ParseErrorTest, MissingOffset) {
    ParseError e = parseFailure("2019-08-01T12:00:00");
    EXPECT_EQ(e.kind, ParseErrorKind::MALFORMED);
    EXPECT_EQ(e.position, 19u);
}

TEST(Rfc3339ParseErrorTest, SecondsAreRequired) {
    ParseError e = parseFailure("2019-08-01T12:00Z");
    EXPECT_EQ(e.kind, ParseErrorKind::MALFORMED);
    EXPECT_EQ(e.position, 16u);
    EXPECT_EQ(e.field, "Z");
}

TEST(Rfc3339ParseErrorTest, OffsetNeedsColon) {
    ParseError e = parseFailure("2019-08-01T12:00:00+0100");
    EXPECT_EQ(e.kind, ParseErrorKind::MALFORMED);
    EXPECT_EQ(e.position, 22u);
}

TEST(Rfc3339ParseErrorTest, EmptyAndOverlongFractions) {
    ParseError empty = parseFailure("2019-08-01T12:00:00.Z");
    EXPECT_EQ(empty.kind, ParseErrorKind::MALFORMED);
    EXPECT_EQ(empty.position, 20u);

    ParseError tooLong = parseFailure("2019-08-01T12:00:00.1234567891Z");
    EXPECT_EQ(tooLong.kind, ParseErrorKind::MALFORMED);
    EXPECT_EQ(tooLong.position, 29u);
}

TEST(Rfc3339ParseErrorTest, BadSeparatorAndTrailingText) {
    EXPECT_EQ(parseFailure("2019-08-01X12:00:00Z").position, 10u);
    ParseError trailing = parseFailure("2019-08-01T12:00:00Z ");
    EXPECT_EQ(trailing.kind, ParseErrorKind::MALFORMED);
    EXPECT_EQ(trailing.position, 20u);
    EXPECT_EQ(parseFailure("19-08-01T12:00:00Z").kind, ParseErrorKind::MALFORMED);
}

TEST(Rfc3339ParseErrorTest, FieldOutOfRange) {
    ParseError month = parseFailure("2019-13-01T00:00:00Z");
    EXPECT_EQ(month.kind, ParseErrorKind::OUT_OF_RANGE);
    EXPECT_EQ(month.field, "month");
    EXPECT_EQ(month.position, 5u);
    EXPECT_EQ(parseFailure("2021-13-01T00:00:00Z").kind, ParseErrorKind::OUT_OF_RANGE);

    ParseError day = parseFailure("2019-02-29T00:00:00Z");
    EXPECT_EQ(day.kind, ParseErrorKind::OUT_OF_RANGE);
    EXPECT_EQ(day.field, "day");
    EXPECT_EQ(day.position, 8u);

    EXPECT_EQ(parseFailure("2019-08-01T24:00:00Z").field, "hour");
    EXPECT_EQ(parseFailure("2019-08-01T12:60:00Z").field, "minute");
    EXPECT_EQ(parseFailure("2019-08-01T12:00:00+24:00").field, "offset");
    EXPECT_EQ(parseFailure("2019-08-01T12:00:00+05:60").field, "offset");
    EXPECT_TRUE(parseRfc3339("2019-08-01T12:00:00+23:59").has_value());
}

TEST(Rfc3339ParseErrorTest, LeapSecondRejected) {
    ParseError e = parseFailure("1990-12-31T23:59:60Z");
    EXPECT_EQ(e.kind, ParseErrorKind::OUT_OF_RANGE);
    EXPECT_EQ(e.field, "second");
    EXPECT_EQ(e.position, 17u);
}

TEST(Rfc3339ParseErrorTest, InstantOutsideRange) {
    EXPECT_EQ(parseFailure("0000-12-31T23:59:59Z").field, "instant");
    EXPECT_EQ(parseFailure("9999-01-01T00:00:00Z").field, "instant");
    EXPECT_EQ(parseFailure("0001-01-01T00:00:00+00:01").kind, ParseErrorKind::OUT_OF_RANGE);
}

TEST(Rfc3339ParseErrorTest, MessageNamesKindAndPosition) {
    ParseError e = parseFailure("2019-02-29T00:00:00Z");
    EXPECT_NE(e.message().find("OUT_OF_RANGE"), std::string::npos);
    EXPECT_NE(e.message().find("position 8"), std::string::npos);
}

// ============================================================================
// ROUND TRIP TESTS
// ============================================================================

TEST(Rfc3339RoundTripTest, FormatThenParseIsIdentity) {
    const Instant samples[] = {
        Instant::min(), at(-1, 999999999), Instant::epoch(), at(1522584257, 50000000),
        at(951782400, 1), Instant::max()
    };
    const int32_t offsets[] = {0, 19800, -8 * 3600, 23 * 3600 + 59 * 60, -(23 * 3600 + 59 * 60), 60};
    for (const Instant& i : samples) {
        for (int32_t offset : offsets) {
            const std::string text = formatRfc3339(i, offset);
            auto parsed = parseRfc3339(text);
            ASSERT_TRUE(parsed.has_value()) << text;
            EXPECT_EQ(parsed.value(), i) << text;
        }
    }
}
