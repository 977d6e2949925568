// ============================================================================
// INSTANT / DURATION TEST SUITE
// ============================================================================
// Tests for the timestamp value types
// - Construction and normalization of the nanosecond field
// - Representable range (years 0001..9998)
// - Checked arithmetic: add, subtract, difference
// - Calendar helpers and clock sources
// ============================================================================

#include <gtest/gtest.h>
#include <chrono>
#include <limits>
#include <timeutil/core/time/calendar.hpp>
#include <timeutil/core/time/clock.hpp>
#include <timeutil/core/time/instant.hpp>

using namespace TimeUtil;

namespace {

Instant at(int64_t seconds, int64_t nanos = 0) {
    return Instant::fromParts(seconds, nanos).value();
}

Duration span(int64_t seconds, int64_t nanos = 0) {
    return Duration::fromParts(seconds, nanos).value();
}

} // namespace

// ============================================================================
// CONSTRUCTION TESTS
// ============================================================================

TEST(InstantTest, DefaultIsEpoch) {
    Instant i;
    EXPECT_EQ(i.seconds(), 0);
    EXPECT_EQ(i.nanos(), 0u);
    EXPECT_EQ(i, Instant::epoch());
}

TEST(InstantTest, FromPartsCarriesNanosIntoSeconds) {
    Instant i = at(1, 1500000000);
    EXPECT_EQ(i.seconds(), 2);
    EXPECT_EQ(i.nanos(), 500000000u);
}

TEST(InstantTest, NegativeNanosBorrowFromSeconds) {
    Instant i = at(0, -1);
    EXPECT_EQ(i.seconds(), -1);
    EXPECT_EQ(i.nanos(), 999999999u);
}

TEST(InstantTest, FromUnixMillisFloorsTowardNegativeInfinity) {
    Instant i = Instant::fromUnixMillis(-1).value();
    EXPECT_EQ(i.seconds(), -1);
    EXPECT_EQ(i.nanos(), 999000000u);
    EXPECT_EQ(i.unixMillis(), -1);

    Instant j = Instant::fromUnixMillis(1517461200000LL).value();
    EXPECT_EQ(j.seconds(), 1517461200);
    EXPECT_EQ(j.nanos(), 0u);
}

TEST(InstantTest, FromUnixNanos) {
    Instant i = Instant::fromUnixNanos(-1500000000LL).value();
    EXPECT_EQ(i.seconds(), -2);
    EXPECT_EQ(i.nanos(), 500000000u);
}

TEST(InstantTest, FromSystemTime) {
    auto tp = std::chrono::system_clock::time_point(std::chrono::seconds(1522584000));
    Instant i = Instant::fromSystemTime(tp).value();
    EXPECT_EQ(i.seconds(), 1522584000);
    EXPECT_EQ(i.nanos(), 0u);
}

// ============================================================================
// RANGE TESTS
// ============================================================================

TEST(InstantTest, RangeBoundsAreRepresentable) {
    EXPECT_TRUE(Instant::fromUnixSeconds(Instant::MIN_SECONDS).has_value());
    EXPECT_TRUE(Instant::fromParts(Instant::MAX_SECONDS, 999999999).has_value());
    EXPECT_EQ(Instant::min(), at(Instant::MIN_SECONDS));
    EXPECT_EQ(Instant::max(), at(Instant::MAX_SECONDS, 999999999));
}

TEST(InstantTest, OutsideRangeIsRejected) {
    auto below = Instant::fromUnixSeconds(Instant::MIN_SECONDS - 1);
    ASSERT_FALSE(below.has_value());
    EXPECT_EQ(below.error().kind, ArithmeticErrorKind::OUT_OF_RANGE);

    EXPECT_FALSE(Instant::fromParts(Instant::MAX_SECONDS, 1000000000).has_value());
    EXPECT_FALSE(Instant::fromParts(std::numeric_limits<int64_t>::max(), 1000000000).has_value());
}

TEST(InstantTest, OrderingFollowsSecondsThenNanos) {
    EXPECT_LT(at(-1, 999999999), at(0));
    EXPECT_LT(at(5, 1), at(5, 2));
    EXPECT_GT(at(6), at(5, 999999999));
    EXPECT_LE(at(7), at(7));
    EXPECT_NE(at(7), at(7, 1));
}

// ============================================================================
// ARITHMETIC TESTS
// ============================================================================

TEST(InstantArithmeticTest, AddCarriesNanos) {
    auto r = add(at(10, 700000000), span(1, 500000000));
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r.value(), at(12, 200000000));
}

TEST(InstantArithmeticTest, AddNegativeDuration) {
    auto r = add(at(10, 100000000), Duration::fromMillis(-1500));
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r.value(), at(8, 600000000));
}

TEST(InstantArithmeticTest, SubtractIsAddOfNegation) {
    Instant base = at(1522584000, 250000000);
    Duration d = span(86400, 999999999);
    EXPECT_EQ(subtract(base, d).value(), add(base, d.negated().value()).value());
}

TEST(InstantArithmeticTest, OverflowPastMaxFails) {
    auto r = add(Instant::max(), Duration::fromNanos(1));
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind, ArithmeticErrorKind::OUT_OF_RANGE);
}

TEST(InstantArithmeticTest, UnderflowPastMinFails) {
    EXPECT_FALSE(subtract(Instant::min(), Duration::fromNanos(1)).has_value());
}

TEST(InstantArithmeticTest, HugeDurationsFailWithoutWrapping) {
    EXPECT_FALSE(add(Instant::epoch(), Duration::fromSeconds(std::numeric_limits<int64_t>::max())).has_value());
    EXPECT_FALSE(add(Instant::epoch(), Duration::fromSeconds(std::numeric_limits<int64_t>::min())).has_value());
    EXPECT_FALSE(subtract(Instant::epoch(), Duration::fromSeconds(std::numeric_limits<int64_t>::min())).has_value());

    auto r = subtract(Instant::epoch(), Duration::fromParts(std::numeric_limits<int64_t>::max(), 1).value());
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind, ArithmeticErrorKind::OUT_OF_RANGE);
    EXPECT_FALSE(subtract(Instant::epoch(), Duration::fromParts(std::numeric_limits<int64_t>::min(), 1).value()).has_value());
}

TEST(InstantArithmeticTest, DifferenceBorrowsNanos) {
    Duration d = difference(at(1, 200000000), at(2, 500000000));
    EXPECT_EQ(d.seconds(), -2);
    EXPECT_EQ(d.nanos(), 700000000u);
    EXPECT_TRUE(d.isNegative());
    EXPECT_EQ(d, span(-1, -300000000));
}

TEST(InstantArithmeticTest, AddDifferenceRestoresInstant) {
    const Instant samples[] = {
        Instant::min(), at(-1, 999999999), Instant::epoch(), at(1522584000, 50000000), Instant::max()
    };
    for (const Instant& a : samples) {
        for (const Instant& b : samples) {
            auto restored = add(b, difference(a, b));
            ASSERT_TRUE(restored.has_value());
            EXPECT_EQ(restored.value(), a);
        }
    }
}

TEST(InstantArithmeticTest, DifferenceIsAntisymmetric) {
    Instant a = at(1522584257, 50000000);
    Instant b = at(-86400, 999999999);
    EXPECT_EQ(difference(a, b), difference(b, a).negated().value());
    EXPECT_TRUE(difference(a, a).isZero());
}

TEST(InstantArithmeticTest, SubtractUndoesAdd) {
    Instant i = at(1544129220, 123456789);
    const Duration durations[] = {span(0, 1), span(-1, 999999999), Duration::fromDays(-400), span(31536000, 987654321)};
    for (const Duration& d : durations) {
        auto moved = add(i, d);
        ASSERT_TRUE(moved.has_value());
        EXPECT_EQ(subtract(moved.value(), d).value(), i);
    }
}

TEST(InstantArithmeticTest, DifferenceAcrossWholeRange) {
    Duration d = difference(Instant::max(), Instant::min());
    EXPECT_EQ(d.seconds(), Instant::MAX_SECONDS - Instant::MIN_SECONDS);
    EXPECT_EQ(d.nanos(), 999999999u);
}

// ============================================================================
// DURATION TESTS
// ============================================================================

TEST(DurationTest, FactoriesNormalize) {
    EXPECT_EQ(Duration::fromMillis(-1500), span(-2, 500000000));
    EXPECT_EQ(Duration::fromMicros(2500001), span(2, 500001000));
    EXPECT_EQ(Duration::fromMinutes(-2), span(-120));
    EXPECT_EQ(Duration::fromHours(5), span(18000));
    EXPECT_EQ(Duration::fromDays(1), span(86400));
    EXPECT_TRUE(Duration().isZero());
}

TEST(DurationTest, TotalMillisFloors) {
    EXPECT_EQ(Duration::fromMillis(-1500).totalMillis(), -1500);
    EXPECT_EQ(Duration::fromNanos(-1).totalMillis(), -1);
    EXPECT_EQ(Duration::fromSeconds(std::numeric_limits<int64_t>::max()).totalMillis(),
              std::numeric_limits<int64_t>::max());
}

TEST(DurationTest, Negation) {
    EXPECT_EQ(span(1, 300000000).negated().value(), span(-2, 700000000));
    EXPECT_EQ(span(-2, 700000000).negated().value(), span(1, 300000000));
    EXPECT_EQ(Duration().negated().value(), Duration());
    EXPECT_FALSE(Duration::fromSeconds(std::numeric_limits<int64_t>::min()).negated().has_value());

    // Extremes with a fraction stay representable
    const int64_t maxSeconds = std::numeric_limits<int64_t>::max();
    const int64_t minSeconds = std::numeric_limits<int64_t>::min();
    EXPECT_EQ(span(maxSeconds, 1).negated().value(), span(minSeconds, 999999999));
    EXPECT_EQ(span(minSeconds, 1).negated().value(), span(maxSeconds, 999999999));
}

TEST(DurationTest, FromPartsOverflow) {
    auto r = Duration::fromParts(std::numeric_limits<int64_t>::max(), 1000000000);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind, ArithmeticErrorKind::OUT_OF_RANGE);
}

// ============================================================================
// CALENDAR TESTS
// ============================================================================

TEST(CalendarTest, LeapYears) {
    EXPECT_TRUE(Calendar::isLeapYear(2000));
    EXPECT_TRUE(Calendar::isLeapYear(2020));
    EXPECT_FALSE(Calendar::isLeapYear(1900));
    EXPECT_FALSE(Calendar::isLeapYear(2019));
    EXPECT_EQ(Calendar::daysInMonth(2020, 2), 29u);
    EXPECT_EQ(Calendar::daysInMonth(2019, 2), 28u);
    EXPECT_EQ(Calendar::daysInMonth(2019, 4), 30u);
}

TEST(CalendarTest, CivilDayConversions) {
    EXPECT_EQ(Calendar::daysFromCivil(1970, 1, 1), 0);
    EXPECT_EQ(Calendar::daysFromCivil(2000, 3, 1), 11017);

    int year = 0;
    unsigned month = 0;
    unsigned day = 0;
    Calendar::civilFromDays(-1, year, month, day);
    EXPECT_EQ(year, 1969);
    EXPECT_EQ(month, 12u);
    EXPECT_EQ(day, 31u);
}

TEST(CalendarTest, WeekdayAndDayOfYear) {
    EXPECT_EQ(Calendar::weekdayFromDays(0), 4u);        // Thursday
    EXPECT_EQ(Calendar::weekdayFromDays(10957), 6u);    // 2000-01-01, Saturday
    EXPECT_EQ(Calendar::weekdayFromDays(-1), 3u);
    EXPECT_EQ(Calendar::dayOfYear(2020, 12, 31), 366u);
    EXPECT_EQ(Calendar::dayOfYear(2019, 3, 1), 60u);
}

TEST(CalendarTest, ToCivil) {
    CivilDateTime c = Calendar::toCivil(1544129220);
    EXPECT_EQ(c.year, 2018);
    EXPECT_EQ(c.month, 12u);
    EXPECT_EQ(c.day, 6u);
    EXPECT_EQ(c.hour, 20u);
    EXPECT_EQ(c.minute, 47u);
    EXPECT_EQ(c.second, 0u);

    CivilDateTime before = Calendar::toCivil(-1);
    EXPECT_EQ(before.year, 1969);
    EXPECT_EQ(before.hour, 23u);
    EXPECT_EQ(before.second, 59u);

    EXPECT_EQ(Calendar::toEpochSeconds(Calendar::toCivil(Instant::MIN_SECONDS)), Instant::MIN_SECONDS);
    EXPECT_EQ(Calendar::toEpochSeconds(Calendar::toCivil(Instant::MAX_SECONDS)), Instant::MAX_SECONDS);
}

// ============================================================================
// CLOCK TESTS
// ============================================================================

TEST(ClockTest, FixedClockIsDeterministic) {
    FixedClock clock(ClockReading{1522584000, 5});
    EXPECT_EQ(Instant::now(clock).value(), at(1522584000, 5));
    EXPECT_EQ(Instant::now(clock).value(), Instant::now(clock).value());
}

TEST(ClockTest, ReadingIsNormalized) {
    FixedClock clock(ClockReading{10, -1});
    EXPECT_EQ(Instant::now(clock).value(), at(9, 999999999));
}

TEST(ClockTest, ReadingOutOfRangeFails) {
    FixedClock clock(ClockReading{Instant::MAX_SECONDS + 1, 0});
    EXPECT_FALSE(Instant::now(clock).has_value());
}

TEST(ClockTest, SystemClockIsInRange) {
    auto now = Instant::now(SystemClock::instance());
    ASSERT_TRUE(now.has_value());
    EXPECT_GT(now.value(), at(1577836800));    // after 2020-01-01
    EXPECT_LT(now.value().nanos(), 1000000000u);
}
