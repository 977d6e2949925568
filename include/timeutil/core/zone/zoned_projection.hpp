#pragma once

#include <timeutil/core/codec/rfc3339.hpp>
#include <timeutil/core/time/calendar.hpp>
#include <timeutil/core/time/errors.hpp>
#include <timeutil/core/time/expected.hpp>
#include <timeutil/core/time/instant.hpp>
#include <timeutil/core/zone/zone_database.hpp>
#include <cstdint>
#include <string>
#include <utility>

namespace TimeUtil {

/**
 * @struct TimeZoneRef
 * @brief Zone identifier: an IANA name ("Europe/Berlin") or a fixed offset
 * ("UTC", "Z", "+05:30", "UTC-08:00"). Resolved on every use, never cached.
 */
struct TimeZoneRef {
    std::string name;

    TimeZoneRef(std::string zone) : name(std::move(zone)) {}
    TimeZoneRef(const char* zone) : name(zone) {}

    static TimeZoneRef utc() { return TimeZoneRef("UTC"); }
};

/**
 * @struct ZonedProjection
 * @brief Wall-clock view of an instant in one zone. Derived data only.
 *
 * Wall fields use the zone offset truncated toward zero to whole minutes,
 * so they always match formatInZone() output for the same instant.
 */
struct ZonedProjection {
    Instant instant;
    std::string zone;

    int year = 1970;
    unsigned month = 1;
    unsigned day = 1;
    unsigned hour = 0;
    unsigned minute = 0;
    unsigned second = 0;
    uint32_t nanosecond = 0;
    unsigned weekday = 4;      // 0 = Sunday
    unsigned dayOfYear = 1;    // 1-based

    int32_t offsetSeconds = 0; // seconds east of UTC, truncated to whole minutes
    std::string abbreviation;
    bool isDst = false;

    CivilDateTime civil() const;
};

/**
 * @brief Offset in effect for `zone` at `at`. Fixed-offset identifiers are
 * handled here; everything else goes to `db`.
 * @return UNKNOWN_ZONE if neither can resolve the name
 */
Expected<ZoneInfo, ZoneError> resolveZone(const TimeZoneRef& zone,
                                          const Instant& at,
                                          const ZoneDatabase& db = defaultZoneDatabase());

/**
 * @brief Decompose `instant` into wall fields in `zone`. Pure: the same
 * arguments always give the same result for a stable zone database.
 */
Expected<ZonedProjection, ZoneError> project(const Instant& instant,
                                             const TimeZoneRef& zone,
                                             const ZoneDatabase& db = defaultZoneDatabase());

/**
 * @brief project() followed by formatRfc3339() with the resolved offset.
 */
Expected<std::string, ZoneError> formatInZone(const Instant& instant,
                                              const TimeZoneRef& zone,
                                              const ZoneDatabase& db = defaultZoneDatabase(),
                                              SubsecondPrecision precision = SubsecondPrecision::AUTO);

/**
 * @brief Instant at which `zone`'s wall clock shows `wall`.
 *
 * Fails with AMBIGUOUS_LOCAL_TIME when the wall time occurs twice (DST
 * fall-back), NONEXISTENT_LOCAL_TIME when it is skipped (spring-forward),
 * OUT_OF_RANGE when the instant is not representable.
 */
Expected<Instant, ZoneError> localToInstant(const CivilDateTime& wall,
                                            const TimeZoneRef& zone,
                                            const ZoneDatabase& db = defaultZoneDatabase());

} // namespace TimeUtil
