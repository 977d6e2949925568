#include <timeutil/core/zone/zoned_projection.hpp>
#include <timeutil/core/zone/fixed_zone.hpp>
#include <spdlog/spdlog.h>
#include <vector>

namespace TimeUtil {

namespace {

ZoneError zoneError(ZoneErrorKind kind, const TimeZoneRef& zone, std::string detail = "") {
    ZoneError e;
    e.kind = kind;
    e.zone = zone.name;
    e.detail = std::move(detail);
    return e;
}

// Instant clamped into the representable range
Instant clampedInstant(int64_t seconds) {
    if (seconds < Instant::MIN_SECONDS) return Instant::min();
    if (seconds > Instant::MAX_SECONDS) return Instant::fromUnixSeconds(Instant::MAX_SECONDS).value();
    return Instant::fromUnixSeconds(seconds).value();
}

} // anonymous namespace

CivilDateTime ZonedProjection::civil() const {
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

Expected<ZoneInfo, ZoneError> resolveZone(const TimeZoneRef& zone, const Instant& at, const ZoneDatabase& db) {
    if (auto fixed = parseFixedOffset(zone.name)) {
        ZoneInfo info;
        info.offsetSeconds = *fixed;
        info.abbreviation = *fixed == 0 ? std::string("UTC") : formatFixedOffset(*fixed);
        info.isDst = false;
        return info;
    }

    auto info = db.lookup(zone.name, at);
    if (!info) {
        return zoneError(ZoneErrorKind::UNKNOWN_ZONE, zone, "not a fixed offset and not in the zone database");
    }
    return *info;
}

Expected<ZonedProjection, ZoneError> project(const Instant& instant, const TimeZoneRef& zone, const ZoneDatabase& db) {
    auto info = resolveZone(zone, instant, db);
    if (!info) {
        return info.error();
    }

    // Same whole-minute offset formatRfc3339() prints; LMT seconds are dropped
    const int32_t offsetSeconds = info.value().offsetSeconds / 60 * 60;
    const int64_t wallSeconds = instant.seconds() + offsetSeconds;
    const CivilDateTime wall = Calendar::toCivil(wallSeconds);

    ZonedProjection p;
    p.instant = instant;
    p.zone = zone.name;
    p.year = wall.year;
    p.month = wall.month;
    p.day = wall.day;
    p.hour = wall.hour;
    p.minute = wall.minute;
    p.second = wall.second;
    p.nanosecond = instant.nanos();
    p.weekday = Calendar::weekdayFromDays(Calendar::floorDiv(wallSeconds, Calendar::SECONDS_PER_DAY));
    p.dayOfYear = Calendar::dayOfYear(wall.year, wall.month, wall.day);
    p.offsetSeconds = offsetSeconds;
    p.abbreviation = info.value().abbreviation;
    p.isDst = info.value().isDst;
    return p;
}

Expected<std::string, ZoneError> formatInZone(const Instant& instant,
                                              const TimeZoneRef& zone,
                                              const ZoneDatabase& db,
                                              SubsecondPrecision precision) {
    auto projection = project(instant, zone, db);
    if (!projection) {
        return projection.error();
    }
    return formatRfc3339(instant, projection.value().offsetSeconds, precision);
}

Expected<Instant, ZoneError> localToInstant(const CivilDateTime& wall, const TimeZoneRef& zone, const ZoneDatabase& db) {
    const int64_t wallSeconds = Calendar::toEpochSeconds(wall);

    // Offsets in effect a day either side of the wall time cover every
    // transition that can affect it.
    std::vector<int32_t> candidates;
    for (int64_t nearby : {wallSeconds - Calendar::SECONDS_PER_DAY, wallSeconds + Calendar::SECONDS_PER_DAY}) {
        auto info = resolveZone(zone, clampedInstant(nearby), db);
        if (!info) {
            return info.error();
        }
        if (candidates.empty() || candidates.front() != info.value().offsetSeconds) {
            candidates.push_back(info.value().offsetSeconds);
        }
    }

    std::vector<Instant> matches;
    bool anyInRange = false;
    for (int32_t offset : candidates) {
        auto instant = Instant::fromParts(wallSeconds - offset, wall.nanosecond);
        if (!instant) {
            continue;
        }
        anyInRange = true;
        auto actual = resolveZone(zone, instant.value(), db);
        if (!actual) {
            return actual.error();
        }
        if (actual.value().offsetSeconds == offset) {
            matches.push_back(instant.value());
        }
    }

    if (matches.size() == 1) {
        return matches.front();
    }
    if (!anyInRange) {
        return zoneError(ZoneErrorKind::OUT_OF_RANGE, zone, "wall time outside years 0001..9998");
    }
    if (matches.empty()) {
        spdlog::debug("[Zone] {:04d}-{:02d}-{:02d} {:02d}:{:02d}:{:02d} does not exist in {}",
                      wall.year, wall.month, wall.day, wall.hour, wall.minute, wall.second, zone.name);
        return zoneError(ZoneErrorKind::NONEXISTENT_LOCAL_TIME, zone, "wall time skipped by a transition");
    }
    spdlog::debug("[Zone] {:04d}-{:02d}-{:02d} {:02d}:{:02d}:{:02d} is ambiguous in {}",
                  wall.year, wall.month, wall.day, wall.hour, wall.minute, wall.second, zone.name);
    return zoneError(ZoneErrorKind::AMBIGUOUS_LOCAL_TIME, zone, "wall time repeated by a transition");
}

} // namespace TimeUtil
