#include <timeutil/core/zone/zone_database.hpp>
#include <timeutil/core/zone/fixed_zone.hpp>
#include <spdlog/spdlog.h>

namespace TimeUtil {

FixedZoneDatabase::FixedZoneDatabase(const ZoneDatabase* fallback)
    : fallback_(fallback) {
}

void FixedZoneDatabase::add(const std::string& name, int32_t offsetSeconds, std::string abbreviation) {
    ZoneInfo info;
    info.offsetSeconds = offsetSeconds;
    info.abbreviation = abbreviation.empty() ? name : std::move(abbreviation);
    info.isDst = false;
    zones_[name] = std::move(info);
    spdlog::debug("[ZoneDB] Fixed zone {} = {}", name, formatFixedOffset(offsetSeconds));
}

std::optional<ZoneInfo> FixedZoneDatabase::lookup(const std::string& zone, const Instant& at) const {
    auto it = zones_.find(zone);
    if (it != zones_.end()) {
        return it->second;
    }
    if (fallback_) {
        return fallback_->lookup(zone, at);
    }
    return std::nullopt;
}

FixedZoneDatabase FixedZoneDatabase::withBuiltins(const ZoneDatabase* fallback) {
    FixedZoneDatabase db(fallback);
    db.add(UTC_ZONE.name, UTC_ZONE.offsetSeconds);
    db.add("GMT", 0);
    db.add(EST_ZONE.name, EST_ZONE.offsetSeconds);
    return db;
}

} // namespace TimeUtil
