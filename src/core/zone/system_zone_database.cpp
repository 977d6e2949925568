#include <timeutil/core/zone/zone_database.hpp>
#include <absl/time/time.h>
#include <spdlog/spdlog.h>
#include <cstring>
#include <filesystem>
#include <fstream>

namespace TimeUtil {

namespace {

// IANA names: letters, digits and "/_-+", no empty or dot components
bool isValidZoneName(const std::string& zone) {
    if (zone.empty() || zone.front() == '/' || zone.back() == '/') return false;
    for (char c : zone) {
        bool ok = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')
               || c == '/' || c == '_' || c == '-' || c == '+';
        if (!ok) return false;
    }
    return zone.find("//") == std::string::npos;
}

bool isTzifFile(const std::filesystem::path& file) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(file, ec)) return false;

    std::ifstream ifs(file, std::ios::binary);
    char magic[4] = {};
    if (!ifs.read(magic, sizeof(magic))) return false;
    return std::memcmp(magic, "TZif", sizeof(magic)) == 0;
}

} // anonymous namespace

SystemZoneDatabase::SystemZoneDatabase(std::string zoneinfoDir)
    : zoneinfoDir_(std::move(zoneinfoDir)) {
    std::error_code ec;
    if (!std::filesystem::is_directory(zoneinfoDir_, ec)) {
        spdlog::warn("[ZoneDB] zoneinfo directory {} not found, only fixed offsets will resolve", zoneinfoDir_);
    }
}

bool SystemZoneDatabase::contains(const std::string& zone) const {
    return isValidZoneName(zone) && isTzifFile(std::filesystem::path(zoneinfoDir_) / zone);
}

std::optional<ZoneInfo> SystemZoneDatabase::lookup(const std::string& zone, const Instant& at) const {
    if (!contains(zone)) {
        spdlog::debug("[ZoneDB] Unknown zone '{}' under {}", zone, zoneinfoDir_);
        return std::nullopt;
    }

    // Absolute path, so the lookup never consults TZDIR or TZ. Loaded zones
    // are cached (and shared between threads) by absl.
    std::error_code ec;
    const std::string file = std::filesystem::absolute(std::filesystem::path(zoneinfoDir_) / zone, ec).string();
    absl::TimeZone tz;
    if (ec || !absl::LoadTimeZone(file, &tz)) {
        spdlog::warn("[ZoneDB] Failed to load tzdata for zone '{}' from {}", zone, file);
        return std::nullopt;
    }

    const absl::TimeZone::CivilInfo civil = tz.At(absl::FromUnixSeconds(at.seconds()));

    ZoneInfo info;
    info.offsetSeconds = static_cast<int32_t>(civil.offset);
    info.abbreviation = civil.zone_abbr ? civil.zone_abbr : "";
    info.isDst = civil.is_dst;
    return info;
}

const SystemZoneDatabase& SystemZoneDatabase::instance() {
    static SystemZoneDatabase instance;
    return instance;
}

const ZoneDatabase& defaultZoneDatabase() {
    return SystemZoneDatabase::instance();
}

} // namespace TimeUtil
