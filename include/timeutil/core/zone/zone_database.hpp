#pragma once

#include <timeutil/core/time/instant.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

namespace TimeUtil {

/**
 * @struct ZoneInfo
 * @brief Offset in effect for a zone at one instant.
 */
struct ZoneInfo {
    int32_t offsetSeconds = 0;     // seconds east of UTC
    std::string abbreviation;      // "EST", "CEST", ... (may be empty)
    bool isDst = false;
};

/**
 * @class ZoneDatabase
 * @brief Zone-offset collaborator.
 *
 * Implementations answer "what offset applies in `zone` at `at`",
 * transitions (DST) included, or nullopt if the zone is unknown. lookup()
 * must be callable concurrently.
 */
class ZoneDatabase {
public:
    virtual ~ZoneDatabase() = default;
    virtual std::optional<ZoneInfo> lookup(const std::string& zone, const Instant& at) const = 0;
};

/**
 * @class SystemZoneDatabase
 * @brief IANA zones from the system tzdata, resolved by absl::TimeZone.
 *
 * A zone is known when `<zoneinfoDir>/<name>` is a TZif file. The file is
 * loaded by absolute path; no environment or libc time-zone state is read
 * or written, so lookups from any thread never disturb localtime() users.
 */
class SystemZoneDatabase : public ZoneDatabase {
public:
    static constexpr const char* DEFAULT_ZONEINFO_DIR = "/usr/share/zoneinfo";

    explicit SystemZoneDatabase(std::string zoneinfoDir = DEFAULT_ZONEINFO_DIR);

    std::optional<ZoneInfo> lookup(const std::string& zone, const Instant& at) const override;

    // True if `zone` names a TZif file under the zoneinfo directory
    bool contains(const std::string& zone) const;

    const std::string& zoneinfoDir() const { return zoneinfoDir_; }

    static const SystemZoneDatabase& instance();

private:
    std::string zoneinfoDir_;
};

/**
 * @class FixedZoneDatabase
 * @brief Name -> constant offset table, optionally chained to another
 * database for names it does not know. Populate it before sharing it.
 */
class FixedZoneDatabase : public ZoneDatabase {
public:
    explicit FixedZoneDatabase(const ZoneDatabase* fallback = nullptr);

    void add(const std::string& name, int32_t offsetSeconds, std::string abbreviation = "");

    std::optional<ZoneInfo> lookup(const std::string& zone, const Instant& at) const override;

    size_t size() const { return zones_.size(); }

    // UTC, GMT and EST (UTC-05:00, no DST)
    static FixedZoneDatabase withBuiltins(const ZoneDatabase* fallback = nullptr);

private:
    std::unordered_map<std::string, ZoneInfo> zones_;
    const ZoneDatabase* fallback_;
};

// Process-wide SystemZoneDatabase over DEFAULT_ZONEINFO_DIR
const ZoneDatabase& defaultZoneDatabase();

} // namespace TimeUtil
