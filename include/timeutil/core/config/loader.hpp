#pragma once
#include <timeutil/core/config/app_config.hpp>
#include <timeutil/core/codec/date_parser.hpp>
#include <timeutil/core/codec/rfc3339.hpp>
#include <timeutil/core/zone/zone_database.hpp>
#include <spdlog/common.h>
#include <string>

class ConfigLoader {
public:
    // Throws std::runtime_error on a missing file, missing field, wrong type or bad value
    static AppConfig::AppConfiguration loadConfig(const std::string& filepath);

    static TimeUtil::DateParseOptions toDateParseOptions(const AppConfig::AppConfiguration& config,
                                                         const TimeUtil::ZoneDatabase* zoneDatabase = nullptr);
    static TimeUtil::SubsecondPrecision toPrecision(const AppConfig::AppConfiguration& config);
    static spdlog::level::level_enum toLogLevel(const AppConfig::AppConfiguration& config);

    // Aliases as fixed zones, chained in front of `fallback`
    static TimeUtil::FixedZoneDatabase buildZoneDatabase(const AppConfig::AppConfiguration& config,
                                                         const TimeUtil::ZoneDatabase* fallback);
};
