#include <timeutil/core/config/loader.hpp>
#include <timeutil/core/zone/fixed_zone.hpp>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>
#include <stdexcept>

namespace {

const char* const LOG_LEVELS[] = {"trace", "debug", "info", "warn", "error", "critical", "off"};
const char* const MISSING_OFFSET_POLICIES[] = {"utc", "fixed", "zone", "reject"};
const char* const PRECISIONS[] = {"auto", "seconds", "millis", "micros", "nanos"};

template<size_t N>
bool oneOf(const std::string& value, const char* const (&allowed)[N]) {
    for (const char* candidate : allowed) {
        if (value == candidate) return true;
    }
    return false;
}

std::string requireString(const YAML::Node& parent, const char* key) {
    YAML::Node node = parent[key];
    if (!node) {
        throw std::runtime_error(std::string("Missing required config field: ") + key);
    }
    if (!node.IsScalar()) {
        throw std::runtime_error(std::string("Config field must be a string: ") + key);
    }
    return node.as<std::string>();
}

void readString(const YAML::Node& parent, const char* key, std::string& out) {
    YAML::Node node = parent[key];
    if (!node) return;
    if (!node.IsScalar()) {
        throw std::runtime_error(std::string("Config field must be a string: ") + key);
    }
    out = node.as<std::string>();
}

YAML::Node optionalMap(const YAML::Node& parent, const char* key) {
    YAML::Node node = parent[key];
    if (node && !node.IsMap()) {
        throw std::runtime_error(std::string("Config section must be a map: ") + key);
    }
    return node;
}

void requireFixedOffset(const std::string& text, const std::string& what) {
    if (!TimeUtil::parseFixedOffset(text)) {
        throw std::runtime_error("Invalid UTC offset for " + what + ": '" + text + "'");
    }
}

} // anonymous namespace

AppConfig::AppConfiguration ConfigLoader::loadConfig(const std::string& filepath) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(filepath);
    } catch (const YAML::BadFile& e) {
        throw std::runtime_error("Cannot open config file " + filepath + ": " + e.what());
    } catch (const YAML::ParserException& e) {
        throw std::runtime_error("Cannot parse config file " + filepath + ": " + e.what());
    }

    if (!root.IsMap()) {
        throw std::runtime_error("Config file " + filepath + " must contain a map");
    }

    AppConfig::AppConfiguration config;
    config.app_name = requireString(root, "app_name");
    config.version = requireString(root, "version");

    if (YAML::Node logging = optionalMap(root, "logging")) {
        readString(logging, "level", config.logging.level);
        readString(logging, "pattern", config.logging.pattern);
    }
    if (!oneOf(config.logging.level, LOG_LEVELS)) {
        throw std::runtime_error("Invalid logging.level: '" + config.logging.level + "'");
    }

    if (YAML::Node zones = optionalMap(root, "zones")) {
        readString(zones, "default_zone", config.zones.default_zone);
        readString(zones, "zoneinfo_dir", config.zones.zoneinfo_dir);
        if (YAML::Node aliases = optionalMap(zones, "aliases")) {
            for (const auto& entry : aliases) {
                if (!entry.first.IsScalar() || !entry.second.IsScalar()) {
                    throw std::runtime_error("zones.aliases values must be UTC offsets");
                }
                const std::string name = entry.first.as<std::string>();
                const std::string offset = entry.second.as<std::string>();
                requireFixedOffset(offset, "zones.aliases." + name);
                config.zones.aliases[name] = offset;
            }
        }
    }
    if (config.zones.default_zone.empty()) {
        throw std::runtime_error("zones.default_zone must not be empty");
    }

    if (YAML::Node parsing = optionalMap(root, "date_parsing")) {
        readString(parsing, "missing_offset", config.date_parsing.missing_offset);
        readString(parsing, "fixed_offset", config.date_parsing.fixed_offset);
        readString(parsing, "zone", config.date_parsing.zone);
    }
    if (!oneOf(config.date_parsing.missing_offset, MISSING_OFFSET_POLICIES)) {
        throw std::runtime_error("Invalid date_parsing.missing_offset: '" + config.date_parsing.missing_offset + "'");
    }
    requireFixedOffset(config.date_parsing.fixed_offset, "date_parsing.fixed_offset");
    if (config.date_parsing.missing_offset == "zone" && config.date_parsing.zone.empty()) {
        throw std::runtime_error("date_parsing.zone is required when missing_offset is 'zone'");
    }

    if (YAML::Node format = optionalMap(root, "format")) {
        readString(format, "precision", config.format.precision);
    }
    if (!oneOf(config.format.precision, PRECISIONS)) {
        throw std::runtime_error("Invalid format.precision: '" + config.format.precision + "'");
    }

    spdlog::info("[Config] Loaded {} {} from {}", config.app_name, config.version, filepath);
    spdlog::debug("[Config] default_zone={} missing_offset={} precision={} aliases={}",
                  config.zones.default_zone, config.date_parsing.missing_offset,
                  config.format.precision, config.zones.aliases.size());
    return config;
}

TimeUtil::DateParseOptions ConfigLoader::toDateParseOptions(const AppConfig::AppConfiguration& config,
                                                            const TimeUtil::ZoneDatabase* zoneDatabase) {
    TimeUtil::DateParseOptions options;
    const std::string& policy = config.date_parsing.missing_offset;
    if (policy == "fixed") {
        options.missingOffset = TimeUtil::MissingOffset::ASSUME_FIXED;
    } else if (policy == "zone") {
        options.missingOffset = TimeUtil::MissingOffset::ASSUME_ZONE;
    } else if (policy == "reject") {
        options.missingOffset = TimeUtil::MissingOffset::REJECT;
    } else {
        options.missingOffset = TimeUtil::MissingOffset::ASSUME_UTC;
    }
    options.fixedOffsetSeconds = TimeUtil::parseFixedOffset(config.date_parsing.fixed_offset).value_or(0);
    options.zone = config.date_parsing.zone;
    options.zoneDatabase = zoneDatabase;
    return options;
}

TimeUtil::SubsecondPrecision ConfigLoader::toPrecision(const AppConfig::AppConfiguration& config) {
    const std::string& precision = config.format.precision;
    if (precision == "seconds") return TimeUtil::SubsecondPrecision::SECONDS;
    if (precision == "millis")  return TimeUtil::SubsecondPrecision::MILLIS;
    if (precision == "micros")  return TimeUtil::SubsecondPrecision::MICROS;
    if (precision == "nanos")   return TimeUtil::SubsecondPrecision::NANOS;
    return TimeUtil::SubsecondPrecision::AUTO;
}

spdlog::level::level_enum ConfigLoader::toLogLevel(const AppConfig::AppConfiguration& config) {
    return spdlog::level::from_str(config.logging.level);
}

TimeUtil::FixedZoneDatabase ConfigLoader::buildZoneDatabase(const AppConfig::AppConfiguration& config,
                                                            const TimeUtil::ZoneDatabase* fallback) {
    TimeUtil::FixedZoneDatabase db = TimeUtil::FixedZoneDatabase::withBuiltins(fallback);
    for (const auto& alias : config.zones.aliases) {
        auto offset = TimeUtil::parseFixedOffset(alias.second);
        if (!offset) {
            throw std::runtime_error("Invalid UTC offset for zone alias " + alias.first);
        }
        db.add(alias.first, *offset, alias.first);
    }
    return db;
}
