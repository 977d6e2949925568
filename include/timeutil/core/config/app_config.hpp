#pragma once
#include <map>
#include <string>

namespace AppConfig {

    struct LoggingConfig {
        std::string level = "info";
        std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
    };

    struct ZonesConfig {
        std::string default_zone = "UTC";
        std::string zoneinfo_dir = "/usr/share/zoneinfo";
        // alias name -> fixed offset text ("+05:30")
        std::map<std::string, std::string> aliases;
    };

    struct DateParsingConfig {
        std::string missing_offset = "utc";   // utc | fixed | zone | reject
        std::string fixed_offset = "+00:00";
        std::string zone;
    };

    struct FormatConfig {
        std::string precision = "auto";       // auto | seconds | millis | micros | nanos
    };

    struct AppConfiguration {
        std::string app_name;
        std::string version;
        LoggingConfig logging;
        ZonesConfig zones;
        DateParsingConfig date_parsing;
        FormatConfig format;
    };

} // namespace AppConfig
