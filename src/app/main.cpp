#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <timeutil/core/config/loader.hpp>
#include <timeutil/core/codec/date_parser.hpp>
#include <timeutil/core/codec/rfc3339.hpp>
#include <timeutil/core/time/day_math.hpp>
#include <timeutil/core/time/instant.hpp>
#include <timeutil/core/zone/zoned_projection.hpp>

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

namespace {

struct Context {
    AppConfig::AppConfiguration config;
    const TimeUtil::ZoneDatabase* zones = nullptr;
    TimeUtil::DateParseOptions parseOptions;
    TimeUtil::SubsecondPrecision precision = TimeUtil::SubsecondPrecision::AUTO;
};

void printUsage() {
    std::cerr << "Usage: timeutil [--config <file>] <command> [args]\n"
              << "Commands:\n"
              << "  now [zone]                       current time\n"
              << "  format <instant> [zone]          instant as RFC 3339 in zone\n"
              << "  parse <text>                     parse a date or timestamp\n"
              << "  add <instant> <seconds> [nanos]  instant plus a duration\n"
              << "  diff <a> <b>                     a - b\n"
              << "  next-day <instant>               start of the following UTC day\n"
              << "  days-back <count> [instant]      start of the UTC day count days earlier\n";
}

bool parseInteger(const std::string& text, int64_t& out) {
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto result = std::from_chars(first, last, out);
    return result.ec == std::errc() && result.ptr == last;
}

bool readInstant(const Context& ctx, const std::string& text, TimeUtil::Instant& out) {
    auto parsed = TimeUtil::parseDate(text, ctx.parseOptions);
    if (!parsed) {
        spdlog::error("Cannot parse '{}': {}", text, parsed.error().message());
        return false;
    }
    out = parsed.value();
    return true;
}

int printInstant(const Context& ctx, const TimeUtil::Instant& instant, const std::string& zone) {
    auto text = TimeUtil::formatInZone(instant, zone, *ctx.zones, ctx.precision);
    if (!text) {
        spdlog::error("{}", text.error().message());
        return EXIT_FAILURE;
    }
    std::cout << text.value() << "\n";
    return EXIT_SUCCESS;
}

int printResult(const Context& ctx, const TimeUtil::Expected<TimeUtil::Instant, TimeUtil::ArithmeticError>& result) {
    if (!result) {
        spdlog::error("{}", result.error().message());
        return EXIT_FAILURE;
    }
    return printInstant(ctx, result.value(), ctx.config.zones.default_zone);
}

int runCommand(const Context& ctx, const std::string& command, const std::vector<std::string>& args) {
    const std::string& defaultZone = ctx.config.zones.default_zone;

    if (command == "now" && args.size() <= 1) {
        auto now = TimeUtil::Instant::now(TimeUtil::SystemClock::instance());
        if (!now) {
            spdlog::error("{}", now.error().message());
            return EXIT_FAILURE;
        }
        return printInstant(ctx, now.value(), args.empty() ? defaultZone : args[0]);
    }

    if (command == "format" && (args.size() == 1 || args.size() == 2)) {
        TimeUtil::Instant instant;
        if (!readInstant(ctx, args[0], instant)) return EXIT_FAILURE;
        return printInstant(ctx, instant, args.size() == 2 ? args[1] : defaultZone);
    }

    if (command == "parse" && args.size() == 1) {
        TimeUtil::Instant instant;
        if (!readInstant(ctx, args[0], instant)) return EXIT_FAILURE;
        std::cout << TimeUtil::formatRfc3339(instant) << " seconds=" << instant.seconds()
                  << " nanos=" << instant.nanos() << "\n";
        return EXIT_SUCCESS;
    }

    if (command == "add" && (args.size() == 2 || args.size() == 3)) {
        TimeUtil::Instant instant;
        int64_t seconds = 0;
        int64_t nanos = 0;
        if (!readInstant(ctx, args[0], instant)) return EXIT_FAILURE;
        if (!parseInteger(args[1], seconds) || (args.size() == 3 && !parseInteger(args[2], nanos))) {
            spdlog::error("Duration must be given as integer seconds [nanos]");
            return EXIT_FAILURE;
        }
        auto duration = TimeUtil::Duration::fromParts(seconds, nanos);
        if (!duration) {
            spdlog::error("{}", duration.error().message());
            return EXIT_FAILURE;
        }
        return printResult(ctx, TimeUtil::add(instant, duration.value()));
    }

    if (command == "diff" && args.size() == 2) {
        TimeUtil::Instant a;
        TimeUtil::Instant b;
        if (!readInstant(ctx, args[0], a) || !readInstant(ctx, args[1], b)) return EXIT_FAILURE;
        TimeUtil::Duration d = TimeUtil::difference(a, b);
        std::cout << "seconds=" << d.seconds() << " nanos=" << d.nanos() << "\n";
        return EXIT_SUCCESS;
    }

    if (command == "next-day" && args.size() == 1) {
        TimeUtil::Instant instant;
        if (!readInstant(ctx, args[0], instant)) return EXIT_FAILURE;
        return printResult(ctx, TimeUtil::nextDay(instant));
    }

    if (command == "days-back" && (args.size() == 1 || args.size() == 2)) {
        int64_t count = 0;
        if (!parseInteger(args[0], count) || count < 0 || count > UINT32_MAX) {
            spdlog::error("Day count must be a non-negative integer: '{}'", args[0]);
            return EXIT_FAILURE;
        }
        if (args.size() == 1) {
            return printResult(ctx, TimeUtil::daysBack(TimeUtil::SystemClock::instance(), static_cast<uint32_t>(count)));
        }
        TimeUtil::Instant instant;
        if (!readInstant(ctx, args[1], instant)) return EXIT_FAILURE;
        return printResult(ctx, TimeUtil::daysBack(instant, static_cast<uint32_t>(count)));
    }

    printUsage();
    return EXIT_FAILURE;
}

} // anonymous namespace

int main( int argc, char* argv[] ) {
    // Results go to stdout, diagnostics to stderr
    spdlog::set_default_logger(spdlog::stderr_color_mt("timeutil"));
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::warn);

    std::string configPath = "config/config.yaml";
    std::vector<std::string> args(argv + 1, argv + argc);
    if (args.size() >= 2 && args[0] == "--config") {
        configPath = args[1];
        args.erase(args.begin(), args.begin() + 2);
    }
    if (args.empty()) {
        printUsage();
        return EXIT_FAILURE;
    }

    // Load configuration
    Context ctx;
    try {
        ctx.config = ConfigLoader::loadConfig(configPath);
    }
    catch (const std::exception& e) {
        spdlog::error("Failed to load configuration: {}", e.what());
        return EXIT_FAILURE;
    }
    spdlog::set_pattern(ctx.config.logging.pattern);
    spdlog::set_level(ConfigLoader::toLogLevel(ctx.config));
    spdlog::debug("{} version {} starting up...", ctx.config.app_name, ctx.config.version);

    TimeUtil::SystemZoneDatabase systemZones(ctx.config.zones.zoneinfo_dir);
    TimeUtil::FixedZoneDatabase zones = ConfigLoader::buildZoneDatabase(ctx.config, &systemZones);
    ctx.zones = &zones;
    ctx.parseOptions = ConfigLoader::toDateParseOptions(ctx.config, &zones);
    ctx.precision = ConfigLoader::toPrecision(ctx.config);

    const std::string command = args.front();
    args.erase(args.begin());
    return runCommand(ctx, command, args);
}
