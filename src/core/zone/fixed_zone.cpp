#include <timeutil/core/zone/fixed_zone.hpp>
#include <cstdio>

namespace TimeUtil {

namespace {

bool readTwoDigits(std::string_view text, size_t pos, int& value) {
    if (pos + 2 > text.size()) return false;
    char hi = text[pos];
    char lo = text[pos + 1];
    if (hi < '0' || hi > '9' || lo < '0' || lo > '9') return false;
    value = (hi - '0') * 10 + (lo - '0');
    return true;
}

} // anonymous namespace

Expected<Instant, ArithmeticError> applyZoneOffset(const Instant& stamp, const FixedZone& zone) {
    return add(stamp, Duration::fromSeconds(zone.offsetSeconds));
}

std::optional<int32_t> parseFixedOffset(std::string_view text) {
    if (text == "UTC" || text == "UT" || text == "GMT" || text == "Z" || text == "z") {
        return 0;
    }
    if (text.substr(0, 3) == "UTC" || text.substr(0, 3) == "GMT") {
        text.remove_prefix(3);
    }
    if (text.empty() || (text[0] != '+' && text[0] != '-')) {
        return std::nullopt;
    }

    const int sign = text[0] == '-' ? -1 : 1;
    int hours = 0;
    int minutes = 0;
    if (!readTwoDigits(text, 1, hours)) return std::nullopt;

    if (text.size() == 5) {
        if (!readTwoDigits(text, 3, minutes)) return std::nullopt;
    } else if (text.size() == 6 && text[3] == ':') {
        if (!readTwoDigits(text, 4, minutes)) return std::nullopt;
    } else if (text.size() != 3) {
        return std::nullopt;
    }

    if (hours > 23 || minutes > 59) return std::nullopt;
    return sign * (hours * 3600 + minutes * 60);
}

std::string formatFixedOffset(int32_t offsetSeconds) {
    const int32_t minutes = offsetSeconds / 60;
    const int32_t magnitude = minutes < 0 ? -minutes : minutes;
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%c%02d:%02d", minutes < 0 ? '-' : '+',
                  magnitude / 60, magnitude % 60);
    return buffer;
}

} // namespace TimeUtil
