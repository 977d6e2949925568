#include <timeutil/core/serialization/yaml_instant.hpp>
#include <timeutil/core/codec/date_parser.hpp>
#include <timeutil/core/codec/rfc3339.hpp>
#include <spdlog/spdlog.h>
#include <cstdint>

namespace TimeUtil {

namespace {

YAML::Mark markOf(const YAML::Node& node) {
    return node.IsDefined() ? node.Mark() : YAML::Mark::null_mark();
}

[[noreturn]] void fail(const YAML::Node& node, ParseError error) {
    spdlog::debug("[YAML] decode failed: {}", error.message());
    throw StructuredDecodeError(markOf(node), std::move(error));
}

const std::string& requireScalar(const YAML::Node& node, const char* expected) {
    if (!node.IsDefined() || !node.IsScalar()) {
        fail(node, ParseError::malformed(0, node.IsDefined() ? "non-scalar node" : "missing node", expected));
    }
    return node.Scalar();
}

int64_t requireInteger(const YAML::Node& node, const char* expected) {
    const std::string& text = requireScalar(node, expected);
    int64_t value = 0;
    if (!YAML::convert<int64_t>::decode(node, value)) {
        fail(node, ParseError::malformed(0, "'" + text + "'", expected));
    }
    return value;
}

Instant requireInstant(const YAML::Node& node, Expected<Instant, ArithmeticError> result, const char* field) {
    if (!result) {
        fail(node, ParseError::outOfRange(0, field, result.error().message()));
    }
    return result.value();
}

} // anonymous namespace

StructuredDecodeError::StructuredDecodeError(const YAML::Mark& mark, ParseError error)
    : YAML::RepresentationException(mark, error.message()),
      error_(std::move(error)) {
}

YAML::Node encodeInstant(const Instant& instant) {
    return YAML::Node(formatRfc3339(instant));
}

Instant decodeInstant(const YAML::Node& node) {
    const std::string& text = requireScalar(node, "RFC 3339 timestamp");
    auto parsed = parseRfc3339(text);
    if (!parsed) {
        fail(node, parsed.error());
    }
    return parsed.value();
}

YAML::Node encodeOptionalInstant(const std::optional<Instant>& instant) {
    if (!instant) {
        return YAML::Node(YAML::NodeType::Null);
    }
    return encodeInstant(*instant);
}

std::optional<Instant> decodeOptionalInstant(const YAML::Node& node) {
    if (!node.IsDefined() || node.IsNull()) {
        return std::nullopt;
    }
    return decodeInstant(node);
}

Instant decodeDate(const YAML::Node& node) {
    const std::string& text = requireScalar(node, "date (YYYY-MM-DD)");
    auto parsed = parseDate(text, DateParseOptions(), DateFormat::DATE);
    if (!parsed) {
        fail(node, parsed.error());
    }
    return parsed.value();
}

Instant decodeUnixSeconds(const YAML::Node& node) {
    const int64_t seconds = requireInteger(node, "integer seconds since the Unix epoch");
    return requireInstant(node, Instant::fromUnixSeconds(seconds), "seconds");
}

YAML::Node encodeUnixMillis(const Instant& instant) {
    return YAML::Node(instant.unixMillis());
}

Instant decodeUnixMillis(const YAML::Node& node) {
    const int64_t millis = requireInteger(node, "integer milliseconds since the Unix epoch");
    return requireInstant(node, Instant::fromUnixMillis(millis), "millis");
}

Instant decodeUnixMillisInZone(const YAML::Node& node, const FixedZone& zone) {
    const Instant stamp = decodeUnixMillis(node);
    return requireInstant(node, applyZoneOffset(stamp, zone), "millis");
}

} // namespace TimeUtil

namespace YAML {

Node convert<TimeUtil::Instant>::encode(const TimeUtil::Instant& rhs) {
    return TimeUtil::encodeInstant(rhs);
}

bool convert<TimeUtil::Instant>::decode(const Node& node, TimeUtil::Instant& rhs) {
    if (!node.IsScalar()) {
        return false;
    }
    auto parsed = TimeUtil::parseRfc3339(node.Scalar());
    if (!parsed) {
        spdlog::debug("[YAML] '{}' is not an instant: {}", node.Scalar(), parsed.error().message());
        return false;
    }
    rhs = parsed.value();
    return true;
}

} // namespace YAML
