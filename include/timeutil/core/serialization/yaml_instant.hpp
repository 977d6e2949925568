#pragma once

#include <timeutil/core/time/errors.hpp>
#include <timeutil/core/time/instant.hpp>
#include <timeutil/core/zone/fixed_zone.hpp>
#include <yaml-cpp/yaml.h>
#include <optional>
#include <string>

namespace TimeUtil {

// ============================================================================
// YAML ADAPTER
// ============================================================================
// Instants are written as RFC 3339 scalars in UTC ("2018-04-01T12:00:00Z").
// The helpers below throw StructuredDecodeError on failure, which carries
// the node's position in the document and the underlying ParseError.
// Node::as<Instant>() follows the usual yaml-cpp contract instead: it throws
// TypedBadConversion, and as<Instant>(fallback) returns the fallback.
// ============================================================================

class StructuredDecodeError : public YAML::RepresentationException {
public:
    StructuredDecodeError(const YAML::Mark& mark, ParseError error);

    const ParseError& parseError() const { return error_; }

private:
    ParseError error_;
};

YAML::Node encodeInstant(const Instant& instant);
Instant decodeInstant(const YAML::Node& node);

// Null node <-> empty optional
YAML::Node encodeOptionalInstant(const std::optional<Instant>& instant);
std::optional<Instant> decodeOptionalInstant(const YAML::Node& node);

// "YYYY-MM-DD", midnight UTC
Instant decodeDate(const YAML::Node& node);

// Integer seconds since the Unix epoch
Instant decodeUnixSeconds(const YAML::Node& node);

// Integer milliseconds since the Unix epoch (floor on encode)
YAML::Node encodeUnixMillis(const Instant& instant);
Instant decodeUnixMillis(const YAML::Node& node);

/**
 * @brief Millisecond stamp corrected by a fixed zone's offset, see
 * applyZoneOffset(). EST 1517461200000 decodes to 2018-02-01T00:00:00Z.
 */
Instant decodeUnixMillisInZone(const YAML::Node& node, const FixedZone& zone);

} // namespace TimeUtil

namespace YAML {

template<>
struct convert<TimeUtil::Instant> {
    static Node encode(const TimeUtil::Instant& rhs);
    static bool decode(const Node& node, TimeUtil::Instant& rhs);
};

} // namespace YAML
