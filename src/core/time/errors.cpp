#include <timeutil/core/time/errors.hpp>
#include <utility>

namespace TimeUtil {

const char* toString(ParseErrorKind kind) {
    switch (kind) {
        case ParseErrorKind::MALFORMED:        return "MALFORMED";
        case ParseErrorKind::OUT_OF_RANGE:     return "OUT_OF_RANGE";
        case ParseErrorKind::AMBIGUOUS_OFFSET: return "AMBIGUOUS_OFFSET";
        default:                               return "UNKNOWN";
    }
}

const char* toString(ZoneErrorKind kind) {
    switch (kind) {
        case ZoneErrorKind::UNKNOWN_ZONE:           return "UNKNOWN_ZONE";
        case ZoneErrorKind::AMBIGUOUS_LOCAL_TIME:   return "AMBIGUOUS_LOCAL_TIME";
        case ZoneErrorKind::NONEXISTENT_LOCAL_TIME: return "NONEXISTENT_LOCAL_TIME";
        case ZoneErrorKind::OUT_OF_RANGE:           return "OUT_OF_RANGE";
        default:                                    return "UNKNOWN";
    }
}

const char* toString(ArithmeticErrorKind kind) {
    switch (kind) {
        case ArithmeticErrorKind::OUT_OF_RANGE: return "OUT_OF_RANGE";
        default:                                return "UNKNOWN";
    }
}

ParseError ParseError::malformed(size_t position, std::string found, std::string expected) {
    ParseError e;
    e.kind = ParseErrorKind::MALFORMED;
    e.field = std::move(found);
    e.position = position;
    e.detail = std::move(expected);
    return e;
}

ParseError ParseError::outOfRange(size_t position, std::string field, std::string detail) {
    ParseError e;
    e.kind = ParseErrorKind::OUT_OF_RANGE;
    e.field = std::move(field);
    e.position = position;
    e.detail = std::move(detail);
    return e;
}

ParseError ParseError::ambiguousOffset(std::string detail) {
    ParseError e;
    e.kind = ParseErrorKind::AMBIGUOUS_OFFSET;
    e.field = "offset";
    e.detail = std::move(detail);
    return e;
}

std::string ParseError::message() const {
    std::string msg = toString(kind);
    switch (kind) {
        case ParseErrorKind::MALFORMED:
            msg += " at position " + std::to_string(position);
            msg += field.empty() ? ": unexpected end of input" : ": unexpected '" + field + "'";
            break;
        case ParseErrorKind::OUT_OF_RANGE:
            msg += " at position " + std::to_string(position) + ": " + field;
            break;
        case ParseErrorKind::AMBIGUOUS_OFFSET:
            break;
    }
    if (!detail.empty()) {
        msg += " (" + detail + ")";
    }
    return msg;
}

std::string ZoneError::message() const {
    std::string msg = std::string(toString(kind)) + ": '" + zone + "'";
    if (!detail.empty()) {
        msg += " (" + detail + ")";
    }
    return msg;
}

std::string ArithmeticError::message() const {
    std::string msg = toString(kind);
    if (!detail.empty()) {
        msg += ": " + detail;
    }
    return msg;
}

} // namespace TimeUtil
