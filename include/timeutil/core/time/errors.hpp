#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace TimeUtil {

enum class ParseErrorKind : uint8_t {
    MALFORMED = 0,          // Input does not match the accepted grammar
    OUT_OF_RANGE = 1,       // Well-formed, but a field or the result is out of bounds
    AMBIGUOUS_OFFSET = 2    // No offset in the input and the policy cannot supply one
};

enum class ZoneErrorKind : uint8_t {
    UNKNOWN_ZONE = 0,
    AMBIGUOUS_LOCAL_TIME = 1,    // Wall time occurs twice (DST fall-back)
    NONEXISTENT_LOCAL_TIME = 2,  // Wall time skipped (DST spring-forward)
    OUT_OF_RANGE = 3
};

enum class ArithmeticErrorKind : uint8_t {
    OUT_OF_RANGE = 0
};

const char* toString(ParseErrorKind kind);
const char* toString(ZoneErrorKind kind);
const char* toString(ArithmeticErrorKind kind);

/**
 * @struct ParseError
 * @brief Text codec failure.
 *
 * `field` names the offending calendar field ("month", "offset", ...) or,
 * for MALFORMED, holds the unexpected substring. `position` is the byte
 * offset in the input where the problem was detected.
 */
struct ParseError {
    ParseErrorKind kind = ParseErrorKind::MALFORMED;
    std::string field;
    size_t position = 0;
    std::string detail;

    static ParseError malformed(size_t position, std::string found, std::string expected);
    static ParseError outOfRange(size_t position, std::string field, std::string detail);
    static ParseError ambiguousOffset(std::string detail);

    std::string message() const;
};

/**
 * @struct ZoneError
 * @brief Zone resolution failure; `zone` is the identifier as given.
 */
struct ZoneError {
    ZoneErrorKind kind = ZoneErrorKind::UNKNOWN_ZONE;
    std::string zone;
    std::string detail;

    std::string message() const;
};

struct ArithmeticError {
    ArithmeticErrorKind kind = ArithmeticErrorKind::OUT_OF_RANGE;
    std::string detail;

    std::string message() const;
};

} // namespace TimeUtil
