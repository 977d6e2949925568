#pragma once

#include <optional>
#include <utility>

namespace TimeUtil {

/**
 * @class Expected
 * @brief Value-or-error result returned by every fallible core operation.
 *
 * Exactly one of value() / error() is meaningful. Calling value() on an
 * error result throws std::bad_optional_access.
 */
template <typename T, typename E>
class Expected {
public:
    Expected(const T& value) : value_(value) {}
    Expected(T&& value) : value_(std::move(value)) {}
    Expected(const E& error) : error_(error) {}
    Expected(E&& error) : error_(std::move(error)) {}

    bool has_value() const { return value_.has_value(); }
    explicit operator bool() const { return has_value(); }

    T& value() { return value_.value(); }
    const T& value() const { return value_.value(); }

    // Only meaningful when has_value() is false.
    const E& error() const { return error_; }

    T value_or(T fallback) const {
        return value_.has_value() ? *value_ : std::move(fallback);
    }

private:
    std::optional<T> value_;
    E error_{};
};

} // namespace TimeUtil
