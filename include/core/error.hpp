#pragma once

#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace mysql2pg {

/**
 * @brief Which stage or resource a failure came from
 */
enum class ErrorCategory {
    NONE,
    PARSE_ERROR,
    IO_ERROR,
    CONFIG_ERROR,
    LOAD_ERROR,
    INTERNAL_ERROR
};

[[nodiscard]] inline std::string_view error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:           return "none";
        case ErrorCategory::PARSE_ERROR:    return "parse_error";
        case ErrorCategory::IO_ERROR:       return "io_error";
        case ErrorCategory::CONFIG_ERROR:   return "config_error";
        case ErrorCategory::LOAD_ERROR:     return "load_error";
        case ErrorCategory::INTERNAL_ERROR: return "internal_error";
        default: return "unknown";
    }
}

struct Error {
    ErrorCategory category = ErrorCategory::NONE;
    std::string message;
};

/**
 * @brief Value or categorized failure returned by every converter stage
 *
 * Exactly one of value_ / error_ is engaged.
 */
template<typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.value_.emplace(std::move(value));
        return r;
    }

    static Result error(ErrorCategory category, std::string message) {
        Result r;
        r.error_ = Error{category, std::move(message)};
        return r;
    }

    // Carries another Result's failure across a type change
    template<typename U>
    static Result from_error(const Result<U>& other) {
        return error(other.error_category(), other.error_message());
    }

    [[nodiscard]] bool is_ok() const { return value_.has_value(); }
    [[nodiscard]] bool is_error() const { return !value_.has_value(); }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    ErrorCategory error_category() const { return error_.category; }
    const std::string& error_message() const { return error_.message; }

    // "load_error: connection refused"
    [[nodiscard]] std::string describe() const {
        if (is_ok()) return "ok";
        return std::format("{}: {}", error_category_to_string(error_.category), error_.message);
    }

private:
    std::optional<T> value_;
    Error error_;
};

} // namespace mysql2pg
