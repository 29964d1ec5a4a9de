#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace schemagraph {

/**
 * @brief Error categories for schema analysis
 */
enum class ErrorCategory {
    NONE,
    INVALID_SCHEMA,
    CONFIG_ERROR,
    IO_ERROR,
    INTERNAL_ERROR
};

[[nodiscard]] inline const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE: return "NONE";
        case ErrorCategory::INVALID_SCHEMA: return "INVALID_SCHEMA";
        case ErrorCategory::CONFIG_ERROR: return "CONFIG_ERROR";
        case ErrorCategory::IO_ERROR: return "IO_ERROR";
        case ErrorCategory::INTERNAL_ERROR: return "INTERNAL_ERROR";
    }
    return "UNKNOWN";
}

/**
 * @brief Result type for operations that can fail
 */
template<typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.success_ = true;
        r.value_ = std::move(value);
        return r;
    }

    static Result error(ErrorCategory category, std::string message) {
        Result r;
        r.success_ = false;
        r.error_category_ = category;
        r.error_message_ = std::move(message);
        return r;
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    ErrorCategory error_category() const { return error_category_; }
    const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorCategory error_category_ = ErrorCategory::NONE;
    std::string error_message_;
};

/**
 * @brief Raised when a schema description violates the SchemaModel invariants
 *
 * Collects every problem found in one validation pass so callers can report
 * them all at once. The first problem becomes what().
 */
class InvalidSchemaError : public std::runtime_error {
public:
    explicit InvalidSchemaError(std::vector<std::string> problems)
        : std::runtime_error(problems.empty() ? "invalid schema" : "invalid schema: " + problems.front()),
          problems_(std::move(problems)) {}

    explicit InvalidSchemaError(const std::string& problem)
        : InvalidSchemaError(std::vector<std::string>{problem}) {}

    [[nodiscard]] const std::vector<std::string>& problems() const { return problems_; }

private:
    std::vector<std::string> problems_;
};

} // namespace schemagraph
