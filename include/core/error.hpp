#pragma once

#include <optional>
#include <string>
#include <utility>

namespace polydb {

/**
 * @brief Error categories surfaced by the connection/query core
 *
 * Formatted to plain text only at the outermost boundary
 * (CLI, UI dispatcher) via Result::error_message().
 */
enum class ErrorCode {
    NONE,
    CONNECTION_NOT_FOUND,
    CONNECT_ERROR,
    QUERY_EXECUTION_ERROR,
    UNSUPPORTED_OPERATION,
    PARSE_ERROR,
    INVALID_ARGUMENT,
    INTERNAL_ERROR
};

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

    static Result error(ErrorCode code, std::string message) {
        Result r;
        r.success_ = false;
        r.error_code_ = code;
        r.error_message_ = std::move(message);
        return r;
    }

    /**
     * @brief Re-wrap the error of another Result (must be an error)
     */
    template<typename U>
    static Result propagate(const Result<U>& other) {
        return error(other.error_code(), other.error_message());
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    ErrorCode error_code() const { return error_code_; }
    const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorCode error_code_ = ErrorCode::NONE;
    std::string error_message_;
};

/**
 * @brief Result for operations with no value (disconnect, switch_database)
 */
template<>
class Result<void> {
public:
    static Result ok() {
        Result r;
        r.success_ = true;
        return r;
    }

    static Result error(ErrorCode code, std::string message) {
        Result r;
        r.success_ = false;
        r.error_code_ = code;
        r.error_message_ = std::move(message);
        return r;
    }

    template<typename U>
    static Result propagate(const Result<U>& other) {
        return error(other.error_code(), other.error_message());
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    ErrorCode error_code() const { return error_code_; }
    const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    ErrorCode error_code_ = ErrorCode::NONE;
    std::string error_message_;
};

using Status = Result<void>;

} // namespace polydb
