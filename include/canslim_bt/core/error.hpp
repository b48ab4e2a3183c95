// include/canslim_bt/core/error.hpp

#pragma once

#include <memory>
#include <stdexcept>
#include <string>

namespace canslim_bt {

/**
 * @brief Error codes reported through Result
 */
enum class ErrorCode {
    NONE = 0,
    UNKNOWN_ERROR = 1,
    INVALID_ARGUMENT = 2,
    NOT_INITIALIZED = 3,

    // Data errors
    DATA_NOT_FOUND = 4,
    INVALID_DATA = 5,
    MISSING_COLUMN = 6,
    CONVERSION_ERROR = 7,

    // Simulation errors
    EMPTY_SCHEDULE = 8,
    EMPTY_CALENDAR = 9,

    // Strategy errors
    STRATEGY_ERROR = 10,
    UNKNOWN_STRATEGY = 11,

    // File and parsing errors
    FILE_NOT_FOUND = 12,
    FILE_IO_ERROR = 13,
    JSON_PARSE_ERROR = 14,

    // Concurrency errors
    THREAD_ERROR = 15
};

/**
 * @brief Error carried by a failed Result
 */
class CanslimError : public std::runtime_error {
public:
    CanslimError(ErrorCode code, const std::string& message, const std::string& component = "")
        : std::runtime_error(message), code_(code), component_(component) {}

    ErrorCode code() const noexcept {
        return code_;
    }

    const std::string& component() const noexcept {
        return component_;
    }

    /**
     * @brief Human readable form: "Error in <component>: <message> (Code: n)"
     */
    std::string to_string() const {
        return "Error in " + component_ + ": " + what() +
               " (Code: " + std::to_string(static_cast<int>(code_)) + ")";
    }

private:
    ErrorCode code_;
    std::string component_;
};

/**
 * @brief Value-or-error return type used across the library
 * @tparam T The type of the successful result
 */
template <typename T>
class Result {
public:
    template <typename U = T>
    Result(U&& value) : value_(std::forward<U>(value)), error_(nullptr) {}

    Result(std::unique_ptr<CanslimError> error) : error_(std::move(error)) {}

    Result(Result&& other) noexcept
        : value_(std::move(other.value_)), error_(std::move(other.error_)) {}

    Result& operator=(Result&& other) noexcept {
        if (this != &other) {
            value_ = std::move(other.value_);
            error_ = std::move(other.error_);
        }
        return *this;
    }

    Result(const Result&) = delete;
    Result& operator=(const Result&) = delete;

    bool is_ok() const {
        return error_ == nullptr;
    }

    bool is_error() const {
        return error_ != nullptr;
    }

    /**
     * @brief Get the success value
     * @throws CanslimError if the result holds an error
     */
    const T& value() const {
        if (error_)
            throw *error_;
        return value_;
    }

    /**
     * @brief Move the success value out
     * @throws CanslimError if the result holds an error
     */
    T take_value() {
        if (error_)
            throw *error_;
        return std::move(value_);
    }

    const CanslimError* error() const {
        return error_.get();
    }

private:
    T value_;
    std::unique_ptr<CanslimError> error_;
};

template <>
class Result<void> {
public:
    Result() : error_(nullptr) {}
    Result(std::unique_ptr<CanslimError> error) : error_(std::move(error)) {}

    bool is_ok() const {
        return error_ == nullptr;
    }
    bool is_error() const {
        return error_ != nullptr;
    }

    void value() const {
        if (error_)
            throw *error_;
    }

    const CanslimError* error() const {
        return error_.get();
    }

private:
    std::unique_ptr<CanslimError> error_;
};

/**
 * @brief Build an error Result
 * @param code The error code
 * @param message The error message
 * @param component The component where the error occurred
 */
template <typename T>
Result<T> make_error(ErrorCode code, const std::string& message,
                     const std::string& component = "") {
    return Result<T>(std::make_unique<CanslimError>(code, message, component));
}

}  // namespace canslim_bt
