// include/tablewright/core/error.hpp

#pragma once

#include <exception>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace tablewright {

/**
 * @brief Error codes reported by tablewright components
 */
enum class ErrorCode {
    NONE = 0,
    UNKNOWN_ERROR = 1,
    INVALID_ARGUMENT = 2,

    // Table errors
    SCHEMA_ERROR = 3,
    INVALID_DATA = 4,
    CONVERSION_ERROR = 5,
    COLUMN_NOT_FOUND = 6,

    // Configuration errors
    CONFIGURATION_ERROR = 7,

    // File and I/O errors (collaborator side)
    FILE_NOT_FOUND = 8,
    FILE_IO_ERROR = 9,

    // JSON and parsing errors
    JSON_PARSE_ERROR = 10,

    // Custom error range
    CUSTOM_ERROR_START = 1000
};

inline std::string error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE:
            return "NONE";
        case ErrorCode::UNKNOWN_ERROR:
            return "UNKNOWN_ERROR";
        case ErrorCode::INVALID_ARGUMENT:
            return "INVALID_ARGUMENT";
        case ErrorCode::SCHEMA_ERROR:
            return "SCHEMA_ERROR";
        case ErrorCode::INVALID_DATA:
            return "INVALID_DATA";
        case ErrorCode::CONVERSION_ERROR:
            return "CONVERSION_ERROR";
        case ErrorCode::COLUMN_NOT_FOUND:
            return "COLUMN_NOT_FOUND";
        case ErrorCode::CONFIGURATION_ERROR:
            return "CONFIGURATION_ERROR";
        case ErrorCode::FILE_NOT_FOUND:
            return "FILE_NOT_FOUND";
        case ErrorCode::FILE_IO_ERROR:
            return "FILE_IO_ERROR";
        case ErrorCode::JSON_PARSE_ERROR:
            return "JSON_PARSE_ERROR";
        default:
            return "CUSTOM_ERROR";
    }
}

/**
 * @brief Exception type carried by failed results
 */
class TableError : public std::runtime_error {
public:
    /**
     * @brief Constructor for TableError
     * @param code The error code
     * @param message Detailed error message
     * @param component Component where error occurred
     */
    TableError(ErrorCode code, const std::string& message, const std::string& component = "")
        : std::runtime_error(message), code_(code), component_(component) {}

    ErrorCode code() const noexcept {
        return code_;
    }

    const std::string& component() const noexcept {
        return component_;
    }

    /**
     * @brief Convert error to string representation
     * @return Formatted error string
     */
    std::string to_string() const {
        return "Error in " + component_ + ": " + what() + " (Code: " + error_code_to_string(code_) +
               ")";
    }

private:
    ErrorCode code_;
    std::string component_;
};

/**
 * @brief Result type for operations that can fail
 * @tparam T The type of the successful result
 */
template <typename T>
class Result {
public:
    /**
     * @brief Constructor for success case
     * @param value The successful result
     */
    template <typename U = T>
    Result(U&& value) : value_(std::forward<U>(value)), error_(nullptr) {}

    /**
     * @brief Constructor for error case
     * @param error The error that occurred
     */
    Result(std::unique_ptr<TableError> error) : error_(std::move(error)) {}

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
     * @return Reference to the contained value
     * @throws TableError if result represents an error
     */
    const T& value() const {
        if (error_)
            throw *error_;
        return value_;
    }

    /**
     * @brief Move the success value out of the result
     * @throws TableError if result represents an error
     */
    T take_value() {
        if (error_)
            throw *error_;
        return std::move(value_);
    }

    /**
     * @brief Get the error if present
     * @return Pointer to the error, or nullptr if success
     */
    const TableError* error() const {
        return error_.get();
    }

private:
    T value_;
    std::unique_ptr<TableError> error_;
};

// Specialization for void
template <>
class Result<void> {
public:
    Result() : error_(nullptr) {}
    Result(std::unique_ptr<TableError> error) : error_(std::move(error)) {}

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

    const TableError* error() const {
        return error_.get();
    }

private:
    std::unique_ptr<TableError> error_;
};

/**
 * @brief Helper for creating error results
 * @tparam T The type of the successful result
 * @param code The error code
 * @param message The error message
 * @param component The component where error occurred
 * @return Result representing the error
 */
template <typename T>
Result<T> make_error(ErrorCode code, const std::string& message,
                     const std::string& component = "") {
    return Result<T>(std::make_unique<TableError>(code, message, component));
}

}  // namespace tablewright
