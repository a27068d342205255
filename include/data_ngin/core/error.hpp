// include/data_ngin/core/error.hpp

#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace data_ngin {

/**
 * @brief Error codes raised by the downloader
 *
 * Run-level codes abort a batch before any instrument is touched,
 * instrument-level codes are turned into outcome records.
 */
enum class ErrorCode {
    NONE = 0,
    UNKNOWN_ERROR = 1,
    INVALID_ARGUMENT = 2,

    // Run-level (fatal)
    CONFIGURATION_ERROR = 10,
    UNSUPPORTED_COMBINATION = 11,

    // Instrument-level
    PROVIDER_UNAVAILABLE = 20,
    EMPTY_RESULT = 21,
    WRITE_FAILURE = 22,

    // File and I/O errors
    FILE_NOT_FOUND = 30,
    FILE_IO_ERROR = 31,

    // Parsing errors
    JSON_PARSE_ERROR = 40,
    CONVERSION_ERROR = 41,
};

inline std::string error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE:
            return "NONE";
        case ErrorCode::UNKNOWN_ERROR:
            return "UNKNOWN_ERROR";
        case ErrorCode::INVALID_ARGUMENT:
            return "INVALID_ARGUMENT";
        case ErrorCode::CONFIGURATION_ERROR:
            return "CONFIGURATION_ERROR";
        case ErrorCode::UNSUPPORTED_COMBINATION:
            return "UNSUPPORTED_COMBINATION";
        case ErrorCode::PROVIDER_UNAVAILABLE:
            return "PROVIDER_UNAVAILABLE";
        case ErrorCode::EMPTY_RESULT:
            return "EMPTY_RESULT";
        case ErrorCode::WRITE_FAILURE:
            return "WRITE_FAILURE";
        case ErrorCode::FILE_NOT_FOUND:
            return "FILE_NOT_FOUND";
        case ErrorCode::FILE_IO_ERROR:
            return "FILE_IO_ERROR";
        case ErrorCode::JSON_PARSE_ERROR:
            return "JSON_PARSE_ERROR";
        case ErrorCode::CONVERSION_ERROR:
            return "CONVERSION_ERROR";
        default:
            return "UNKNOWN";
    }
}

/**
 * @brief Error carried by a failed Result
 */
class DataError : public std::runtime_error {
public:
    /**
     * @param code The error code
     * @param message Detailed error message
     * @param component Component where error occurred
     */
    DataError(ErrorCode code, const std::string& message, const std::string& component = "")
        : std::runtime_error(message), code_(code), component_(component) {}

    ErrorCode code() const noexcept {
        return code_;
    }

    const std::string& component() const noexcept {
        return component_;
    }

    /**
     * @brief Formatted error string, e.g. "Error in Sequencer: ... (EMPTY_RESULT)"
     */
    std::string to_string() const {
        return "Error in " + component_ + ": " + what() + " (" + error_code_to_string(code_) +
               ")";
    }

private:
    ErrorCode code_;
    std::string component_;
};

/**
 * @brief Result type for operations that can fail
 * @tparam T The type of the successful result, must be default constructible
 */
template <typename T>
class Result {
public:
    template <typename U = T>
    Result(U&& value) : value_(std::forward<U>(value)), error_(nullptr) {}

    Result(std::unique_ptr<DataError> error) : error_(std::move(error)) {}

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
     * @throws DataError if result represents an error
     */
    const T& value() const {
        if (error_)
            throw *error_;
        return value_;
    }

    /**
     * @brief Move the success value out of the result
     * @throws DataError if result represents an error
     */
    T take_value() {
        if (error_)
            throw *error_;
        return std::move(value_);
    }

    /**
     * @brief Get the error if present
     * @return Pointer to the error, or nullptr on success
     */
    const DataError* error() const {
        return error_.get();
    }

private:
    T value_;
    std::unique_ptr<DataError> error_;
};

// Specialization for void
template <>
class Result<void> {
public:
    Result() : error_(nullptr) {}
    Result(std::unique_ptr<DataError> error) : error_(std::move(error)) {}

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

    const DataError* error() const {
        return error_.get();
    }

private:
    std::unique_ptr<DataError> error_;
};

/**
 * @brief Helper for creating error results
 * @tparam T The type of the successful result
 * @param code The error code
 * @param message The error message
 * @param component The component where error occurred
 */
template <typename T>
Result<T> make_error(ErrorCode code, const std::string& message,
                     const std::string& component = "") {
    return Result<T>(std::make_unique<DataError>(code, message, component));
}

/**
 * @brief Re-raise the error of one result as the error of another result type,
 * keeping code and message and tagging it with the forwarding component
 */
template <typename T, typename U>
Result<T> forward_error(const Result<U>& failed, const std::string& component) {
    const DataError* err = failed.error();
    return make_error<T>(err->code(), err->what(),
                         err->component().empty() ? component : err->component());
}

}  // namespace data_ngin
