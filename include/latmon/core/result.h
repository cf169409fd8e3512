#ifndef LATMON_CORE_RESULT_H_
#define LATMON_CORE_RESULT_H_

#include <string>
#include <optional>
#include <memory>
#include <stdexcept>
#include <utility>
#include "latmon/core/error.h"

namespace latmon {
namespace core {

/**
 * @brief Result type for operations that can fail
 *
 * Usage:
 * ```
 * Result<size_t> count() {
 *     if (error_condition) {
 *         return Result<size_t>::error("window start must precede end",
 *                                      Error::Code::QUERY_FAILURE);
 *     }
 *     return Result<size_t>(42);
 * }
 *
 * auto result = count();
 * if (result.ok()) {
 *     size_t value = result.value();
 * } else {
 *     std::string error = result.error();
 * }
 * ```
 */
template<typename T>
class Result {
public:
    Result(T value) : value_(std::move(value)), error_msg_(std::nullopt), code_(Error::Code::UNKNOWN) {}

    explicit Result(const Error& error)
        : value_(std::nullopt), error_msg_(std::string(error.what())), code_(error.code()) {}

    struct ErrorTag {};
    explicit Result(std::string error_msg, Error::Code code, ErrorTag)
        : value_(std::nullopt), error_msg_(std::move(error_msg)), code_(code) {}

    Result(Result&& other) noexcept
        : value_(std::move(other.value_)), error_msg_(std::move(other.error_msg_)), code_(other.code_) {}

    Result& operator=(Result&& other) noexcept {
        if (this != &other) {
            value_ = std::move(other.value_);
            error_msg_ = std::move(other.error_msg_);
            code_ = other.code_;
        }
        return *this;
    }

    // Result is move-only
    Result(const Result&) = delete;
    Result& operator=(const Result&) = delete;

    bool ok() const { return !error_msg_.has_value(); }
    std::string error() const {
        if (!error_msg_) {
            throw std::runtime_error("Attempting to access error of ok result");
        }
        return *error_msg_;
    }
    Error::Code error_code() const { return code_; }

    const T& value() const {
        if (!value_) {
            throw std::runtime_error("Attempting to access value of failed result: " + *error_msg_);
        }
        return *value_;
    }
    T&& take_value() {
        if (!value_) {
            throw std::runtime_error("Attempting to take value of failed result: " + *error_msg_);
        }
        return std::move(*value_);
    }

    static Result<T> error(const std::string& message, Error::Code code = Error::Code::UNKNOWN) {
        return Result<T>(message, code, ErrorTag{});
    }

private:
    std::optional<T> value_;
    std::optional<std::string> error_msg_;
    Error::Code code_;
};

/**
 * @brief Specialization for void results
 */
template<>
class Result<void> {
public:
    Result() : error_msg_(std::nullopt), code_(Error::Code::UNKNOWN) {}
    explicit Result(const Error& error)
        : error_msg_(std::string(error.what())), code_(error.code()) {}

    struct ErrorTag {};
    explicit Result(std::string error_msg, Error::Code code, ErrorTag)
        : error_msg_(std::move(error_msg)), code_(code) {}

    bool ok() const { return !error_msg_.has_value(); }
    std::string error() const {
        if (!error_msg_) {
            throw std::runtime_error("Attempting to access error of ok result");
        }
        return *error_msg_;
    }
    Error::Code error_code() const { return code_; }

    static Result<void> error(const std::string& message, Error::Code code = Error::Code::UNKNOWN) {
        return Result<void>(message, code, ErrorTag{});
    }

private:
    std::optional<std::string> error_msg_;
    Error::Code code_;
};

} // namespace core
} // namespace latmon

#endif // LATMON_CORE_RESULT_H_
