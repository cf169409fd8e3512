#ifndef LATMON_CORE_ERROR_H_
#define LATMON_CORE_ERROR_H_

#include <stdexcept>
#include <string>

namespace latmon {
namespace core {

/**
 * @brief Base class for all latmon errors
 */
class Error : public std::runtime_error {
public:
    enum class Code {
        UNKNOWN = 0,
        INVALID_ARGUMENT = 1,
        CAPTURE_FAILURE = 2,
        BUFFER_OVERFLOW = 3,
        COMMIT_FAILURE = 4,
        RETENTION_FAILURE = 5,
        QUERY_FAILURE = 6,
        STORAGE_INIT = 7,
        INTERNAL = 8
    };

    explicit Error(const std::string& message, Code code = Code::UNKNOWN)
        : std::runtime_error(message), code_(code) {}
    explicit Error(const char* message, Code code = Code::UNKNOWN)
        : std::runtime_error(message), code_(code) {}

    Code code() const { return code_; }
    const char* what() const noexcept override { return std::runtime_error::what(); }

private:
    Code code_;
};

const char* ErrorCodeName(Error::Code code);

/**
 * @brief Error indicating invalid arguments or parameters
 */
class InvalidArgumentError : public Error {
public:
    explicit InvalidArgumentError(const std::string& message)
        : Error(message, Code::INVALID_ARGUMENT) {}
    explicit InvalidArgumentError(const char* message)
        : Error(message, Code::INVALID_ARGUMENT) {}
};

/**
 * @brief Error indicating a malformed query (window, limit or component filter)
 */
class QueryError : public Error {
public:
    explicit QueryError(const std::string& message)
        : Error(message, Code::QUERY_FAILURE) {}
};

/**
 * @brief Error raised by the storage layer
 */
class StorageError : public Error {
public:
    explicit StorageError(const std::string& message, Code code = Code::COMMIT_FAILURE)
        : Error(message, code) {}
};

/**
 * @brief Error indicating internal error
 */
class InternalError : public Error {
public:
    explicit InternalError(const std::string& message)
        : Error(message, Code::INTERNAL) {}
    explicit InternalError(const char* message)
        : Error(message, Code::INTERNAL) {}
};

} // namespace core
} // namespace latmon

#endif // LATMON_CORE_ERROR_H_
