#ifndef BITSDB_CORE_ERROR_H_
#define BITSDB_CORE_ERROR_H_

#include <stdexcept>
#include <string>

namespace bitsdb {
namespace core {

/**
 * @brief Base class for all bitsdb errors
 */
class Error : public std::runtime_error {
public:
    enum class Code {
        UNKNOWN = 0,
        INVALID_ARGUMENT = 1,
        NOT_FOUND = 2,
        ALREADY_EXISTS = 3,
        TIMEOUT = 4,
        RESOURCE_EXHAUSTED = 5,
        INTERNAL = 6,
        ABORTED = 7
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

/**
 * @brief Returns a stable name for an error code ("NOT_FOUND", ...)
 */
const char* code_name(Error::Code code);

/**
 * @brief True for codes a caller may resolve by retrying the whole operation
 */
inline bool is_retryable(Error::Code code) {
    return code == Error::Code::ABORTED || code == Error::Code::TIMEOUT;
}

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
 * @brief Malformed input detected before any write (bad timestamps, empty
 * updates, missing value on cell creation, inverted intervals)
 */
class ValidationError : public InvalidArgumentError {
public:
    explicit ValidationError(const std::string& message)
        : InvalidArgumentError(message) {}
    explicit ValidationError(const char* message)
        : InvalidArgumentError(message) {}
};

/**
 * @brief Error indicating resource not found
 */
class NotFoundError : public Error {
public:
    explicit NotFoundError(const std::string& message)
        : Error(message, Code::NOT_FOUND) {}
    explicit NotFoundError(const char* message)
        : Error(message, Code::NOT_FOUND) {}
};

/**
 * @brief Unique constraint violation in the substrate
 */
class ConflictError : public Error {
public:
    explicit ConflictError(const std::string& message)
        : Error(message, Code::ALREADY_EXISTS) {}
    explicit ConflictError(const char* message)
        : Error(message, Code::ALREADY_EXISTS) {}
};

/**
 * @brief Error indicating operation timeout
 */
class TimeoutError : public Error {
public:
    explicit TimeoutError(const std::string& message)
        : Error(message, Code::TIMEOUT) {}
    explicit TimeoutError(const char* message)
        : Error(message, Code::TIMEOUT) {}
};

/**
 * @brief Lock timeout, deadlock or transient substrate failure. The whole
 * operation was rolled back and may be resubmitted.
 */
class RetryableTransactionError : public Error {
public:
    explicit RetryableTransactionError(const std::string& message)
        : Error(message, Code::ABORTED) {}
    explicit RetryableTransactionError(const char* message)
        : Error(message, Code::ABORTED) {}
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
} // namespace bitsdb

#endif // BITSDB_CORE_ERROR_H_
