/**
 * @file error.hpp
 * @brief tempest error handling.
 *
 * Provides both error-code-based handling (used by every decode path, which
 * must never throw on malformed input) and exception-based convenience
 * wrappers, the latter compiled out with TEMPEST_NO_EXCEPTIONS=1.
 */

#ifndef TEMPEST_ERROR_HPP
#define TEMPEST_ERROR_HPP

#include "config.hpp"

#if !TEMPEST_NO_EXCEPTIONS
#include <stdexcept>
#include <string>
#endif

namespace tempest {

/**
 * @brief Error codes for error-code-based error handling.
 */
enum class Error {
    Ok = 0,                 ///< Success
    MissingField = -1,      ///< A required field was absent
    UnrecognizedCode = -2,  ///< An enumerated integer code was out of range
    UnrecognizedLabel = -3, ///< A label token was not in the known set
    InvalidArg = -4,        ///< Invalid argument or configuration value
    InvalidData = -5,       ///< Malformed wire data
    Io = -6                 ///< Socket or file failure
};

/**
 * @brief Get error message for error code.
 * @param error Error code
 * @return Human-readable error message
 */
inline const char* error_string(Error error) noexcept {
    switch (error) {
    case Error::Ok:
        return "Success";
    case Error::MissingField:
        return "Missing required field";
    case Error::UnrecognizedCode:
        return "Unrecognized enumerated code";
    case Error::UnrecognizedLabel:
        return "Unrecognized label";
    case Error::InvalidArg:
        return "Invalid argument";
    case Error::InvalidData:
        return "Invalid or malformed data";
    case Error::Io:
        return "I/O failure";
    default:
        return "Unknown error";
    }
}

#if !TEMPEST_NO_EXCEPTIONS

/**
 * @brief Base exception for tempest errors.
 */
class TempestException : public std::runtime_error {
public:
    explicit TempestException(const std::string& message, Error code = Error::InvalidArg)
        : std::runtime_error(message), error_code_(code) {}

    Error code() const noexcept {
        return error_code_;
    }

private:
    Error error_code_;
};

/**
 * @brief Exception for invalid arguments and configuration.
 */
class InvalidArgumentException : public TempestException {
public:
    explicit InvalidArgumentException(const std::string& message)
        : TempestException(message, Error::InvalidArg) {}
};

/**
 * @brief Exception for undecodable message content.
 */
class DecodeException : public TempestException {
public:
    DecodeException(const std::string& message, Error code)
        : TempestException(message, code) {}
};

#endif // !TEMPEST_NO_EXCEPTIONS

} // namespace tempest

#endif // TEMPEST_ERROR_HPP
