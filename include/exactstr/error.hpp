/**
 * @file error.hpp
 * @brief exactstr error handling.
 *
 * Provides both exception-based and error-code-based error handling
 * for embedded compatibility (-fno-exceptions).
 *
 * @authors Georges Labreche <georges@tanagraspace.com>
 */

#ifndef EXACTSTR_ERROR_HPP
#define EXACTSTR_ERROR_HPP

#include "config.hpp"

#if !EXACTSTR_NO_EXCEPTIONS
#include <stdexcept>
#include <string>
#endif

namespace exactstr {

/**
 * @brief Error codes for error-code-based error handling.
 *
 * The buffer core only ever reports Ok or OutOfMemory.
 */
enum class Error {
    Ok = 0,          ///< Success
    InvalidArg = -1, ///< Invalid argument
    OutOfMemory = -2 ///< Allocation of an exact-fit block failed
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
    case Error::InvalidArg:
        return "Invalid argument";
    case Error::OutOfMemory:
        return "Allocation failure";
    default:
        return "Unknown error";
    }
}

#if !EXACTSTR_NO_EXCEPTIONS

/**
 * @brief Base exception for exactstr errors.
 */
class ExactStrException : public std::runtime_error {
public:
    explicit ExactStrException(const std::string& message, Error code = Error::InvalidArg)
        : std::runtime_error(message), error_code_(code) {}

    Error code() const noexcept {
        return error_code_;
    }

private:
    Error error_code_;
};

/**
 * @brief Exception for a failed exact-fit allocation.
 *
 * Thrown by the throwing conveniences (constructor, += and -=). The
 * buffer involved is left exactly as it was before the call.
 */
class AllocationException : public ExactStrException {
public:
    explicit AllocationException(const std::string& message)
        : ExactStrException(message, Error::OutOfMemory) {}
};

#endif // !EXACTSTR_NO_EXCEPTIONS

} // namespace exactstr

#endif // EXACTSTR_ERROR_HPP
