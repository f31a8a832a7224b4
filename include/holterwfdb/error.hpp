/**
 * @file error.hpp
 * @brief holterwfdb error handling.
 *
 * Error codes for byte-level helpers and the exception hierarchy thrown
 * by file-level operations.
 */

#ifndef HOLTERWFDB_ERROR_HPP
#define HOLTERWFDB_ERROR_HPP

#include "config.hpp"

#include <stdexcept>
#include <string>

namespace holterwfdb {

/**
 * @brief Error codes carried by every HolterException.
 */
enum class Error {
    Ok = 0,           ///< Success
    InvalidArg = -1,  ///< Invalid argument
    Format = -2,      ///< Input recording does not match the binary layout
    Read = -3,        ///< Input file cannot be read
    Write = -4,       ///< Output file or directory cannot be written
    InvalidData = -5  ///< Invalid/corrupted interchange data
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
    case Error::Format:
        return "Invalid recording format";
    case Error::Read:
        return "Read failure";
    case Error::Write:
        return "Write failure";
    case Error::InvalidData:
        return "Invalid or corrupted data";
    default:
        return "Unknown error";
    }
}

/**
 * @brief Base exception for holterwfdb errors.
 */
class HolterException : public std::runtime_error {
public:
    explicit HolterException(const std::string& message, Error code = Error::InvalidArg)
        : std::runtime_error(message), error_code_(code) {}

    Error code() const noexcept {
        return error_code_;
    }

private:
    Error error_code_;
};

/**
 * @brief Exception for invalid arguments.
 */
class InvalidArgumentException : public HolterException {
public:
    explicit InvalidArgumentException(const std::string& message)
        : HolterException(message, Error::InvalidArg) {}
};

/**
 * @brief Recording is smaller than header plus footer.
 */
class FormatException : public HolterException {
public:
    explicit FormatException(const std::string& message)
        : HolterException(message, Error::Format) {}
};

/**
 * @brief Input file cannot be opened or read.
 */
class ReadException : public HolterException {
public:
    explicit ReadException(const std::string& message)
        : HolterException(message, Error::Read) {}
};

/**
 * @brief Output directory or file cannot be created or written.
 */
class WriteException : public HolterException {
public:
    explicit WriteException(const std::string& message)
        : HolterException(message, Error::Write) {}
};

/**
 * @brief Exception for invalid/corrupted interchange data.
 */
class InvalidDataException : public HolterException {
public:
    explicit InvalidDataException(const std::string& message)
        : HolterException(message, Error::InvalidData) {}
};

} // namespace holterwfdb

#endif // HOLTERWFDB_ERROR_HPP
