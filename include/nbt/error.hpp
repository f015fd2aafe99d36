/**
 * @file error.hpp
 * @brief NBT error handling.
 *
 * Every decoding step reports an Error code. The throwing front end maps
 * those codes onto the exception hierarchy below, which is compiled out
 * with NBT_NO_EXCEPTIONS=1.
 */

#ifndef NBT_ERROR_HPP
#define NBT_ERROR_HPP

#include "config.hpp"

#if !NBT_NO_EXCEPTIONS
#include <stdexcept>
#include <string>
#endif

namespace nbt {

/**
 * @brief Error codes returned by the reader and the decoder.
 */
enum class Error {
    Ok = 0,              ///< Success
    InvalidArg = -1,     ///< Invalid argument or configuration
    Overflow = -2,       ///< Fixed-capacity destination too small
    Underflow = -3,      ///< Stream ended before a value was complete
    InvalidData = -4,    ///< Invalid/corrupted compressed data
    IoFailure = -5,      ///< Underlying stream reported a failure
    TypeMismatch = -6,   ///< Tag cannot be stored in the destination kind
    UnknownField = -7,   ///< Compound entry has no matching destination field
    UnhandledTag = -8,   ///< Tag value unknown or not supported
    UnexpectedEnd = -9,  ///< TAG_End outside a compound terminator position
    DepthExceeded = -10, ///< Nesting deeper than the configured limit
    NotPortable = -11    ///< Destination is a platform-width integer
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
    case Error::Overflow:
        return "Destination too small";
    case Error::Underflow:
        return "Unexpected end of stream";
    case Error::InvalidData:
        return "Invalid or corrupted data";
    case Error::IoFailure:
        return "Stream read failure";
    case Error::TypeMismatch:
        return "Tag does not match destination type";
    case Error::UnknownField:
        return "Unknown compound field";
    case Error::UnhandledTag:
        return "Unhandled tag";
    case Error::UnexpectedEnd:
        return "Unexpected end tag";
    case Error::DepthExceeded:
        return "Nesting too deep";
    case Error::NotPortable:
        return "Platform-width integer destination";
    default:
        return "Unknown error";
    }
}

#if !NBT_NO_EXCEPTIONS

/**
 * @brief Base exception for NBT errors.
 */
class NbtException : public std::runtime_error {
public:
    explicit NbtException(const std::string& message, Error code = Error::InvalidArg)
        : std::runtime_error(message), error_code_(code) {}

    Error code() const noexcept {
        return error_code_;
    }

private:
    Error error_code_;
};

/**
 * @brief Exception for invalid arguments and reader configuration.
 */
class InvalidArgumentException : public NbtException {
public:
    explicit InvalidArgumentException(const std::string& message)
        : NbtException(message, Error::InvalidArg) {}
};

/**
 * @brief Exception for invalid/corrupted compressed data.
 */
class InvalidDataException : public NbtException {
public:
    explicit InvalidDataException(const std::string& message)
        : NbtException(message, Error::InvalidData) {}
};

/**
 * @brief Exception for a stream that ended early.
 */
class UnderflowException : public NbtException {
public:
    explicit UnderflowException(const std::string& message)
        : NbtException(message, Error::Underflow) {}
};

/**
 * @brief Exception for a failing input stream.
 */
class IoException : public NbtException {
public:
    explicit IoException(const std::string& message)
        : NbtException(message, Error::IoFailure) {}
};

/**
 * @brief Exception for a byte array larger than its fixed destination.
 */
class OverflowException : public NbtException {
public:
    explicit OverflowException(const std::string& message)
        : NbtException(message, Error::Overflow) {}
};

/**
 * @brief Exception for a stream whose shape does not fit the destination.
 *
 * Raised for TypeMismatch, UnknownField, UnhandledTag and NotPortable.
 */
class ShapeException : public NbtException {
public:
    ShapeException(const std::string& message, Error code) : NbtException(message, code) {}
};

/**
 * @brief Exception for structural errors (misplaced TAG_End, nesting limit).
 */
class StructureException : public NbtException {
public:
    StructureException(const std::string& message, Error code) : NbtException(message, code) {}
};

/**
 * @brief Throw the exception matching an error code.
 *
 * @param error Error code, must not be Error::Ok
 * @param message Diagnostic text carried by the exception
 */
[[noreturn]] inline void throw_error(Error error, const std::string& message) {
    switch (error) {
    case Error::InvalidData:
        throw InvalidDataException(message);
    case Error::Underflow:
        throw UnderflowException(message);
    case Error::IoFailure:
        throw IoException(message);
    case Error::Overflow:
        throw OverflowException(message);
    case Error::TypeMismatch:
    case Error::UnknownField:
    case Error::UnhandledTag:
    case Error::NotPortable:
        throw ShapeException(message, error);
    case Error::UnexpectedEnd:
    case Error::DepthExceeded:
        throw StructureException(message, error);
    case Error::Ok:
    case Error::InvalidArg:
    default:
        throw InvalidArgumentException(message);
    }
}

#endif // !NBT_NO_EXCEPTIONS

} // namespace nbt

#endif // NBT_ERROR_HPP
