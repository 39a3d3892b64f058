/// @file error.hpp
/// @brief Error types for the jsonpatch-cpp library.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace jsonpatch_cpp {

/// Categories of errors that can occur in the library.
enum class ErrorKind : std::uint8_t {
    malformed_pointer,    ///< Pointer text violates RFC 6901 syntax.
    path_not_found,       ///< A required segment of a pointer does not exist.
    invalid_array_index,  ///< Non-numeric, out-of-range or misplaced "-" index.
    invalid_move,         ///< A move targets its own source or a descendant of it.
    test_failed,          ///< A test operation's comparison did not hold.
    unknown_operation,    ///< A patch names an op outside the six RFC 6902 kinds.
    malformed_patch,      ///< The patch document does not match the operation schema.
    malformed_document,   ///< Input text is not a valid JSON or YAML document.
    io_error,             ///< A file could not be read, matched or written.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::malformed_pointer:   return "malformed_pointer";
        case ErrorKind::path_not_found:      return "path_not_found";
        case ErrorKind::invalid_array_index: return "invalid_array_index";
        case ErrorKind::invalid_move:        return "invalid_move";
        case ErrorKind::test_failed:         return "test_failed";
        case ErrorKind::unknown_operation:   return "unknown_operation";
        case ErrorKind::malformed_patch:     return "malformed_patch";
        case ErrorKind::malformed_document:  return "malformed_document";
        case ErrorKind::io_error:            return "io_error";
    }
    return "unknown";
}

/// A structured error with a category and a human-readable message.
struct Error {
    ErrorKind kind;      ///< The category of this error.
    std::string message; ///< A human-readable description.

    /// Construct an Error with the given kind and message.
    Error(ErrorKind k, std::string msg)
        : kind{k}, message{std::move(msg)} {}

    auto operator==(const Error& other) const -> bool = default;
};

/// Exception thrown by every fallible operation in the library.
///
/// what() returns the message of the carried Error.
class PatchError : public std::runtime_error {
public:
    explicit PatchError(Error error)
        : std::runtime_error{error.message}, error_{std::move(error)} {}

    PatchError(ErrorKind kind, std::string message)
        : PatchError{Error{kind, std::move(message)}} {}

    auto kind() const noexcept -> ErrorKind { return error_.kind; }
    auto error() const noexcept -> const Error& { return error_; }

private:
    Error error_;
};

}  // namespace jsonpatch_cpp
