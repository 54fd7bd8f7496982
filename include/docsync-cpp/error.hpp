/// @file error.hpp
/// @brief Error types for user input errors in docsync-cpp.
///
/// Internal invariant violations are not reported through these types;
/// they abort via ABSL_CHECK.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace docsync_cpp {

/// Categories of errors that can occur in the library.
enum class ErrorKind : std::uint8_t {
    invalid_timestamp,   ///< A timestamp's nanoseconds are out of range.
    invalid_field_path,  ///< A field path is empty or has an empty segment.
    invalid_key,         ///< A path does not name a document.
    decoding_error,      ///< A JSON representation could not be decoded.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::invalid_timestamp:  return "invalid_timestamp";
        case ErrorKind::invalid_field_path: return "invalid_field_path";
        case ErrorKind::invalid_key:        return "invalid_key";
        case ErrorKind::decoding_error:     return "decoding_error";
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

/// Thrown when a caller supplies malformed input.
class Exception : public std::runtime_error {
public:
    explicit Exception(Error error)
        : std::runtime_error{error.message}, error_{std::move(error)} {}

    Exception(ErrorKind kind, std::string message)
        : Exception{Error{kind, std::move(message)}} {}

    auto error() const -> const Error& { return error_; }
    auto kind() const -> ErrorKind { return error_.kind; }

private:
    Error error_;
};

}  // namespace docsync_cpp
