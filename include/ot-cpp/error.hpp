/// @file error.hpp
/// @brief Error types for the ot-cpp library.

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace ot_cpp {

/// Categories of per-operation rejections and lookup failures.
///
/// None of these is fatal to a document: a rejected operation leaves the
/// document state and the revision log untouched.
enum class ErrorKind : std::uint8_t {
    stale_revision,       ///< The base revision is negative, in the future, or compacted away.
    unauthorized,         ///< The client lacks the capability required for the request.
    malformed_operation,  ///< Position or length out of bounds, or author mismatch.
    session_closed,       ///< The submitting session disconnected before commit.
    unknown_document,     ///< No document with the given id is open.
    unknown_session,      ///< The client has not joined the document.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::stale_revision:      return "stale_revision";
        case ErrorKind::unauthorized:        return "unauthorized";
        case ErrorKind::malformed_operation: return "malformed_operation";
        case ErrorKind::session_closed:      return "session_closed";
        case ErrorKind::unknown_document:    return "unknown_document";
        case ErrorKind::unknown_session:     return "unknown_session";
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

}  // namespace ot_cpp
