/// @file error.hpp
/// @brief Error types for the comment-tree-cpp library.

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace comment_tree_cpp {

/// Categories of errors that can occur while running an extraction.
enum class ErrorKind : std::uint8_t {
    input_absent,      ///< The input document could not be found or read.
    input_malformed,   ///< The input bytes are not valid JSON.
    output_failed,     ///< The result could not be written.
    invalid_argument,  ///< The command line or configuration is invalid.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::input_absent:     return "input_absent";
        case ErrorKind::input_malformed:  return "input_malformed";
        case ErrorKind::output_failed:    return "output_failed";
        case ErrorKind::invalid_argument: return "invalid_argument";
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

}  // namespace comment_tree_cpp
