/// @file report.hpp
/// @brief Progress and diagnostic reporting side channel.
///
/// Reporting never influences the extraction result; a Reporter only
/// observes it.

#pragma once

#include <cstdint>
#include <functional>
#include <string_view>

namespace comment_tree_cpp {

/// Severity of a reported message.
enum class Severity : std::uint8_t {
    info,     ///< Progress and counts.
    warning,  ///< A recognized but notable outcome.
    error,    ///< A failure that halted the run.
};

/// Convert a Severity to its string representation.
constexpr auto to_string_view(Severity severity) noexcept -> std::string_view {
    switch (severity) {
        case Severity::info:    return "info";
        case Severity::warning: return "warning";
        case Severity::error:   return "error";
    }
    return "unknown";
}

/// Receives human-readable messages emitted during a run.
using Reporter = std::function<void(Severity, std::string_view)>;

/// A Reporter writing info to stdout and warnings/errors to stderr.
/// @param quiet Suppress info messages.
auto stdio_reporter(bool quiet = false) -> Reporter;

/// A Reporter that discards everything.
auto null_reporter() -> Reporter;

}  // namespace comment_tree_cpp
