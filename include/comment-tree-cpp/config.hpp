/// @file config.hpp
/// @brief Run configuration and command-line parsing.

#pragma once

#include <comment-tree-cpp/error.hpp>

#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <variant>

namespace comment_tree_cpp {

/// Explicit configuration for one extraction run.
struct Config {
    std::filesystem::path input_path{"commentObject.json"};        ///< Source document.
    std::filesystem::path output_path{"structured_comments.json"}; ///< Result document.
    int indent{2};           ///< Spaces per level; -1 writes compact JSON.
    bool quiet{false};       ///< Suppress informational messages.
    bool show_help{false};   ///< Print usage and do nothing else.

    auto operator==(const Config&) const -> bool = default;
};

/// Parse command-line arguments (excluding the program name).
///
/// Accepts `-i/--input PATH`, `-o/--output PATH`, `--indent N`,
/// `--compact`, `-q/--quiet`, `-h/--help`, and up to two positional
/// arguments `INPUT [OUTPUT]`.
/// @return The configuration, or an invalid_argument Error.
auto parse_args(std::span<const std::string_view> args) -> std::variant<Config, Error>;

/// Usage text for the command-line tool.
auto usage(std::string_view program) -> std::string;

}  // namespace comment_tree_cpp
