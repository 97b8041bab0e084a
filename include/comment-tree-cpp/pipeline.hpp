/// @file pipeline.hpp
/// @brief End-to-end extraction: source document, search, normalize,
/// select roots, and sink.

#pragma once

#include <comment-tree-cpp/comment.hpp>
#include <comment-tree-cpp/config.hpp>
#include <comment-tree-cpp/error.hpp>
#include <comment-tree-cpp/report.hpp>
#include <comment-tree-cpp/types.hpp>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <variant>

namespace comment_tree_cpp {

/// Result of extracting threads from one parsed document.
struct ExtractionResult {
    std::optional<JsonPointer> collection_path;  ///< Where the collection was found.
    std::size_t top_level_count{0};              ///< Normalized entries before root selection.
    Forest threads;                              ///< Root threads, in source order.

    /// True if the search found a comment collection.
    auto found() const -> bool { return collection_path.has_value(); }
};

/// Run search, normalization and root selection on a parsed document.
auto extract_threads(const Json& document) -> ExtractionResult;

/// Build the sink value: a JSON array of threads.
auto to_output_json(const Forest& threads) -> Json;

/// Read and parse a JSON document from disk.
/// @return The document, an input_absent Error if the file cannot be
///         read, or an input_malformed Error if it is not valid JSON.
auto load_document(const std::filesystem::path& path) -> std::variant<Json, Error>;

/// Write a JSON value to disk, replacing any existing file atomically.
/// @param indent Spaces per level, or -1 for compact output.
/// @return nullopt on success, or an output_failed Error.
auto write_document(const std::filesystem::path& path, const Json& value,
                    int indent = 2) -> std::optional<Error>;

/// Run one extraction as configured, reporting progress.
///
/// All failures are reported once through `reporter` and returned; this
/// function does not throw. Nothing is written unless the input parsed.
/// A document without a comment collection is written as `[]`.
/// @return nullopt on success, or the Error that halted the run.
auto run(const Config& config, const Reporter& reporter) -> std::optional<Error>;

}  // namespace comment_tree_cpp
