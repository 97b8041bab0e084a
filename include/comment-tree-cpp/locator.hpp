/// @file locator.hpp
/// @brief Schema-agnostic search for the comment collection inside an
/// arbitrarily shaped document.
///
/// The search is a deterministic depth-first walk. Arrays are judged by
/// their first element only. Objects try the keys `nodes`, `comments`
/// and `feedback` (in that order) before every other key. The other keys
/// are visited with array-index keys ("0", "10", ...) first in ascending
/// numeric order, then the rest in document order. The first array
/// judged comment-like wins; nothing below a match is inspected.

#pragma once

#include <comment-tree-cpp/types.hpp>

#include <array>
#include <optional>
#include <string_view>

namespace comment_tree_cpp {

/// Keys searched before any other key of an object, in this order.
inline constexpr std::array<std::string_view, 3> priority_keys = {
    "nodes", "comments", "feedback",
};

/// True if `sample` is an object with an `id`, at least one of `body`,
/// `author` or `message`, and no `comet_sections` (which marks a post
/// or story rather than a comment).
auto looks_like_comment(const Json& sample) -> bool;

/// Locate the first comment collection and return its JSON Pointer.
/// @return The pointer (empty pointer if `value` itself matches), or
///         nullopt if no array anywhere qualifies.
auto find_comment_collection_path(const Json& value) -> std::optional<JsonPointer>;

/// Locate the first comment collection and return a copy of it.
/// @return The matched array, or nullopt if none qualifies.
auto find_comment_collection(const Json& value) -> std::optional<Json>;

}  // namespace comment_tree_cpp
