/// @file comment.hpp
/// @brief CommentNode: the normalized shape of a single comment.

#pragma once

#include <comment-tree-cpp/types.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace comment_tree_cpp {

/// Label used when a comment carries no author name.
inline constexpr std::string_view unknown_author = "Unknown";

/// A comment after normalization.
///
/// Every upstream reply encoding collapses into `replies`, which keeps
/// the source order. Each reply is owned by its parent; the forest is a
/// tree, never a DAG.
struct CommentNode {
    Json id;                           ///< Opaque identity, any JSON scalar.
    std::string author{unknown_author}; ///< Display label.
    std::string text;                  ///< Body text, empty if absent.
    std::vector<CommentNode> replies;  ///< Nested replies in source order.

    auto operator==(const CommentNode& other) const -> bool = default;
};

/// An ordered sequence of comment trees.
using Forest = std::vector<CommentNode>;

// -- ADL serialization --------------------------------------------------------

/// Serialize as {"id", "author", "text", "replies"} in that order.
void to_json(Json& j, const CommentNode& node);

/// Read the flat output shape back. Missing fields take the defaults.
void from_json(const Json& j, CommentNode& node);

}  // namespace comment_tree_cpp
