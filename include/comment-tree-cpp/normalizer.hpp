/// @file normalizer.hpp
/// @brief Recursive normalization of raw comment nodes into CommentNode.

#pragma once

#include <comment-tree-cpp/comment.hpp>
#include <comment-tree-cpp/types.hpp>

#include <functional>
#include <variant>
#include <vector>

namespace comment_tree_cpp {

// -- Reply sources ------------------------------------------------------------
//
// The upstream source encodes a comment's replies in one of three ways.
// Each alternative below points into the raw node it was resolved from
// and must not outlive it.

/// The node has no recognizable reply collection.
struct NoReplies {
    auto operator==(const NoReplies&) const -> bool = default;
};

/// `feedback.replies.nodes`: an array of raw comment nodes.
struct DirectNodes {
    const Json* nodes{nullptr};
    auto operator==(const DirectNodes&) const -> bool = default;
};

/// `replies.nodes`: an array of raw comment nodes.
struct ConnectionNodes {
    const Json* nodes{nullptr};
    auto operator==(const ConnectionNodes&) const -> bool = default;
};

/// `feedback.replies_connection.edges`: an array of `{"node": ...}` wrappers.
struct EdgeWrappedNodes {
    const Json* edges{nullptr};
    auto operator==(const EdgeWrappedNodes&) const -> bool = default;
};

/// Where a raw node keeps its replies.
using ReplySource = std::variant<NoReplies, DirectNodes, ConnectionNodes, EdgeWrappedNodes>;

/// Raw nodes referenced in place, in source order.
using RawNodes = std::vector<std::reference_wrapper<const Json>>;

/// Resolve the reply encoding of a raw node.
///
/// Checks `feedback.replies.nodes`, then `replies.nodes`, then
/// `feedback.replies_connection.edges`, and returns the first one that
/// is present: it exists and is not null, false, zero or the empty
/// string. Later locations are never consulted once an earlier one is
/// present, even if it is an empty array.
auto resolve_reply_source(const Json& node) -> ReplySource;

/// Gather the raw reply nodes a source refers to, in source order.
/// Edge wrappers are unwrapped to their `node` member (null if missing).
/// A source whose target is not an array yields nothing.
auto collect_replies(const ReplySource& source) -> RawNodes;

/// Normalize a single raw node, recursing into its replies.
auto normalize_node(const Json& raw) -> CommentNode;

/// Normalize every node of a raw collection, preserving order.
/// Anything that is not an array yields an empty forest.
auto normalize(const Json& collection) -> Forest;

/// Normalize an already unwrapped list of raw nodes.
auto normalize(const RawNodes& nodes) -> Forest;

}  // namespace comment_tree_cpp
