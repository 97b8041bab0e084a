/// @file root_selector.hpp
/// @brief Removal of top-level entries that also appear as replies.

#pragma once

#include <comment-tree-cpp/comment.hpp>
#include <comment-tree-cpp/types.hpp>

#include <cstddef>
#include <unordered_set>

namespace comment_tree_cpp {

/// Hash for comment ids that agrees with Json equality.
///
/// Json compares numbers by value across integer, unsigned and float
/// representations (`2 == 2.0`), so every number hashes through its
/// double value. Arrays and objects hash their members the same way.
struct IdHash {
    auto operator()(const Json& id) const noexcept -> std::size_t;
};

/// A set of comment ids under value equality.
using IdSet = std::unordered_set<Json, IdHash>;

/// Identities of every node that occurs as a reply, at any depth.
auto collect_child_ids(const Forest& forest) -> IdSet;

/// Keep only the top-level nodes whose id never occurs as a reply.
/// Survivors keep their original order. Nested replies are not touched.
auto select_roots(const Forest& forest) -> Forest;

/// Shape summary of a forest, used for reporting.
struct ForestStats {
    std::size_t threads{0};    ///< Top-level nodes.
    std::size_t comments{0};   ///< Nodes at every depth.
    std::size_t max_depth{0};  ///< Deepest level; 1 for a forest of leaves.

    auto operator==(const ForestStats&) const -> bool = default;
};

/// Compute the shape summary of a forest.
auto forest_stats(const Forest& forest) -> ForestStats;

}  // namespace comment_tree_cpp
