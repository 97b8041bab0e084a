/// @file comment_tree.hpp
/// @brief Umbrella header for the comment-tree-cpp library.
///
/// Include this single header for access to all public types:
/// CommentNode, the collection search, normalization, root selection,
/// configuration, reporting, and the end-to-end pipeline.

#pragma once

#include <comment-tree-cpp/comment.hpp>
#include <comment-tree-cpp/config.hpp>
#include <comment-tree-cpp/error.hpp>
#include <comment-tree-cpp/locator.hpp>
#include <comment-tree-cpp/normalizer.hpp>
#include <comment-tree-cpp/pipeline.hpp>
#include <comment-tree-cpp/report.hpp>
#include <comment-tree-cpp/root_selector.hpp>
#include <comment-tree-cpp/types.hpp>
