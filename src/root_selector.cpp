#include <comment-tree-cpp/root_selector.hpp>

#include <algorithm>
#include <functional>
#include <iterator>
#include <string>

namespace comment_tree_cpp {

namespace {

auto combine(std::size_t seed, std::size_t h) -> std::size_t {
    return seed ^ (h + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2));
}

void collect_reply_ids(const CommentNode& node, IdSet& ids) {
    for (const auto& reply : node.replies) {
        ids.insert(reply.id);
        collect_reply_ids(reply, ids);
    }
}

auto count_nodes(const Forest& forest) -> std::size_t {
    auto total = forest.size();
    for (const auto& node : forest) {
        total += count_nodes(node.replies);
    }
    return total;
}

auto depth_of(const Forest& forest) -> std::size_t {
    auto deepest = std::size_t{0};
    for (const auto& node : forest) {
        deepest = std::max(deepest, depth_of(node.replies));
    }
    return forest.empty() ? 0 : deepest + 1;
}

}  // anonymous namespace

auto IdHash::operator()(const Json& id) const noexcept -> std::size_t {
    if (id.is_number()) {
        // -0.0 == 0.0
        const auto d = id.get<double>();
        return std::hash<double>{}(d == 0.0 ? 0.0 : d);
    }
    if (id.is_array()) {
        auto seed = std::size_t{id.size()};
        for (const auto& element : id) {
            seed = combine(seed, (*this)(element));
        }
        return seed;
    }
    if (id.is_object()) {
        auto seed = std::size_t{id.size()} ^ 0x5bd1e995U;
        for (const auto& [key, value] : id.items()) {
            seed = combine(seed, std::hash<std::string>{}(key));
            seed = combine(seed, (*this)(value));
        }
        return seed;
    }
    return std::hash<Json>{}(id);
}

auto collect_child_ids(const Forest& forest) -> IdSet {
    auto ids = IdSet{};
    for (const auto& node : forest) {
        collect_reply_ids(node, ids);
    }
    return ids;
}

auto select_roots(const Forest& forest) -> Forest {
    const auto child_ids = collect_child_ids(forest);
    auto roots = Forest{};
    std::ranges::copy_if(forest, std::back_inserter(roots), [&](const CommentNode& node) {
        return !child_ids.contains(node.id);
    });
    return roots;
}

auto forest_stats(const Forest& forest) -> ForestStats {
    return ForestStats{
        .threads = forest.size(),
        .comments = count_nodes(forest),
        .max_depth = depth_of(forest),
    };
}

}  // namespace comment_tree_cpp
