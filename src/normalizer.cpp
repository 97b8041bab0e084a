#include <comment-tree-cpp/normalizer.hpp>

#include <cmath>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>

namespace comment_tree_cpp {

namespace {

// Stand-in for an edge that carries no node.
const Json null_node{};

// Follow a chain of object keys. Returns nullptr unless every step is an
// object member and the final value is not null.
auto present(const Json& node, std::initializer_list<std::string_view> path) -> const Json* {
    const Json* current = &node;
    for (const auto key : path) {
        if (!current->is_object()) return nullptr;
        auto it = current->find(std::string{key});
        if (it == current->end() || it->is_null()) return nullptr;
        current = &*it;
    }
    return current;
}

// False, zero, NaN and the empty string do not count as a reply location.
auto is_truthy(const Json& value) -> bool {
    if (value.is_null()) return false;
    if (value.is_boolean()) return value.get<bool>();
    if (value.is_number()) {
        const auto d = value.get<double>();
        return d != 0.0 && !std::isnan(d);
    }
    if (value.is_string()) return !value.get_ref<const std::string&>().empty();
    return true;
}

auto reply_location(const Json& node, std::initializer_list<std::string_view> path)
    -> const Json* {
    const auto* value = present(node, path);
    return value != nullptr && is_truthy(*value) ? value : nullptr;
}

auto string_at(const Json& node, std::initializer_list<std::string_view> path)
    -> std::optional<std::string> {
    const auto* value = present(node, path);
    if (value == nullptr || !value->is_string()) return std::nullopt;
    return value->get<std::string>();
}

auto elements_of(const Json* array) -> RawNodes {
    auto result = RawNodes{};
    if (array == nullptr || !array->is_array()) return result;
    result.reserve(array->size());
    for (const auto& element : *array) {
        result.emplace_back(element);
    }
    return result;
}

}  // anonymous namespace

auto resolve_reply_source(const Json& node) -> ReplySource {
    if (const auto* nodes = reply_location(node, {"feedback", "replies", "nodes"})) {
        return DirectNodes{nodes};
    }
    if (const auto* nodes = reply_location(node, {"replies", "nodes"})) {
        return ConnectionNodes{nodes};
    }
    if (const auto* edges = reply_location(node, {"feedback", "replies_connection", "edges"})) {
        return EdgeWrappedNodes{edges};
    }
    return NoReplies{};
}

auto collect_replies(const ReplySource& source) -> RawNodes {
    return std::visit(overload{
        [](NoReplies) { return RawNodes{}; },
        [](const DirectNodes& s) { return elements_of(s.nodes); },
        [](const ConnectionNodes& s) { return elements_of(s.nodes); },
        [](const EdgeWrappedNodes& s) {
            auto result = RawNodes{};
            if (s.edges == nullptr || !s.edges->is_array()) return result;
            result.reserve(s.edges->size());
            for (const auto& edge : *s.edges) {
                const auto* inner = edge.is_object() && edge.contains("node")
                    ? &edge.at("node") : &null_node;
                result.emplace_back(*inner);
            }
            return result;
        },
    }, source);
}

auto normalize_node(const Json& raw) -> CommentNode {
    auto node = CommentNode{};
    if (raw.is_object()) {
        if (auto it = raw.find("id"); it != raw.end()) {
            node.id = *it;
        }
    }
    node.author = string_at(raw, {"author", "name"}).value_or(std::string{unknown_author});
    auto text = string_at(raw, {"body", "text"});
    if (!text) text = string_at(raw, {"message", "text"});
    node.text = text.value_or(std::string{});

    auto replies = collect_replies(resolve_reply_source(raw));
    if (!replies.empty()) {
        node.replies = normalize(replies);
    }
    return node;
}

auto normalize(const Json& collection) -> Forest {
    return normalize(elements_of(&collection));
}

auto normalize(const RawNodes& nodes) -> Forest {
    auto forest = Forest{};
    forest.reserve(nodes.size());
    for (const auto& raw : nodes) {
        forest.push_back(normalize_node(raw.get()));
    }
    return forest;
}

}  // namespace comment_tree_cpp
