#include <comment-tree-cpp/comment.hpp>

#include <string>
#include <utility>

namespace comment_tree_cpp {

void to_json(Json& j, const CommentNode& node) {
    auto replies = Json::array();
    for (const auto& reply : node.replies) {
        replies.push_back(Json(reply));
    }
    j = Json::object();
    j["id"] = node.id;
    j["author"] = node.author;
    j["text"] = node.text;
    j["replies"] = std::move(replies);
}

void from_json(const Json& j, CommentNode& node) {
    node = CommentNode{};
    if (!j.is_object()) return;

    if (auto it = j.find("id"); it != j.end()) {
        node.id = *it;
    }
    if (auto it = j.find("author"); it != j.end() && it->is_string()) {
        node.author = it->get<std::string>();
    }
    if (auto it = j.find("text"); it != j.end() && it->is_string()) {
        node.text = it->get<std::string>();
    }
    if (auto it = j.find("replies"); it != j.end() && it->is_array()) {
        node.replies.reserve(it->size());
        for (const auto& reply : *it) {
            node.replies.push_back(reply.get<CommentNode>());
        }
    }
}

}  // namespace comment_tree_cpp
