// thread_walk_demo — comment-tree-cpp library usage
//
// Demonstrates:
//   - Locating the comment collection in a document of unknown shape
//   - Normalizing the three reply encodings into one tree
//   - Dropping top-level duplicates of nested replies
//   - Serializing the result with nlohmann/json
//
// Build: cmake -B build -DCOMMENT_TREE_CPP_BUILD_EXAMPLES=ON
// Run:   ./build/examples/thread_walk_demo

#include <comment-tree-cpp/comment_tree.hpp>

#include <cstdio>
#include <string>

namespace ct = comment_tree_cpp;
using Json = ct::Json;

static void print_thread(const ct::CommentNode& node, int depth) {
    const auto id = node.id.is_string() ? node.id.get<std::string>() : node.id.dump();
    std::printf("%*s- [%s] %s: %s\n", depth * 2, "", id.c_str(),
                node.author.c_str(), node.text.c_str());
    for (const auto& reply : node.replies) {
        print_thread(reply, depth + 1);
    }
}

int main() {
    // A story whose comments sit a few levels down. Each comment uses a
    // different reply encoding, and comment "c3" was also flattened into
    // the top level.
    const auto document = Json::parse(R"({
        "data": {
            "story": {
                "id": "s1",
                "message": {"text": "Weekend plans?"},
                "comet_sections": {}
            },
            "feedback": {
                "comment_list": {
                    "nodes": [
                        {
                            "id": "c1",
                            "author": {"name": "Ann"},
                            "body": {"text": "Hiking!"},
                            "feedback": {"replies": {"nodes": [
                                {"id": "c3", "author": {"name": "Cy"}, "body": {"text": "Where?"},
                                 "replies": {"nodes": [
                                     {"id": "c4", "author": {"name": "Ann"}, "body": {"text": "The ridge."}}
                                 ]}}
                            ]}}
                        },
                        {
                            "id": "c2",
                            "author": {"name": "Bo"},
                            "message": {"text": "Sleeping."},
                            "feedback": {"replies_connection": {"edges": [
                                {"node": {"id": "c5", "body": {"text": "Same."}}}
                            ]}}
                        },
                        {"id": "c3", "author": {"name": "Cy"}, "body": {"text": "Where?"}}
                    ]
                }
            }
        }
    })");

    const auto path = ct::find_comment_collection_path(document);
    if (!path) {
        std::printf("No comment collection found.\n");
        return 1;
    }
    std::printf("Collection at: %s\n", path->to_string().c_str());

    const auto forest = ct::normalize(document.at(*path));
    std::printf("Top-level entries: %zu\n", forest.size());

    const auto roots = ct::select_roots(forest);
    const auto stats = ct::forest_stats(roots);
    std::printf("Root threads: %zu (%zu comments, depth %zu)\n\n",
                stats.threads, stats.comments, stats.max_depth);

    for (const auto& thread : roots) {
        print_thread(thread, 0);
    }

    std::printf("\nJSON:\n%s\n", ct::to_output_json(roots).dump(2).c_str());
    std::printf("Done.\n");
    return 0;
}
