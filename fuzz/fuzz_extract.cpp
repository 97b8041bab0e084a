// Fuzz target for the extraction pipeline — arbitrary bytes are parsed and,
// if they form JSON, searched, normalized, and serialized.

#include <comment-tree-cpp/comment_tree.hpp>

#include <cstddef>
#include <cstdint>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto doc = comment_tree_cpp::Json::parse(data, data + size, nullptr, false);
    if (doc.is_discarded()) return 0;

    const auto result = comment_tree_cpp::extract_threads(doc);
    auto out = comment_tree_cpp::to_output_json(result.threads).dump(
        -1, ' ', false, comment_tree_cpp::Json::error_handler_t::replace);
    (void)out;
    return 0;
}
