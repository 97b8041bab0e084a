// extract_threads — write the comment threads of a post as clean JSON
//
// Reads a semi-structured post document, finds its comment collection,
// normalizes every comment and its replies, and writes the root threads.
//
// Run: ./build/tools/extract_threads [-i INPUT] [-o OUTPUT]

#include <comment-tree-cpp/comment_tree.hpp>

#include <cstdio>
#include <exception>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace ct = comment_tree_cpp;

int main(int argc, char** argv) {
    const auto program = std::string_view{argc > 0 ? argv[0] : "extract_threads"};
    const auto args = std::vector<std::string_view>(argv + (argc > 0 ? 1 : 0), argv + argc);

    auto parsed = ct::parse_args(args);
    if (const auto* error = std::get_if<ct::Error>(&parsed)) {
        std::fprintf(stderr, "error: %s\n\n%s", error->message.c_str(),
                     ct::usage(program).c_str());
        return 2;
    }
    const auto& config = std::get<ct::Config>(parsed);
    if (config.show_help) {
        std::printf("%s", ct::usage(program).c_str());
        return 0;
    }

    try {
        return ct::run(config, ct::stdio_reporter(config.quiet)) ? 1 : 0;
    } catch (const std::exception& e) {
        std::fprintf(stderr, "error: %s\n", e.what());
        return 1;
    }
}
