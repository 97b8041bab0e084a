#include <comment-tree-cpp/report.hpp>

#include <cstdio>

namespace comment_tree_cpp {

auto stdio_reporter(bool quiet) -> Reporter {
    return [quiet](Severity severity, std::string_view message) {
        const auto len = static_cast<int>(message.size());
        switch (severity) {
            case Severity::info:
                if (!quiet) std::printf("%.*s\n", len, message.data());
                break;
            case Severity::warning:
                std::fprintf(stderr, "warning: %.*s\n", len, message.data());
                break;
            case Severity::error:
                std::fprintf(stderr, "error: %.*s\n", len, message.data());
                break;
        }
    };
}

auto null_reporter() -> Reporter {
    return [](Severity, std::string_view) {};
}

}  // namespace comment_tree_cpp
