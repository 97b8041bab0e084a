#include <comment-tree-cpp/config.hpp>

#include <charconv>
#include <cstddef>
#include <optional>
#include <string>
#include <system_error>
#include <utility>

namespace comment_tree_cpp {

namespace {

constexpr int max_indent = 16;

auto invalid(std::string message) -> std::variant<Config, Error> {
    return std::variant<Config, Error>{
        std::in_place_type<Error>, ErrorKind::invalid_argument, std::move(message)};
}

auto parse_indent(std::string_view text) -> std::optional<int> {
    int value = 0;
    const auto* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc{} || ptr != end) return std::nullopt;
    if (value < 0 || value > max_indent) return std::nullopt;
    return value;
}

}  // anonymous namespace

auto parse_args(std::span<const std::string_view> args) -> std::variant<Config, Error> {
    auto config = Config{};
    std::size_t positional = 0;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const auto arg = args[i];

        // Options that take a value
        if (arg == "-i" || arg == "--input" || arg == "-o" || arg == "--output"
            || arg == "--indent") {
            if (i + 1 >= args.size()) {
                return invalid("missing value for " + std::string{arg});
            }
            const auto value = args[++i];
            if (arg == "--indent") {
                auto indent = parse_indent(value);
                if (!indent) {
                    return invalid("invalid indent '" + std::string{value}
                                   + "' (expected 0-" + std::to_string(max_indent) + ")");
                }
                config.indent = *indent;
            } else if (arg == "-i" || arg == "--input") {
                config.input_path = std::filesystem::path{value};
            } else {
                config.output_path = std::filesystem::path{value};
            }
            continue;
        }

        if (arg == "-h" || arg == "--help") {
            config.show_help = true;
        } else if (arg == "-q" || arg == "--quiet") {
            config.quiet = true;
        } else if (arg == "--compact") {
            config.indent = -1;
        } else if (arg.size() > 1 && arg.front() == '-') {
            return invalid("unknown option " + std::string{arg});
        } else if (positional == 0) {
            config.input_path = std::filesystem::path{arg};
            ++positional;
        } else if (positional == 1) {
            config.output_path = std::filesystem::path{arg};
            ++positional;
        } else {
            return invalid("unexpected argument " + std::string{arg});
        }
    }
    return config;
}

auto usage(std::string_view program) -> std::string {
    auto text = std::string{"usage: "};
    text += program;
    text += " [options] [INPUT [OUTPUT]]\n"
            "\n"
            "Extract the comment threads of a post from a JSON document.\n"
            "\n"
            "options:\n"
            "  -i, --input PATH   source document (default: commentObject.json)\n"
            "  -o, --output PATH  result document (default: structured_comments.json)\n"
            "      --indent N     spaces per indentation level, 0-16 (default: 2)\n"
            "      --compact      write the result on a single line\n"
            "  -q, --quiet        only report warnings and errors\n"
            "  -h, --help         show this message\n";
    return text;
}

}  // namespace comment_tree_cpp
