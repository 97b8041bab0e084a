#include <comment-tree-cpp/pipeline.hpp>

#include <comment-tree-cpp/locator.hpp>
#include <comment-tree-cpp/normalizer.hpp>
#include <comment-tree-cpp/root_selector.hpp>

#include <fstream>
#include <iterator>
#include <string>
#include <system_error>
#include <utility>

namespace comment_tree_cpp {

namespace {

using LoadResult = std::variant<Json, Error>;

auto load_failure(ErrorKind kind, std::string message) -> LoadResult {
    return LoadResult{std::in_place_type<Error>, kind, std::move(message)};
}

auto quoted(const std::filesystem::path& path) -> std::string {
    return "'" + path.string() + "'";
}

auto describe(const JsonPointer& path) -> std::string {
    return path.empty() ? std::string{"<document root>"} : path.to_string();
}

}  // anonymous namespace

// =============================================================================
// Extraction
// =============================================================================

auto extract_threads(const Json& document) -> ExtractionResult {
    auto result = ExtractionResult{};
    result.collection_path = find_comment_collection_path(document);
    if (!result.collection_path) return result;

    const auto forest = normalize(document.at(*result.collection_path));
    result.top_level_count = forest.size();
    result.threads = select_roots(forest);
    return result;
}

auto to_output_json(const Forest& threads) -> Json {
    auto out = Json::array();
    for (const auto& thread : threads) {
        out.push_back(Json(thread));
    }
    return out;
}

// =============================================================================
// Source and sink
// =============================================================================

auto load_document(const std::filesystem::path& path) -> std::variant<Json, Error> {
    auto ec = std::error_code{};
    if (!std::filesystem::exists(path, ec)) {
        return load_failure(ErrorKind::input_absent, "file " + quoted(path) + " not found");
    }
    if (std::filesystem::is_directory(path, ec)) {
        return load_failure(ErrorKind::input_absent, quoted(path) + " is a directory");
    }

    auto in = std::ifstream{path, std::ios::binary};
    if (!in) {
        return load_failure(ErrorKind::input_absent, "cannot open " + quoted(path));
    }
    auto text = std::string{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
    if (in.bad()) {
        return load_failure(ErrorKind::input_absent, "cannot read " + quoted(path));
    }

    try {
        return LoadResult{std::in_place_type<Json>, Json::parse(text)};
    } catch (const Json::parse_error& e) {
        return load_failure(ErrorKind::input_malformed,
                            "cannot parse " + quoted(path) + ": " + e.what());
    }
}

auto write_document(const std::filesystem::path& path, const Json& value,
                    int indent) -> std::optional<Error> {
    const auto text = value.dump(indent, ' ', false, Json::error_handler_t::replace);

    // Write beside the target, then rename over it
    auto tmp = path;
    tmp += ".tmp";
    {
        auto out = std::ofstream{tmp, std::ios::binary | std::ios::trunc};
        if (!out) {
            return Error{ErrorKind::output_failed, "cannot open " + quoted(tmp) + " for writing"};
        }
        out.write(text.data(), static_cast<std::streamsize>(text.size()));
        out.close();
        if (!out) {
            auto ec = std::error_code{};
            std::filesystem::remove(tmp, ec);
            return Error{ErrorKind::output_failed, "cannot write " + quoted(tmp)};
        }
    }

    auto ec = std::error_code{};
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        auto ignored = std::error_code{};
        std::filesystem::remove(tmp, ignored);
        return Error{ErrorKind::output_failed,
                     "cannot replace " + quoted(path) + ": " + ec.message()};
    }
    return std::nullopt;
}

// =============================================================================
// Run
// =============================================================================

auto run(const Config& config, const Reporter& reporter) -> std::optional<Error> {
    const auto report = [&](Severity severity, const std::string& message) {
        if (reporter) reporter(severity, message);
    };
    const auto fail = [&](Error error) -> std::optional<Error> {
        report(Severity::error, std::string{to_string_view(error.kind)} + ": " + error.message);
        return error;
    };

    auto loaded = load_document(config.input_path);
    if (auto* error = std::get_if<Error>(&loaded)) {
        return fail(std::move(*error));
    }
    const auto& document = std::get<Json>(loaded);

    report(Severity::info, "Searching for comments in " + quoted(config.input_path) + "...");
    const auto result = extract_threads(document);

    if (!result.found()) {
        report(Severity::warning,
               "Could not find any array looking like comments (nodes with id, author/body).");
        report(Severity::info, "Writing empty array to output.");
        if (auto error = write_document(config.output_path, Json::array(), config.indent)) {
            return fail(std::move(*error));
        }
        return std::nullopt;
    }

    const auto stats = forest_stats(result.threads);
    report(Severity::info, "Found comment collection at " + describe(*result.collection_path));
    report(Severity::info, "Original top-level items: " + std::to_string(result.top_level_count));
    report(Severity::info, "Final unique top-level threads: " + std::to_string(stats.threads));
    report(Severity::info, "Comments in threads: " + std::to_string(stats.comments)
                           + " (max depth " + std::to_string(stats.max_depth) + ")");

    if (auto error = write_document(config.output_path, to_output_json(result.threads),
                                    config.indent)) {
        return fail(std::move(*error));
    }
    report(Severity::info, "Output saved to: " + config.output_path.string());
    return std::nullopt;
}

}  // namespace comment_tree_cpp
