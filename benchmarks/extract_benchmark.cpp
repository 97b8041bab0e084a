// comment-tree-cpp benchmarks — measures throughput of the extraction stages.

#include <comment-tree-cpp/comment_tree.hpp>

#include <benchmark/benchmark.h>

#include <cstdint>
#include <string>

using namespace comment_tree_cpp;

// =============================================================================
// Synthetic documents
// =============================================================================

// A comment whose reply encoding rotates with depth.
static auto make_comment(const std::string& id, int depth, int fanout) -> Json {
    auto node = Json{
        {"id", id},
        {"author", {{"name", "user_" + id}}},
        {"body", {{"text", "comment " + id}}},
    };
    if (depth == 0) return node;

    auto replies = Json::array();
    for (int i = 0; i < fanout; ++i) {
        replies.push_back(make_comment(id + "." + std::to_string(i), depth - 1, fanout));
    }
    switch (depth % 3) {
        case 0:
            node["feedback"] = {{"replies", {{"nodes", replies}}}};
            break;
        case 1:
            node["replies"] = {{"nodes", replies}};
            break;
        default: {
            auto edges = Json::array();
            for (auto& r : replies) edges.push_back(Json{{"node", std::move(r)}});
            node["feedback"] = {{"replies_connection", {{"edges", edges}}}};
            break;
        }
    }
    return node;
}

// Comments buried under unrelated siblings that the search must walk first.
static auto make_document(int threads, int depth, int fanout) -> Json {
    auto noise = Json::array();
    for (int i = 0; i < 200; ++i) {
        noise.push_back(Json{{"key", i}, {"values", Json::array({1, 2, 3})}});
    }
    auto nodes = Json::array();
    for (int i = 0; i < threads; ++i) {
        nodes.push_back(make_comment("t" + std::to_string(i), depth, fanout));
    }
    return Json{
        {"data", {
            {"tracking", noise},
            {"story", {{"id", "s"}, {"message", {{"text", "post"}}}, {"comet_sections", Json::object()}}},
            {"comment_list", {{"nodes", nodes}}},
        }},
    };
}

// =============================================================================
// Stages
// =============================================================================

static void bm_locate(benchmark::State& state) {
    const auto doc = make_document(static_cast<int>(state.range(0)), 2, 3);
    for (auto _ : state) {
        auto path = find_comment_collection_path(doc);
        benchmark::DoNotOptimize(path);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_locate)->Range(8, 512);

static void bm_normalize(benchmark::State& state) {
    const auto doc = make_document(static_cast<int>(state.range(0)), 3, 3);
    const auto path = find_comment_collection_path(doc);
    const auto& collection = doc.at(*path);
    for (auto _ : state) {
        auto forest = normalize(collection);
        benchmark::DoNotOptimize(forest);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * state.range(0)));
}
BENCHMARK(bm_normalize)->Range(8, 512);

static void bm_select_roots(benchmark::State& state) {
    const auto doc = make_document(static_cast<int>(state.range(0)), 3, 3);
    const auto forest = normalize(doc.at(*find_comment_collection_path(doc)));
    for (auto _ : state) {
        auto roots = select_roots(forest);
        benchmark::DoNotOptimize(roots);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * state.range(0)));
}
BENCHMARK(bm_select_roots)->Range(8, 512);

// =============================================================================
// End to end
// =============================================================================

static void bm_extract_and_serialize(benchmark::State& state) {
    const auto text = make_document(static_cast<int>(state.range(0)), 3, 3).dump();
    for (auto _ : state) {
        const auto doc = Json::parse(text);
        auto out = to_output_json(extract_threads(doc).threads).dump();
        benchmark::DoNotOptimize(out);
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations() * text.size()));
}
BENCHMARK(bm_extract_and_serialize)->Range(8, 512);
