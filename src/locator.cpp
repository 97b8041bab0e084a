#include <comment-tree-cpp/locator.hpp>

#include <algorithm>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace comment_tree_cpp {

namespace {

auto is_priority_key(std::string_view key) -> bool {
    return std::ranges::find(priority_keys, key) != priority_keys.end();
}

// Largest array index is 2^32 - 2.
constexpr std::uint64_t max_array_index = 4294967294ULL;

// The canonical decimal form of an array index: digits only, no leading
// zero, at most max_array_index.
auto array_index(std::string_view key) -> std::optional<std::uint64_t> {
    if (key.empty() || key.size() > 10) return std::nullopt;
    if (key.size() > 1 && key.front() == '0') return std::nullopt;
    if (!std::ranges::all_of(key, [](char c) { return c >= '0' && c <= '9'; })) {
        return std::nullopt;
    }
    std::uint64_t value = 0;
    const auto* end = key.data() + key.size();
    auto [ptr, ec] = std::from_chars(key.data(), end, value);
    if (ec != std::errc{} || ptr != end || value > max_array_index) return std::nullopt;
    return value;
}

// Object keys in enumeration order: array-index keys ascending by value,
// then every other key in document order.
auto enumeration_order(const Json& object) -> std::vector<std::string> {
    auto indexed = std::vector<std::pair<std::uint64_t, std::string>>{};
    auto named = std::vector<std::string>{};
    for (const auto& [key, child] : object.items()) {
        if (auto index = array_index(key)) {
            indexed.emplace_back(*index, key);
        } else {
            named.push_back(key);
        }
    }
    std::ranges::sort(indexed, {}, &std::pair<std::uint64_t, std::string>::first);

    auto keys = std::vector<std::string>{};
    keys.reserve(indexed.size() + named.size());
    for (auto& [index, key] : indexed) keys.push_back(std::move(key));
    for (auto& key : named) keys.push_back(std::move(key));
    return keys;
}

// Depth-first search. `here` is the pointer to `value` within the
// document being searched.
auto search(const Json& value, const JsonPointer& here) -> std::optional<JsonPointer> {
    if (value.is_array()) {
        if (!value.empty() && looks_like_comment(value.front())) {
            return here;
        }
        for (std::size_t i = 0; i < value.size(); ++i) {
            if (auto found = search(value[i], here / i)) return found;
        }
        return std::nullopt;
    }

    if (!value.is_object()) return std::nullopt;

    for (const auto key : priority_keys) {
        auto it = value.find(std::string{key});
        if (it == value.end()) continue;
        if (auto found = search(*it, here / std::string{key})) return found;
    }

    for (const auto& key : enumeration_order(value)) {
        if (is_priority_key(key)) continue;
        if (auto found = search(value.at(key), here / key)) return found;
    }
    return std::nullopt;
}

}  // anonymous namespace

auto looks_like_comment(const Json& sample) -> bool {
    if (!sample.is_object()) return false;
    const bool has_id = sample.contains("id");
    const bool has_content = sample.contains("body") || sample.contains("author")
                          || sample.contains("message");
    const bool is_post = sample.contains("comet_sections");
    return has_id && has_content && !is_post;
}

auto find_comment_collection_path(const Json& value) -> std::optional<JsonPointer> {
    return search(value, JsonPointer{});
}

auto find_comment_collection(const Json& value) -> std::optional<Json> {
    auto path = find_comment_collection_path(value);
    if (!path) return std::nullopt;
    return value.at(*path);
}

}  // namespace comment_tree_cpp
