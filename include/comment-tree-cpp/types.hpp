/// @file types.hpp
/// @brief Core aliases shared by every component: the JSON value type
/// and the variant visitor helper.

#pragma once

#include <nlohmann/json.hpp>

namespace comment_tree_cpp {

/// The JSON value type used for raw input and for the emitted document.
///
/// Insertion-ordered so that object keys enumerate in document order,
/// which the collection search depends on for deterministic results.
using Json = nlohmann::ordered_json;

/// An RFC 6901 pointer into a Json value.
using JsonPointer = Json::json_pointer;

/// Helper for std::visit with lambdas.
template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

}  // namespace comment_tree_cpp
