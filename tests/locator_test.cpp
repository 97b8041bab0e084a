// locator_test.cpp — Tests for the comment collection search

#include <comment-tree-cpp/locator.hpp>

#include <gtest/gtest.h>

#include <string>

using namespace comment_tree_cpp;

// =============================================================================
// looks_like_comment
// =============================================================================

TEST(LooksLikeComment, id_with_body_author_or_message) {
    EXPECT_TRUE(looks_like_comment(Json::parse(R"({"id": 1, "body": {}})")));
    EXPECT_TRUE(looks_like_comment(Json::parse(R"({"id": 1, "author": null})")));
    EXPECT_TRUE(looks_like_comment(Json::parse(R"({"id": "x", "message": "m"})")));
}

TEST(LooksLikeComment, requires_id) {
    EXPECT_FALSE(looks_like_comment(Json::parse(R"({"body": {}, "author": {}})")));
}

TEST(LooksLikeComment, requires_content_key) {
    EXPECT_FALSE(looks_like_comment(Json::parse(R"({"id": 1, "text": "hi"})")));
}

TEST(LooksLikeComment, comet_sections_marks_a_post) {
    EXPECT_FALSE(looks_like_comment(
        Json::parse(R"({"id": 1, "message": {"text": "post"}, "comet_sections": {}})")));
}

TEST(LooksLikeComment, non_objects_never_match) {
    EXPECT_FALSE(looks_like_comment(Json(nullptr)));
    EXPECT_FALSE(looks_like_comment(Json("id")));
    EXPECT_FALSE(looks_like_comment(Json::parse(R"([{"id": 1, "body": {}}])")));
}

// =============================================================================
// find_comment_collection
// =============================================================================

TEST(FindCommentCollection, scalars_are_absent) {
    EXPECT_FALSE(find_comment_collection(Json(42)).has_value());
    EXPECT_FALSE(find_comment_collection(Json("nodes")).has_value());
    EXPECT_FALSE(find_comment_collection(Json(nullptr)).has_value());
}

TEST(FindCommentCollection, empty_containers_are_absent) {
    EXPECT_FALSE(find_comment_collection(Json::array()).has_value());
    EXPECT_FALSE(find_comment_collection(Json::object()).has_value());
}

TEST(FindCommentCollection, top_level_array_matches_itself) {
    const auto doc = Json::parse(R"([{"id": 1, "body": {"text": "a"}}, {"id": 2}])");
    auto path = find_comment_collection_path(doc);
    ASSERT_TRUE(path.has_value());
    EXPECT_TRUE(path->empty());
    EXPECT_EQ(*find_comment_collection(doc), doc);
}

TEST(FindCommentCollection, only_first_element_is_sampled) {
    // Second element looks like a comment, first does not
    const auto doc = Json::parse(R"({"list": [{"x": 1}, {"id": 2, "body": {}}]})");
    EXPECT_FALSE(find_comment_collection_path(doc).has_value());
}

TEST(FindCommentCollection, descends_into_array_elements) {
    const auto doc = Json::parse(R"({
        "list": [
            {"x": 1},
            {"inner": [{"id": 2, "author": {"name": "Bo"}}]}
        ]
    })");
    auto path = find_comment_collection_path(doc);
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path->to_string(), "/list/1/inner");
}

TEST(FindCommentCollection, scalar_first_element_does_not_block_descent) {
    const auto doc = Json::parse(R"([7, {"c": [{"id": 1, "message": {}}]}])");
    auto path = find_comment_collection_path(doc);
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path->to_string(), "/1/c");
}

TEST(FindCommentCollection, post_array_is_skipped) {
    const auto doc = Json::parse(R"({
        "stories": [
            {"id": "post", "message": {"text": "p"}, "comet_sections": {
                "thread": [{"id": "c1", "body": {"text": "inside"}}]
            }}
        ]
    })");
    auto found = find_comment_collection(doc);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ((*found)[0]["id"], Json("c1"));
    EXPECT_EQ(find_comment_collection_path(doc)->to_string(),
              "/stories/0/comet_sections/thread");
}

TEST(FindCommentCollection, match_stops_the_descent) {
    // The outer array matches; the nested one is never considered
    const auto doc = Json::parse(R"([
        {"id": "outer", "body": {}, "more": [{"id": "inner", "body": {}}]}
    ])");
    auto found = find_comment_collection(doc);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ((*found)[0]["id"], Json("outer"));
}

TEST(FindCommentCollection, priority_key_wins_over_earlier_keys) {
    const auto doc = Json::parse(R"({
        "aaa": {"deep": {"deeper": [{"id": "decoy", "body": {}}]}},
        "comments": [{"id": "real", "body": {}}]
    })");
    auto found = find_comment_collection(doc);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ((*found)[0]["id"], Json("real"));
}

TEST(FindCommentCollection, priority_keys_are_tried_in_order) {
    const auto doc = Json::parse(R"({
        "feedback": [{"id": "from_feedback", "body": {}}],
        "comments": [{"id": "from_comments", "body": {}}],
        "nodes": [{"id": "from_nodes", "body": {}}]
    })");
    EXPECT_EQ(find_comment_collection_path(doc)->to_string(), "/nodes");

    const auto without_nodes = Json::parse(R"({
        "feedback": [{"id": "from_feedback", "body": {}}],
        "comments": [{"id": "from_comments", "body": {}}]
    })");
    EXPECT_EQ(find_comment_collection_path(without_nodes)->to_string(), "/comments");
}

TEST(FindCommentCollection, failed_priority_key_falls_back_to_others) {
    const auto doc = Json::parse(R"({
        "nodes": [{"id": 1}],
        "zzz": [{"id": 2, "author": {}}]
    })");
    EXPECT_EQ(find_comment_collection_path(doc)->to_string(), "/zzz");
}

TEST(FindCommentCollection, other_keys_follow_document_order) {
    const auto doc = Json::parse(R"({
        "zeta": [{"id": "z", "body": {}}],
        "alpha": [{"id": "a", "body": {}}]
    })");
    EXPECT_EQ(find_comment_collection_path(doc)->to_string(), "/zeta");
}

TEST(FindCommentCollection, array_index_keys_come_first) {
    const auto doc = Json::parse(R"({
        "zz": [{"id": "z", "body": {}}],
        "10": [{"id": "ten", "body": {}}]
    })");
    EXPECT_EQ(find_comment_collection_path(doc)->to_string(), "/10");
}

TEST(FindCommentCollection, array_index_keys_sort_numerically) {
    const auto doc = Json::parse(R"({
        "10": [{"id": "ten", "body": {}}],
        "2": [{"id": "two", "body": {}}]
    })");
    EXPECT_EQ(find_comment_collection_path(doc)->to_string(), "/2");
}

TEST(FindCommentCollection, non_canonical_numbers_keep_document_order) {
    const auto doc = Json::parse(R"({
        "b": [{"id": "b", "body": {}}],
        "01": [{"id": "lead", "body": {}}],
        "-1": [{"id": "neg", "body": {}}],
        "4294967295": [{"id": "big", "body": {}}]
    })");
    EXPECT_EQ(find_comment_collection_path(doc)->to_string(), "/b");

    const auto largest = Json::parse(R"({
        "x": [{"id": "x", "body": {}}],
        "4294967294": [{"id": "max", "body": {}}]
    })");
    EXPECT_EQ(find_comment_collection_path(largest)->to_string(), "/4294967294");
}

TEST(FindCommentCollection, nested_priority_path) {
    const auto doc = Json::parse(R"({
        "feedback": {"replies": {"nodes": [
            {"id": "1", "author": {"name": "Ann"}, "body": {"text": "hi"}}
        ]}}
    })");
    EXPECT_EQ(find_comment_collection_path(doc)->to_string(), "/feedback/replies/nodes");
}

TEST(FindCommentCollection, absent_when_nothing_qualifies) {
    const auto doc = Json::parse(R"({
        "a": [1, 2, 3],
        "b": {"c": [{"name": "no id"}]},
        "d": [{"id": 1, "comet_sections": {}, "message": {}}]
    })");
    EXPECT_FALSE(find_comment_collection(doc).has_value());
    EXPECT_FALSE(find_comment_collection_path(doc).has_value());
}

TEST(FindCommentCollection, keys_with_slashes_are_escaped_in_path) {
    const auto doc = Json::parse(R"({"a/b": {"x~y": [{"id": 1, "body": {}}]}})");
    auto path = find_comment_collection_path(doc);
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path->to_string(), "/a~1b/x~0y");
    EXPECT_EQ(doc.at(*path)[0]["id"], Json(1));
}
