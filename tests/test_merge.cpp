/**
 * @file test_merge.cpp
 * @brief Tests for merge patch using Google Test
 */

#include <gtest/gtest.h>
#include "docpatch/Merge.hpp"

using namespace docpatch;

// ============================================================================
// Simple merges
// ============================================================================

TEST(Merge, BothEmpty) {
    Value doc = Value::object();
    merge(doc, Value::object());
    EXPECT_TRUE(doc.is_object());
    EXPECT_TRUE(doc.empty());
}

TEST(Merge, OverlayAddsNewKeys) {
    Value doc = {{"a", 1}};
    merge(doc, {{"b", 2}});
    EXPECT_EQ(doc["a"], 1);
    EXPECT_EQ(doc["b"], 2);
}

TEST(Merge, OverlayReplacesValues) {
    Value doc = {{"a", 1}, {"b", 2}};
    merge(doc, {{"b", 3}, {"c", 4}});
    EXPECT_EQ(doc, Value({{"a", 1}, {"b", 3}, {"c", 4}}));
}

TEST(Merge, NestedObjectsMerged) {
    Value doc = {{"db", {{"host", "a"}, {"port", 1}}}};
    merge(doc, {{"db", {{"port", 2}}}});

    EXPECT_EQ(doc["db"]["host"], "a");  // Preserved
    EXPECT_EQ(doc["db"]["port"], 2);    // Replaced
}

// ============================================================================
// Deletion
// ============================================================================

TEST(Merge, NullRemovesKey) {
    Value doc = {{"a", 1}, {"b", 2}};
    merge(doc, {{"a", nullptr}});
    EXPECT_EQ(doc, Value({{"b", 2}}));
}

TEST(Merge, NullForAbsentKeyIsNoOp) {
    Value doc = {{"a", 1}};
    merge(doc, {{"zzz", nullptr}});
    EXPECT_EQ(doc, Value({{"a", 1}}));
}

TEST(Merge, NestedNullRemovesNestedKey) {
    Value doc = Value::parse(R"({
        "title": "Goodbye!",
        "author": {"givenName": "John", "familyName": "Doe"},
        "tags": ["example", "sample"],
        "content": "This will be unchanged"
    })");
    merge(doc, Value::parse(R"({
        "title": "Hello!",
        "phoneNumber": "+01-123-456-7890",
        "author": {"familyName": null},
        "tags": ["example"]
    })"));

    EXPECT_EQ(doc, Value::parse(R"({
        "title": "Hello!",
        "author": {"givenName": "John"},
        "tags": ["example"],
        "content": "This will be unchanged",
        "phoneNumber": "+01-123-456-7890"
    })"));
}

TEST(Merge, NullsInsideNewObjectAreDropped) {
    Value doc = Value::object();
    merge(doc, Value::parse(R"({"a": {"b": null, "c": 1}})"));
    EXPECT_EQ(doc, Value::parse(R"({"a": {"c": 1}})"));
}

// ============================================================================
// Replacement
// ============================================================================

TEST(Merge, ArrayOverlayReplacesWhole) {
    Value doc = {{"a", 1}};
    merge(doc, Value::parse(R"(["x"])"));
    EXPECT_EQ(doc, Value::parse(R"(["x"])"));
}

TEST(Merge, ArraysAreNotMergedElementwise) {
    Value doc = Value::parse(R"({"a": [1, 2]})");
    merge(doc, Value::parse(R"({"a": [3]})"));
    EXPECT_EQ(doc, Value::parse(R"({"a": [3]})"));
}

TEST(Merge, ScalarReplacesObject) {
    Value doc = {{"db", {{"host", "a"}}}};
    merge(doc, {{"db", "string"}});
    EXPECT_EQ(doc["db"], "string");
}

TEST(Merge, ObjectReplacesScalar) {
    Value doc = {{"port", 5432}};
    merge(doc, {{"port", {{"value", 8080}}}});
    EXPECT_TRUE(doc["port"].is_object());
    EXPECT_EQ(doc["port"]["value"], 8080);
}

TEST(Merge, ObjectOverlayOnNonObjectDocument) {
    Value doc = Value::parse("[1, 2]");
    merge(doc, {{"a", "b"}});
    EXPECT_EQ(doc, Value({{"a", "b"}}));

    Value scalar = "text";
    merge(scalar, {{"a", nullptr}});
    EXPECT_EQ(scalar, Value::object());
}

TEST(Merge, NullOverlayReplacesDocument) {
    Value doc = {{"a", 1}};
    merge(doc, nullptr);
    EXPECT_TRUE(doc.is_null());
}

TEST(Merge, KeysAreNotPointers) {
    Value doc = {{"a", {{"b", 1}}}};
    merge(doc, {{"a/b", 2}, {"~0", 3}});
    EXPECT_EQ(doc["a"]["b"], 1);
    EXPECT_EQ(doc["a/b"], 2);
    EXPECT_EQ(doc["~0"], 3);
}

TEST(Merge, IdempotentForObjectOverlay) {
    Value doc = Value::parse(R"({"a": {"b": 1}, "c": [1]})");
    const Value overlay = Value::parse(R"({"a": {"b": null, "d": 2}, "c": [2]})");
    merge(doc, overlay);
    Value once = doc;
    merge(doc, overlay);
    EXPECT_EQ(doc, once);
}

// ============================================================================
// merge_all
// ============================================================================

TEST(MergeAll, ThreeOverlays) {
    Value doc = {{"a", 1}, {"b", 2}};
    merge_all(doc, {
        {{"b", 3}, {"c", 4}},
        {{"c", 5}, {"d", 6}},
        {{"a", nullptr}},
    });

    EXPECT_EQ(doc, Value({{"b", 3}, {"c", 5}, {"d", 6}}));
}

TEST(MergeAll, NoOverlays) {
    Value doc = {{"a", 1}};
    merge_all(doc, {});
    EXPECT_EQ(doc, Value({{"a", 1}}));
}

TEST(MergeAll, ConfigurationPrecedenceChain) {
    Value doc = {
        {"database", {
            {"host", "localhost"},
            {"port", 5432},
            {"pool_size", 10}
        }},
        {"logging", {
            {"level", "INFO"}
        }}
    };

    const Value file_overlay = {
        {"database", {
            {"host", "prod.db"},
            {"pool_size", 50}
        }}
    };

    const Value env_overlay = {
        {"database", {
            {"port", 5433}
        }},
        {"logging", nullptr}
    };

    merge_all(doc, {file_overlay, env_overlay});

    EXPECT_EQ(doc["database"]["host"], "prod.db");
    EXPECT_EQ(doc["database"]["port"], 5433);
    EXPECT_EQ(doc["database"]["pool_size"], 50);
    EXPECT_FALSE(doc.contains("logging"));
}
