/**
 * @file test_path.cpp
 * @brief Unit tests for path helpers and resolution (GoogleTest)
 */

#include <gtest/gtest.h>
#include "treepatch/Path.hpp"
#include "treepatch/Errors.hpp"

using namespace treepatch;

// ============================================================================
// split_path / join_path / index segments
// ============================================================================

TEST(PathTextTest, SplitDotted) {
    EXPECT_EQ(split_path("a.b.0"), (Path{"a", "b", "0"}));
}

TEST(PathTextTest, EmptyStringIsRoot) {
    EXPECT_TRUE(split_path("").empty());
}

TEST(PathTextTest, JoinRendersDots) {
    EXPECT_EQ(join_path({"todos", "2", "title"}), "todos.2.title");
    EXPECT_EQ(join_path({}), "");
}

TEST(PathTextTest, IndexSegmentsAreCanonical) {
    EXPECT_TRUE(is_index_segment("0"));
    EXPECT_TRUE(is_index_segment("17"));
    EXPECT_FALSE(is_index_segment("01"));
    EXPECT_FALSE(is_index_segment("-1"));
    EXPECT_FALSE(is_index_segment("+1"));
    EXPECT_FALSE(is_index_segment("1a"));
    EXPECT_FALSE(is_index_segment(""));
}

TEST(PathTextTest, ParseIndex) {
    EXPECT_EQ(parse_index("42"), std::optional<std::size_t>(42));
    EXPECT_FALSE(parse_index("x").has_value());
    EXPECT_FALSE(parse_index("99999999999999999999999").has_value());
}

TEST(PathTextTest, StartsWith) {
    EXPECT_TRUE(starts_with({"a", "b", "c"}, {"a", "b"}));
    EXPECT_TRUE(starts_with({"a"}, {}));
    EXPECT_FALSE(starts_with({"a"}, {"a", "b"}));
    EXPECT_FALSE(starts_with({"ab"}, {"a"}));
}

// ============================================================================
// resolve
// ============================================================================

class ResolveTest : public ::testing::Test {
protected:
    Value doc = {
        {"user", {{"name", "ada"}, {"tags", {"x", "y"}}}},
        {"count", 3}
    };
};

TEST_F(ResolveTest, EmptyPathIsRoot) {
    Location loc = resolve(doc, {}, true);
    EXPECT_TRUE(loc.is_root());
    EXPECT_EQ(loc.current, &doc);
}

TEST_F(ResolveTest, MappingKey) {
    Location loc = resolve(doc, {"user", "name"}, true);
    ASSERT_NE(loc.current, nullptr);
    EXPECT_EQ(*loc.current, "ada");
    EXPECT_EQ(loc.parent, &doc["user"]);
    EXPECT_EQ(loc.key, "name");
}

TEST_F(ResolveTest, SequenceIndex) {
    ConstLocation loc = resolve(static_cast<const Value&>(doc), {"user", "tags", "1"}, true);
    ASSERT_NE(loc.current, nullptr);
    EXPECT_EQ(*loc.current, "y");
    EXPECT_TRUE(loc.parent->is_array());
}

TEST_F(ResolveTest, MissingFinalKeyAllowedWithoutRequireLast) {
    Location loc = resolve(doc, {"user", "email"}, false);
    EXPECT_EQ(loc.current, nullptr);
    EXPECT_EQ(loc.key, "email");
}

TEST_F(ResolveTest, MissingFinalKeyRejectedWithRequireLast) {
    EXPECT_THROW(resolve(doc, {"user", "email"}, true), PathNotFound);
}

TEST_F(ResolveTest, MissingIntermediateNamesPrefix) {
    try {
        resolve(doc, {"profile", "bio", "text"}, false);
        FAIL() << "Expected PathNotFound";
    } catch (const PathNotFound& e) {
        EXPECT_EQ(e.path(), (Path{"profile"}));
        EXPECT_EQ(e.kind(), ErrorKind::navigation);
        EXPECT_NE(std::string(e.what()).find("profile"), std::string::npos);
    }
}

TEST_F(ResolveTest, TraversingScalarFails) {
    try {
        resolve(doc, {"count", "x", "y"}, true);
        FAIL() << "Expected PathNotFound";
    } catch (const PathNotFound& e) {
        EXPECT_EQ(e.path(), (Path{"count", "x"}));
    }
}

TEST_F(ResolveTest, ScalarParentFails) {
    EXPECT_THROW(resolve(doc, {"count", "x"}, false), PathNotFound);
}

TEST_F(ResolveTest, NonIndexOnSequenceFails) {
    EXPECT_THROW(resolve(doc, {"user", "tags", "first"}, true), PathNotFound);
}

TEST_F(ResolveTest, OutOfRangeIndexIsRangeError) {
    EXPECT_THROW(resolve(doc, {"user", "tags", "2"}, false), RangeError);
}

// ============================================================================
// get
// ============================================================================

TEST_F(ResolveTest, GetReturnsPointerOrNull) {
    const Value* tag = get(doc, {"user", "tags", "0"});
    ASSERT_NE(tag, nullptr);
    EXPECT_EQ(*tag, "x");
    EXPECT_EQ(get(doc, {"user", "tags", "5"}), nullptr);
    EXPECT_EQ(get(doc, {"count", "x"}), nullptr);
    EXPECT_EQ(get(doc, {}), &doc);
}
