/**
 * @file test_builder.cpp
 * @brief Unit tests for PathBuilder (GoogleTest)
 */

#include <gtest/gtest.h>
#include "treepatch/PathBuilder.hpp"

using namespace treepatch;

TEST(PathBuilderTest, AccumulatesKeysAndIndices) {
    PathBuilder b;
    b.key("todos").index(3).key("title");
    EXPECT_EQ(b.path(), (Path{"todos", "3", "title"}));
}

TEST(PathBuilderTest, StartsFromPrefix) {
    PathBuilder b(Path{"a", "b"});
    EXPECT_EQ(b.key("c").path(), (Path{"a", "b", "c"}));
}

TEST(PathBuilderTest, TerminalsDoNotConsumeBuilder) {
    auto todos = instruction().key("todos");
    Instruction first = todos.array_pop();
    Instruction second = todos.array_shift();
    EXPECT_EQ(first.path, (Path{"todos"}));
    EXPECT_EQ(second.path, (Path{"todos"}));
    EXPECT_EQ(todos.path(), (Path{"todos"}));
}

TEST(PathBuilderTest, EveryTerminalProducesItsKind) {
    auto b = instruction().key("x");
    EXPECT_EQ(kind_of(b.set(1)), OpKind::set);
    EXPECT_EQ(kind_of(b.remove()), OpKind::remove);
    EXPECT_EQ(kind_of(b.array_append(1)), OpKind::array_append);
    EXPECT_EQ(kind_of(b.array_insert(0, 1)), OpKind::array_insert);
    EXPECT_EQ(kind_of(b.string_replace_first("a", "b")), OpKind::string_replace_first);
    EXPECT_EQ(kind_of(b.string_replace_all("a", "b")), OpKind::string_replace_all);
    EXPECT_EQ(kind_of(b.array_pop()), OpKind::array_pop);
    EXPECT_EQ(kind_of(b.array_shift()), OpKind::array_shift);
    EXPECT_EQ(kind_of(b.array_unshift(1)), OpKind::array_unshift);
    EXPECT_EQ(kind_of(b.string_append("a")), OpKind::string_append);
    EXPECT_EQ(kind_of(b.string_remove(0, 1)), OpKind::string_remove);
    EXPECT_EQ(kind_of(b.string_replace_range(0, 1, "a")), OpKind::string_replace_range);
    EXPECT_EQ(kind_of(b.bool_toggle()), OpKind::bool_toggle);
    EXPECT_EQ(kind_of(b.array_remove_at(0)), OpKind::array_remove_at);
    EXPECT_EQ(kind_of(b.object_merge({{"k", 1}})), OpKind::object_merge);
    EXPECT_EQ(kind_of(b.string_insert(0, "a")), OpKind::string_insert);
    EXPECT_EQ(kind_of(b.array_move(0, 1)), OpKind::array_move);
    EXPECT_EQ(kind_of(b.move({"y"})), OpKind::move);
    EXPECT_EQ(kind_of(b.insert_move({"y"})), OpKind::insert_move);
}

TEST(PathBuilderTest, TerminalsCarryPayload) {
    auto inst = instruction().key("s").string_replace_range(2, 3, "abc");
    const auto& range = std::get<op::StringReplaceRange>(inst.op);
    EXPECT_EQ(range.index, 2u);
    EXPECT_EQ(range.length, 3u);
    EXPECT_EQ(range.text, "abc");

    auto move = instruction().key("a").insert_move({"list"}, 4);
    const auto& im = std::get<op::InsertMove>(move.op);
    EXPECT_EQ(im.destination, (Path{"list"}));
    ASSERT_TRUE(im.index.has_value());
    EXPECT_EQ(*im.index, 4u);
}
