/**
 * @file test_history.cpp
 * @brief Unit tests for the undo/redo log (GoogleTest)
 */

#include <gtest/gtest.h>
#include "treepatch/History.hpp"
#include "treepatch/PathBuilder.hpp"

using namespace treepatch;

class HistoryTest : public ::testing::Test {
protected:
    Value doc = Value::parse(R"({"title": "draft", "tags": ["a"]})");
    History history;
};

TEST_F(HistoryTest, StartsEmpty) {
    EXPECT_FALSE(history.can_undo());
    EXPECT_FALSE(history.can_redo());
    EXPECT_EQ(history.last_sequence(), 0u);
    EXPECT_FALSE(history.undo(doc).ok());
    EXPECT_FALSE(history.redo(doc).ok());
}

TEST_F(HistoryTest, CommitRecordsEntry) {
    auto r = history.commit(doc, {instruction().key("title").set("final")}, "ada");
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.value()["title"], "final");
    EXPECT_TRUE(history.can_undo());
    EXPECT_EQ(history.last_sequence(), 1u);

    auto entries = history.since(0);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].sequence, 1u);
    EXPECT_EQ(entries[0].author, "ada");
    EXPECT_GT(entries[0].timestamp_ms, 0);
    ASSERT_EQ(entries[0].inverse.size(), 1u);
    EXPECT_EQ(entries[0].inverse[0], instruction().key("title").set("draft"));
}

TEST_F(HistoryTest, UndoRedo) {
    Value v1 = history.commit(doc, {instruction().key("tags").array_append("b")}).value();
    Value v2 = history.commit(v1, {instruction().key("title").string_append("!")}).value();

    auto u1 = history.undo(v2);
    ASSERT_TRUE(u1.ok());
    EXPECT_EQ(u1.value(), v1);
    auto u2 = history.undo(u1.value());
    ASSERT_TRUE(u2.ok());
    EXPECT_EQ(u2.value(), doc);
    EXPECT_FALSE(history.can_undo());
    EXPECT_TRUE(history.can_redo());

    auto r1 = history.redo(u2.value());
    ASSERT_TRUE(r1.ok());
    EXPECT_EQ(r1.value(), v1);
    auto r2 = history.redo(r1.value());
    ASSERT_TRUE(r2.ok());
    EXPECT_EQ(r2.value(), v2);
    EXPECT_FALSE(history.can_redo());
}

TEST_F(HistoryTest, CommitClearsRedo) {
    Value v1 = history.commit(doc, {instruction().key("title").set("x")}).value();
    Value back = history.undo(v1).value();
    ASSERT_TRUE(history.can_redo());
    history.commit(back, {instruction().key("title").set("y")});
    EXPECT_FALSE(history.can_redo());
    EXPECT_EQ(history.last_sequence(), 2u);
}

TEST_F(HistoryTest, FailedCommitRecordsNothing) {
    auto r = history.commit(doc, {
        instruction().key("title").set("x"),
        instruction().key("tags").array_remove_at(5),
    });
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(*r.error().step, 1u);
    EXPECT_FALSE(history.can_undo());
    EXPECT_EQ(history.last_sequence(), 0u);
}

TEST_F(HistoryTest, FailedUndoKeepsStacks) {
    Value v1 = history.commit(doc, {instruction().key("tags").index(0).remove()}).value();

    // A tree that no longer has the edited sequence
    auto bad = history.undo(Value::parse(R"({"title": "draft"})"));
    ASSERT_FALSE(bad.ok());
    EXPECT_EQ(bad.error().kind, ErrorKind::navigation);
    EXPECT_TRUE(history.can_undo());
    EXPECT_FALSE(history.can_redo());

    auto good = history.undo(v1);
    ASSERT_TRUE(good.ok());
    EXPECT_EQ(good.value(), doc);
}

TEST_F(HistoryTest, SinceReturnsNewerEntries) {
    Value v = doc;
    for (int i = 0; i < 4; ++i) {
        v = history.commit(v, {instruction().key("tags").array_append(i)}).value();
    }
    auto late = history.since(2);
    ASSERT_EQ(late.size(), 2u);
    EXPECT_EQ(late[0].sequence, 3u);
    EXPECT_EQ(late[1].sequence, 4u);
    EXPECT_TRUE(history.since(4).empty());
}

TEST(HistoryCapacityTest, DropsOldestEntries) {
    History history(2);
    Value v = {{"n", 0}};
    for (int i = 1; i <= 3; ++i) {
        v = history.commit(v, {instruction().key("n").set(i)}).value();
    }
    EXPECT_EQ(history.size(), 2u);
    EXPECT_EQ(history.since(0).front().sequence, 2u);

    v = history.undo(v).value();
    v = history.undo(v).value();
    EXPECT_EQ(v["n"], 1);
    EXPECT_FALSE(history.can_undo());
}
