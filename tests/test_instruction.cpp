/**
 * @file test_instruction.cpp
 * @brief Unit tests for the operation catalog and validation (GoogleTest)
 */

#include <gtest/gtest.h>
#include "treepatch/Instruction.hpp"
#include "treepatch/PathBuilder.hpp"

using namespace treepatch;

// ============================================================================
// Kinds, codes and names
// ============================================================================

TEST(OpKindTest, CodesMatchWireProtocol) {
    EXPECT_EQ(op_code(OpKind::set), 1);
    EXPECT_EQ(op_code(OpKind::remove), 2);
    EXPECT_EQ(op_code(OpKind::array_append), 3);
    EXPECT_EQ(op_code(OpKind::string_replace_all), 6);
    EXPECT_EQ(op_code(OpKind::bool_toggle), 13);
    EXPECT_EQ(op_code(OpKind::object_merge), 15);
    EXPECT_EQ(op_code(OpKind::array_move), 17);
    EXPECT_EQ(op_code(OpKind::insert_move), 19);
}

TEST(OpKindTest, EveryCodeRoundTripsThroughKindFromCode) {
    for (int code = 1; code <= 19; ++code) {
        auto kind = kind_from_code(code);
        ASSERT_TRUE(kind.has_value()) << "code " << code;
        EXPECT_EQ(op_code(*kind), code);
        EXPECT_NE(op_name(*kind), "unknown");
    }
}

TEST(OpKindTest, UnknownCodes) {
    EXPECT_FALSE(kind_from_code(0).has_value());
    EXPECT_FALSE(kind_from_code(20).has_value());
    EXPECT_FALSE(kind_from_code(-3).has_value());
}

TEST(OpKindTest, KindOfFollowsVariant) {
    Instruction inst{op::StringInsert{0, "x"}, {"title"}};
    EXPECT_EQ(kind_of(inst), OpKind::string_insert);
    EXPECT_EQ(op_name(kind_of(inst)), "string_insert");
}

// ============================================================================
// validate
// ============================================================================

TEST(ValidateTest, PlainEditsAreValid) {
    EXPECT_TRUE(validate(instruction().key("a").set(1)).ok());
    EXPECT_TRUE(validate(instruction().set(Value::object())).ok());
    EXPECT_TRUE(validate(instruction().key("list").array_pop()).ok());
}

TEST(ValidateTest, RemoveNeedsPath) {
    auto status = validate(instruction().remove());
    ASSERT_FALSE(status.ok());
    EXPECT_EQ(status.error().kind, ErrorKind::validation);
    EXPECT_NE(status.error().message.find("root"), std::string::npos);
}

TEST(ValidateTest, MoveNeedsSourceAndDestination) {
    EXPECT_FALSE(validate(instruction().move({"a"})).ok());
    EXPECT_FALSE(validate(instruction().key("a").move({})).ok());
    EXPECT_FALSE(validate(instruction().insert_move({"list"})).ok());
    EXPECT_TRUE(validate(instruction().key("a").move({"b"})).ok());
}

TEST(ValidateTest, DestinationInsideSourceIsRejected) {
    auto status = validate(instruction().key("a").move({"a", "child"}));
    ASSERT_FALSE(status.ok());
    EXPECT_NE(status.error().message.find("inside"), std::string::npos);
    EXPECT_FALSE(validate(instruction().key("a").insert_move({"a", "list"})).ok());
}

TEST(ValidateTest, DestinationInsideBackfilledSourceIsAllowed) {
    Instruction into_backfill{op::Move{{"a", "b"}, Value::object()}, {"a"}};
    EXPECT_TRUE(validate(into_backfill).ok());
}

TEST(ValidateTest, DestinationInsideSequenceElementIsAllowed) {
    // After detaching l[0], its successor takes index 0
    EXPECT_TRUE(validate(instruction().key("l").index(0).move({"l", "0", "x"})).ok());
    EXPECT_TRUE(validate(instruction().key("l").index(0).insert_move({"l", "0", "list"})).ok());
}

TEST(ValidateTest, SiblingWithSharedPrefixIsAllowed) {
    EXPECT_TRUE(validate(instruction().key("a").move({"ab"})).ok());
}

TEST(ValidateTest, ReplaceNeedsSearch) {
    EXPECT_FALSE(validate(instruction().key("s").string_replace_first("", "x")).ok());
    EXPECT_FALSE(validate(instruction().key("s").string_replace_all("", "x")).ok());
    EXPECT_TRUE(validate(instruction().key("s").string_replace_all("x", "")).ok());
}

TEST(ValidateTest, MergeEntriesMustBeMapping) {
    EXPECT_FALSE(validate(instruction().key("m").object_merge(Value::array())).ok());
    EXPECT_TRUE(validate(instruction().key("m").object_merge({{"k", 1}})).ok());
}

TEST(ValidateTest, MergeKeyCannotBeWrittenAndErased) {
    EXPECT_FALSE(validate(instruction().key("m").object_merge({{"k", 1}}, {"k"})).ok());
    EXPECT_TRUE(validate(instruction().key("m").object_merge({{"k", 1}}, {"j"})).ok());
}

TEST(ValidateTest, RequireValidThrows) {
    EXPECT_THROW(require_valid(instruction().remove()), ValidationError);
    EXPECT_NO_THROW(require_valid(instruction().key("x").remove()));
}

// ============================================================================
// Equality
// ============================================================================

TEST(InstructionEqualityTest, ComparesKindPathAndPayload) {
    auto a = instruction().key("n").set(1);
    EXPECT_EQ(a, instruction().key("n").set(1));
    EXPECT_NE(a, instruction().key("n").set(2));
    EXPECT_NE(a, instruction().key("m").set(1));
    EXPECT_NE(a, instruction().key("n").array_append(1));
}

TEST(InstructionEqualityTest, MergeEraseOrderIgnored) {
    EXPECT_EQ(instruction().key("m").object_merge(Value::object(), {"a", "b"}),
              instruction().key("m").object_merge(Value::object(), {"b", "a"}));
}

TEST(InstructionEqualityTest, MoveBackfillParticipates) {
    Instruction plain = instruction().key("a").move({"b"});
    Instruction filled{op::Move{{"b"}, Value(5)}, {"a"}};
    EXPECT_NE(plain, filled);
}
