// ==============================================================================
// test_accessors_gtest.cpp - Тесты exists / safe (GoogleTest)
// ==============================================================================

#include "ruleval/accessors.hpp"

#include <gtest/gtest.h>

namespace ruleval::accessors::test {

class AccessorsTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto parsed = parse_payload(
            R"({"user":{"name":"alice","admin":true,"score":7,"nothing":null},)"
            R"("items":[{"id":"a1"}],"ratio":0.25})");
        ASSERT_TRUE(parsed.ok) << parsed.message;
        payload_ = parsed.payload;
    }

    std::shared_ptr<const Payload> payload_;
};

// ==============================================================================
// exists
// ==============================================================================

TEST_F(AccessorsTest, Exists_NestedPath) {
    EXPECT_TRUE(exists(*payload_, "user.name"));
    EXPECT_TRUE(exists(*payload_, "items[0].id"));
    EXPECT_TRUE(exists(*payload_, "user"));
}

TEST_F(AccessorsTest, Exists_NullValueCounts) {
    EXPECT_TRUE(exists(*payload_, "user.nothing"));
}

TEST_F(AccessorsTest, Exists_Missing) {
    EXPECT_FALSE(exists(*payload_, "user.email"));
    EXPECT_FALSE(exists(*payload_, "items[1]"));
    EXPECT_FALSE(exists(*payload_, "ratio.value"));
}

TEST_F(AccessorsTest, Exists_MalformedPath) {
    EXPECT_FALSE(exists(*payload_, ""));
    EXPECT_FALSE(exists(*payload_, "user..name"));
}

// ==============================================================================
// safe
// ==============================================================================

TEST_F(AccessorsTest, Safe_StringFound) {
    Value v = safe(*payload_, "user.name", Value("guest"));
    ASSERT_TRUE(v.is_string());
    EXPECT_EQ(v.as_string(), "alice");
}

TEST_F(AccessorsTest, Safe_StringMissing_ReturnsFallback) {
    EXPECT_EQ(safe(*payload_, "user.role", Value("guest")).as_string(), "guest");
}

TEST_F(AccessorsTest, Safe_StringWrongType_ReturnsFallback) {
    EXPECT_EQ(safe(*payload_, "user.score", Value("none")).as_string(), "none");
}

TEST_F(AccessorsTest, Safe_NumberAcceptsIntegers) {
    Value v = safe(*payload_, "user.score", Value(0.0));
    ASSERT_TRUE(v.is_double());
    EXPECT_DOUBLE_EQ(v.as_double(), 7.0);
    EXPECT_DOUBLE_EQ(safe(*payload_, "ratio", Value(0.0)).as_double(), 0.25);
}

TEST_F(AccessorsTest, Safe_NumberMissing_ReturnsFallback) {
    EXPECT_DOUBLE_EQ(safe(*payload_, "user.age", Value(-1.0)).as_double(), -1.0);
}

TEST_F(AccessorsTest, Safe_Bool) {
    EXPECT_TRUE(safe(*payload_, "user.admin", Value(false)).as_bool());
    EXPECT_FALSE(safe(*payload_, "user.name", Value(false)).as_bool());
}

TEST_F(AccessorsTest, Safe_NullValue_ReturnsFallback) {
    EXPECT_EQ(safe(*payload_, "user.nothing", Value("fallback")).as_string(), "fallback");
}

// ==============================================================================
// make_accessors
// ==============================================================================

TEST_F(AccessorsTest, MakeAccessors_DeclaresOverloads) {
    auto decls = make_accessors(payload_);
    ASSERT_EQ(decls.size(), 2u);

    EXPECT_EQ(decls[0].name, "exists");
    ASSERT_EQ(decls[0].overloads.size(), 1u);
    EXPECT_EQ(decls[0].overloads[0].id, EXISTS_OVERLOAD);

    EXPECT_EQ(decls[1].name, "safe");
    ASSERT_EQ(decls[1].overloads.size(), 3u);
    EXPECT_EQ(decls[1].overloads[0].id, SAFE_STRING_OVERLOAD);
    EXPECT_EQ(decls[1].overloads[1].id, SAFE_NUMBER_OVERLOAD);
    EXPECT_EQ(decls[1].overloads[2].id, SAFE_BOOL_OVERLOAD);
}

TEST_F(AccessorsTest, MakeAccessors_ImplsOutliveCaller) {
    auto decls = make_accessors(payload_);
    payload_.reset();

    Value found = decls[0].overloads[0].impl({Value("user.name")});
    EXPECT_TRUE(found.as_bool());
}

}  // namespace ruleval::accessors::test
