// ==============================================================================
// test_path_gtest.cpp - Тесты путей к полям документа (GoogleTest)
// ==============================================================================

#include "ruleval/path.hpp"

#include <gtest/gtest.h>
#include <rapidjson/document.h>

namespace ruleval::path::test {

// ==============================================================================
// split
// ==============================================================================

TEST(PathTest, Split_DottedPath) {
    auto segments = split("a.b.c");
    ASSERT_TRUE(segments.has_value());
    EXPECT_EQ(*segments, (std::vector<std::string>{"a", "b", "c"}));
}

TEST(PathTest, Split_IndexSegments) {
    auto segments = split("items[0].name");
    ASSERT_TRUE(segments.has_value());
    EXPECT_EQ(*segments, (std::vector<std::string>{"items", "0", "name"}));
}

TEST(PathTest, Split_EscapedDot) {
    auto segments = split("a\\.b.c");
    ASSERT_TRUE(segments.has_value());
    EXPECT_EQ(*segments, (std::vector<std::string>{"a.b", "c"}));
}

TEST(PathTest, Split_Malformed) {
    EXPECT_FALSE(split("").has_value());
    EXPECT_FALSE(split(".a").has_value());
    EXPECT_FALSE(split("a..b").has_value());
    EXPECT_FALSE(split("a.").has_value());
    EXPECT_FALSE(split("[0]").has_value());
    EXPECT_FALSE(split("a[x]").has_value());
    EXPECT_FALSE(split("a[]").has_value());
    EXPECT_FALSE(split("a[0]b").has_value());
    EXPECT_FALSE(split("a\\").has_value());
}

// ==============================================================================
// to_json_pointer
// ==============================================================================

TEST(PathTest, ToJsonPointer_EscapesSpecialCharacters) {
    auto pointer = to_json_pointer("a/b.c~d");
    ASSERT_TRUE(pointer.has_value());
    EXPECT_EQ(*pointer, "/a~1b/c~0d");
}

// ==============================================================================
// query
// ==============================================================================

class PathQueryTest : public ::testing::Test {
protected:
    void SetUp() override {
        doc_.Parse(R"({"a":{"b":1,"c":null},"items":[{"name":"x"}],"x.y":true})");
        ASSERT_FALSE(doc_.HasParseError());
    }

    rapidjson::Document doc_;
};

TEST_F(PathQueryTest, Query_NestedField) {
    const rapidjson::Value* found = query(doc_, "a.b");
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(found->GetInt(), 1);
}

TEST_F(PathQueryTest, Query_NullFieldExists) {
    const rapidjson::Value* found = query(doc_, "a.c");
    ASSERT_NE(found, nullptr);
    EXPECT_TRUE(found->IsNull());
}

TEST_F(PathQueryTest, Query_ArrayElement) {
    const rapidjson::Value* found = query(doc_, "items[0].name");
    ASSERT_NE(found, nullptr);
    EXPECT_STREQ(found->GetString(), "x");
}

TEST_F(PathQueryTest, Query_EscapedKey) {
    EXPECT_NE(query(doc_, "x\\.y"), nullptr);
    EXPECT_EQ(query(doc_, "x.y"), nullptr);
}

TEST_F(PathQueryTest, Query_Missing) {
    EXPECT_EQ(query(doc_, "a.d"), nullptr);
    EXPECT_EQ(query(doc_, "items[3]"), nullptr);
    EXPECT_EQ(query(doc_, "a.b.c"), nullptr);
}

TEST_F(PathQueryTest, Query_MalformedPath) {
    EXPECT_EQ(query(doc_, "a..b"), nullptr);
}

}  // namespace ruleval::path::test
