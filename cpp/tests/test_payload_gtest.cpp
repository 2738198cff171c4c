// ==============================================================================
// test_payload_gtest.cpp - Тесты разбора документа события (GoogleTest)
// ==============================================================================

#include "ruleval/payload.hpp"

#include <gtest/gtest.h>
#include <string>

namespace ruleval::test {

TEST(PayloadTest, Parse_Object_ExposesTopLevelFields) {
    auto result = parse_payload(R"({"user":"alice","age":30,"tags":["a"]})");
    ASSERT_TRUE(result.ok) << result.message;

    const auto& fields = result.payload->fields();
    ASSERT_EQ(fields.size(), 3u);
    EXPECT_EQ(fields.at("user").as_string(), "alice");
    ASSERT_TRUE(fields.at("age").is_double());
    EXPECT_DOUBLE_EQ(fields.at("age").as_double(), 30.0);
    EXPECT_TRUE(fields.at("tags").is_array());
}

TEST(PayloadTest, Parse_KeepsRawText) {
    std::string raw = R"({"a":1})";
    auto result = parse_payload(raw);
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.payload->raw(), raw);
    EXPECT_TRUE(result.payload->dom().IsObject());
}

TEST(PayloadTest, Parse_EmptyObject) {
    auto result = parse_payload("{}");
    ASSERT_TRUE(result.ok);
    EXPECT_TRUE(result.payload->fields().empty());
}

TEST(PayloadTest, Parse_DuplicateKeys_LastWins) {
    auto result = parse_payload(R"({"a":1,"a":2})");
    ASSERT_TRUE(result.ok);
    EXPECT_DOUBLE_EQ(result.payload->fields().at("a").as_double(), 2.0);
}

TEST(PayloadTest, Parse_InvalidJson) {
    auto result = parse_payload("{not json");
    EXPECT_FALSE(result.ok);
    EXPECT_FALSE(result);
    EXPECT_EQ(result.payload, nullptr);
    EXPECT_NE(result.message.find("JSON parse error"), std::string::npos);
}

TEST(PayloadTest, Parse_EmptyInput) {
    EXPECT_FALSE(parse_payload("").ok);
}

TEST(PayloadTest, Parse_NonObjectRoot) {
    auto result = parse_payload("[1,2]");
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.message, "document root is not a JSON object");

    EXPECT_FALSE(parse_payload("42").ok);
    EXPECT_FALSE(parse_payload("null").ok);
}

TEST(PayloadTest, Parse_NumbersAreDouble) {
    // Arrange
    const char* raw = R"({"bytes":1500,"big":18446744073709551615,"nested":{"ids":[1,-2]}})";

    // Act
    auto result = parse_payload(raw);

    // Assert
    ASSERT_TRUE(result.ok) << result.message;
    const auto& fields = result.payload->fields();
    EXPECT_TRUE(fields.at("bytes").is_double());
    EXPECT_TRUE(fields.at("big").is_double());
    const Value& ids = *fields.at("nested").get("ids");
    ASSERT_EQ(ids.array_size(), 2u);
    EXPECT_TRUE(ids.as_array()[1].is_double());
    EXPECT_DOUBLE_EQ(ids.as_array()[1].as_double(), -2.0);
}

// ==============================================================================
// Глубина вложенности
// ==============================================================================

TEST(PayloadTest, Parse_DeepNesting_Rejected) {
    // Arrange: 100000 уровней массивов
    std::string raw = "{\"a\":" + std::string(100000, '[') + std::string(100000, ']') + "}";

    // Act
    auto result = parse_payload(raw);

    // Assert
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.message, "document nesting exceeds maximum depth of 1000");
}

TEST(PayloadTest, Parse_NestingAtLimit_Accepted) {
    std::size_t levels = MAX_DOCUMENT_DEPTH - 1;
    std::string raw = "{\"a\":" + std::string(levels, '[') + std::string(levels, ']') + "}";

    auto result = parse_payload(raw);

    ASSERT_TRUE(result.ok) << result.message;
    EXPECT_TRUE(result.payload->fields().at("a").is_array());
}

TEST(PayloadTest, Parse_UnterminatedDeepNesting_ParseError) {
    auto result = parse_payload("{\"a\":" + std::string(100000, '['));
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.message.rfind("JSON parse error: ", 0), 0u);
}

}  // namespace ruleval::test
