// ==============================================================================
// test_declarations_gtest.cpp - Тесты загрузки деклараций из YAML (GoogleTest)
// ==============================================================================

#include "ruleval/declarations.hpp"
#include "ruleval/platform.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

namespace ruleval::config::test {

// ==============================================================================
// parse_declarations
// ==============================================================================

TEST(DeclarationsTest, Parse_TypedValues) {
    // Arrange
    const char* yaml = R"(
variables:
  - name: tenant
    kind: string
    value: acme
  - name: limit
    kind: int
    value: 10
  - name: ratio
    kind: double
    value: 0.5
  - name: enabled
    kind: bool
    value: true
  - name: since
    kind: timestamp
    value: "2024-01-15T10:30:00Z"
)";

    // Act
    auto result = parse_declarations(yaml);

    // Assert
    ASSERT_TRUE(result.ok) << result.error.format();
    ASSERT_EQ(result.declarations.size(), 5u);

    const auto& d = result.declarations;
    EXPECT_EQ(d[0].name, "tenant");
    EXPECT_EQ(d[0].kind, ValueKind(KindTag::String));
    EXPECT_EQ(d[0].value->as_string(), "acme");
    EXPECT_EQ(d[1].value->as_int(), 10);
    EXPECT_DOUBLE_EQ(d[2].value->as_double(), 0.5);
    EXPECT_TRUE(d[3].value->as_bool());
    EXPECT_EQ(d[4].value->as_timestamp().seconds, 1705314600);
}

TEST(DeclarationsTest, Parse_WithoutValue_Unbound) {
    auto result = parse_declarations("variables:\n  - name: request\n    kind: map\n");
    ASSERT_TRUE(result.ok);
    ASSERT_EQ(result.declarations.size(), 1u);
    EXPECT_EQ(result.declarations[0].kind, ValueKind(KindTag::Mapping));
    EXPECT_FALSE(result.declarations[0].value.has_value());
}

TEST(DeclarationsTest, Parse_ObjectKind_MakesHostValue) {
    auto result = parse_declarations(
        "variables:\n  - name: principal\n    kind: object:Principal\n    value: {id: 42}\n");
    ASSERT_TRUE(result.ok) << result.error.format();

    const auto& decl = result.declarations[0];
    EXPECT_EQ(decl.kind, ValueKind::object("Principal"));
    ASSERT_TRUE(decl.value->is_host());
    EXPECT_EQ(decl.value->as_host().type_name, "Principal");
    EXPECT_EQ(decl.value->get("id")->as_int(), 42);
}

TEST(DeclarationsTest, Parse_DynKind_InfersScalars) {
    auto result = parse_declarations(R"(
variables:
  - name: meta
    kind: dyn
    value: {count: 3, big: 18446744073709551615, label: "7", flag: false, none: ~}
)");
    ASSERT_TRUE(result.ok) << result.error.format();

    const Value& meta = *result.declarations[0].value;
    EXPECT_TRUE(meta.get("count")->is_int());
    EXPECT_TRUE(meta.get("big")->is_uint());
    EXPECT_TRUE(meta.get("label")->is_string());
    EXPECT_TRUE(meta.get("flag")->is_bool());
    EXPECT_TRUE(meta.get("none")->is_null());
}

TEST(DeclarationsTest, Parse_EmptyDocument) {
    auto result = parse_declarations("");
    ASSERT_TRUE(result.ok);
    EXPECT_TRUE(result.declarations.empty());
}

// ==============================================================================
// Ошибки
// ==============================================================================

TEST(DeclarationsTest, Parse_UnknownKind) {
    auto result = parse_declarations("variables:\n  - name: x\n    kind: integer\n");
    ASSERT_FALSE(result.ok);
    EXPECT_NE(result.error.message.find("unknown kind 'integer'"), std::string::npos);
}

TEST(DeclarationsTest, Parse_DuplicateName) {
    auto result = parse_declarations(
        "variables:\n  - name: x\n    kind: int\n  - name: x\n    kind: string\n");
    ASSERT_FALSE(result.ok);
    EXPECT_NE(result.error.message.find("duplicate variable 'x'"), std::string::npos);
}

TEST(DeclarationsTest, Parse_MissingKind) {
    auto result = parse_declarations("variables:\n  - name: x\n");
    ASSERT_FALSE(result.ok);
    EXPECT_NE(result.error.message.find("requires 'name' and 'kind'"), std::string::npos);
}

TEST(DeclarationsTest, Parse_ValueDoesNotMatchKind) {
    auto result = parse_declarations("variables:\n  - name: x\n    kind: int\n    value: abc\n");
    EXPECT_FALSE(result.ok);
}

TEST(DeclarationsTest, Parse_InvalidTimestamp) {
    auto result =
        parse_declarations("variables:\n  - name: t\n    kind: timestamp\n    value: yesterday\n");
    ASSERT_FALSE(result.ok);
    EXPECT_NE(result.error.message.find("invalid timestamp"), std::string::npos);
}

TEST(DeclarationsTest, Parse_VariablesNotSequence) {
    auto result = parse_declarations("variables: 3\n");
    ASSERT_FALSE(result.ok);
    EXPECT_NE(result.error.message.find("'variables' must be a sequence"), std::string::npos);
}

TEST(DeclarationsTest, Parse_MalformedYaml) {
    auto result = parse_declarations("variables: [unclosed", "inline.yaml");
    ASSERT_FALSE(result.ok);
    EXPECT_EQ(result.error.path, "inline.yaml");
    EXPECT_NE(result.error.format().find("(inline.yaml)"), std::string::npos);
}

// ==============================================================================
// load_declarations
// ==============================================================================

TEST(DeclarationsTest, Load_FromFile) {
    auto path = platform::make_temp_file("ruleval_decl");
    {
        std::ofstream out(path);
        out << "variables:\n  - name: tenant\n    kind: string\n    value: acme\n";
    }

    auto result = load_declarations(path);
    std::filesystem::remove(path);

    ASSERT_TRUE(result.ok) << result.error.format();
    ASSERT_EQ(result.declarations.size(), 1u);
    EXPECT_EQ(result.declarations[0].value->as_string(), "acme");
}

TEST(DeclarationsTest, Load_MissingFile) {
    auto result = load_declarations("/nonexistent/ruleval/declarations.yaml");
    ASSERT_FALSE(result.ok);
    EXPECT_EQ(result.error.path, "/nonexistent/ruleval/declarations.yaml");
}

}  // namespace ruleval::config::test
