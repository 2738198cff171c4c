// ==============================================================================
// test_checker_gtest.cpp - Тесты проверки типов (GoogleTest)
// ==============================================================================

#include "ruleval/checker.hpp"
#include "ruleval/env.hpp"
#include "ruleval/parser.hpp"

#include <gtest/gtest.h>

namespace ruleval::expr::test {

class CheckerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto built = EnvironmentBuilder::create()
                         .variable("age", KindTag::Int, Value(std::int64_t{30}))
                         .variable("name", KindTag::String, Value("alice"))
                         .variable("score", KindTag::Double, Value(1.5))
                         .variable("tags", KindTag::List, Value(ValueArray{Value("a")}))
                         .variable("request", KindTag::Mapping, Value(ValueObject{}))
                         .variable("request.method", KindTag::String, Value("GET"))
                         .variable("anything", ValueKind::dyn(), Value(std::int64_t{1}))
                         .stdlib()
                         .build();
        ASSERT_TRUE(built.ok) << built.error;
        env_ = built.environment;
    }

    CheckResult check_source(std::string_view source) {
        auto parsed = parse(source);
        EXPECT_TRUE(parsed.ok);
        return check(std::move(parsed.expression), *env_);
    }

    std::shared_ptr<const Environment> env_;
};

// ==============================================================================
// Успешная проверка
// ==============================================================================

TEST_F(CheckerTest, Comparison_IsBool) {
    auto result = check_source("age > 18");
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.checked.result_kind(), ValueKind(KindTag::Bool));
}

TEST_F(CheckerTest, MixedNumericComparison_Allowed) {
    EXPECT_TRUE(check_source("age < score").ok);
    EXPECT_TRUE(check_source("age == 30u").ok);
}

TEST_F(CheckerTest, Arithmetic_KeepsKind) {
    auto result = check_source("age + 1");
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.checked.result_kind(), ValueKind(KindTag::Int));
}

TEST_F(CheckerTest, ReceiverCall_ResolvesOverload) {
    auto result = check_source("name.startsWith('al')");
    ASSERT_TRUE(result.ok);

    const auto& refs = result.checked.references;
    auto it = refs.find(result.checked.root.id);
    ASSERT_NE(it, refs.end());
    ASSERT_EQ(it->second.overload_ids.size(), 1u);
    EXPECT_EQ(it->second.overload_ids[0], "starts_with_string");
}

TEST_F(CheckerTest, Variable_RecordsReference) {
    auto result = check_source("age");
    ASSERT_TRUE(result.ok);
    auto it = result.checked.references.find(result.checked.root.id);
    ASSERT_NE(it, result.checked.references.end());
    EXPECT_TRUE(it->second.is_variable());
    EXPECT_EQ(it->second.variable, "age");
}

TEST_F(CheckerTest, QualifiedName_ResolvesToVariable) {
    auto result = check_source("request.method");
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.checked.result_kind(), ValueKind(KindTag::String));
}

TEST_F(CheckerTest, MapSelect_IsDyn) {
    auto result = check_source("request.path");
    ASSERT_TRUE(result.ok);
    EXPECT_TRUE(result.checked.result_kind().is_dyn());
}

TEST_F(CheckerTest, Dyn_AcceptedEverywhere) {
    EXPECT_TRUE(check_source("anything > 1 && anything.startsWith('x')").ok);
}

TEST_F(CheckerTest, Comprehension_OverList) {
    auto result = check_source("tags.exists(t, t == 'a')");
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.checked.result_kind(), ValueKind(KindTag::Bool));
}

TEST_F(CheckerTest, Comprehension_MapMacroIsList) {
    auto result = check_source("tags.map(t, t + '!')");
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.checked.result_kind(), ValueKind(KindTag::List));
}

TEST_F(CheckerTest, Conditional_SameBranches) {
    auto result = check_source("age > 1 ? 'adult' : 'child'");
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.checked.result_kind(), ValueKind(KindTag::String));
}

// ==============================================================================
// Ошибки типов
// ==============================================================================

TEST_F(CheckerTest, Undeclared_AllIssuesReported) {
    // Arrange & Act
    auto result = check_source("foo && bar");

    // Assert
    ASSERT_FALSE(result.ok);
    ASSERT_EQ(result.issues.size(), 2u);
    EXPECT_EQ(result.issues[0].message, "undeclared reference to 'foo'");
    EXPECT_EQ(result.issues[1].message, "undeclared reference to 'bar'");
    EXPECT_LT(result.issues[0].offset, result.issues[1].offset);
}

TEST_F(CheckerTest, UndeclaredFunction) {
    auto result = check_source("frobnicate(1)");
    ASSERT_FALSE(result.ok);
    EXPECT_EQ(result.issues[0].message, "undeclared reference to 'frobnicate'");
}

TEST_F(CheckerTest, NoMatchingOverload_Global) {
    auto result = check_source("size(age)");
    ASSERT_FALSE(result.ok);
    EXPECT_EQ(result.issues[0].message, "found no matching overload for 'size' applied to '(int)'");
}

TEST_F(CheckerTest, NoMatchingOverload_Receiver) {
    auto result = check_source("name.startsWith(1)");
    ASSERT_FALSE(result.ok);
    EXPECT_EQ(result.issues[0].message,
              "found no matching overload for 'startsWith' applied to 'string.(int)'");
}

TEST_F(CheckerTest, Operator_MismatchedKinds) {
    auto result = check_source("name > 1");
    ASSERT_FALSE(result.ok);
    EXPECT_EQ(result.issues[0].message,
              "found no matching overload for '_>_' applied to '(string, int)'");
}

TEST_F(CheckerTest, Arithmetic_MixedKindsRejected) {
    auto result = check_source("age + score");
    ASSERT_FALSE(result.ok);
    EXPECT_EQ(result.issues[0].message,
              "found no matching overload for '_+_' applied to '(int, double)'");
}

TEST_F(CheckerTest, FieldSelection_OnScalar) {
    auto result = check_source("age.value");
    ASSERT_FALSE(result.ok);
    EXPECT_EQ(result.issues[0].message, "type 'int' does not support field selection");
}

TEST_F(CheckerTest, MapLiteral_NonStringKey) {
    auto result = check_source("{1: 'a'}");
    ASSERT_FALSE(result.ok);
    EXPECT_EQ(result.issues[0].message, "unsupported map key type: int");
}

TEST_F(CheckerTest, Comprehension_RangeMustBeIterable) {
    auto result = check_source("age.all(x, x > 0)");
    ASSERT_FALSE(result.ok);
    EXPECT_EQ(result.issues[0].message,
              "expression of type 'int' cannot be range of a comprehension (must be list, map, "
              "or dynamic)");
}

TEST_F(CheckerTest, Comprehension_PredicateMustBeBool) {
    auto result = check_source("tags.all(t, 1)");
    ASSERT_FALSE(result.ok);
    EXPECT_EQ(result.issues[0].message, "predicate of 'all' must be bool, found 'int'");
}

TEST_F(CheckerTest, Comprehension_VariableScoped) {
    auto result = check_source("tags.all(t, true) && t == 'a'");
    ASSERT_FALSE(result.ok);
    EXPECT_EQ(result.issues[0].message, "undeclared reference to 't'");
}

}  // namespace ruleval::expr::test
