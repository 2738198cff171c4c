// ==============================================================================
// test_engine_gtest.cpp - Тесты конвейера evaluate (GoogleTest)
// ==============================================================================
//
// Сквозные сценарии: документ + выражение -> вердикт или ошибка нужного вида.
//
// ==============================================================================

#include "ruleval/engine.hpp"

#include <gtest/gtest.h>
#include <string>

namespace ruleval::test {

namespace {

Verdict eval_rule(const std::string& data, std::string_view expression,
                  const std::vector<Declaration>& extra = {}) {
    return evaluate(&data, expression, extra);
}

}  // namespace

// ==============================================================================
// Успешное вычисление
// ==============================================================================

TEST(EngineTest, Evaluate_FieldsAndSafeFallback) {
    // Arrange
    std::string data = R"({"user":"alice","age":30})";

    // Act
    auto verdict = eval_rule(data, R"(age > 18 && safe("role", "guest") == "guest")");

    // Assert
    ASSERT_TRUE(verdict.ok) << verdict.error.format();
    EXPECT_TRUE(verdict.matched);
}

TEST(EngineTest, Evaluate_ExistsOnNestedPaths) {
    std::string data = R"({"a":{"b":1}})";
    auto verdict = eval_rule(data, R"(exists("a.b") && !exists("a.c"))");
    ASSERT_TRUE(verdict.ok) << verdict.error.format();
    EXPECT_TRUE(verdict.matched);
}

TEST(EngineTest, Evaluate_SafeNumberFallback) {
    std::string data = R"({"user":"alice"})";
    auto verdict = eval_rule(data, R"(safe("score", 0.0) == 0.0)");
    ASSERT_TRUE(verdict.ok) << verdict.error.format();
    EXPECT_TRUE(verdict.matched);
}

TEST(EngineTest, Evaluate_SafeWrongKindFallback) {
    std::string data = R"({"score":"notanumber"})";
    auto verdict = eval_rule(data, R"(safe("score", 0.0) == 0.0)");
    ASSERT_TRUE(verdict.ok) << verdict.error.format();
    EXPECT_TRUE(verdict.matched);
}

TEST(EngineTest, Evaluate_SafeIntDefaultIsCompileError) {
    std::string data = R"({"score":1})";
    auto verdict = eval_rule(data, R"(safe("score", 0) == 0)");
    ASSERT_FALSE(verdict.ok);
    EXPECT_EQ(verdict.error.kind, ErrorKind::Compile);
}

TEST(EngineTest, Evaluate_FalseVerdict) {
    std::string data = R"({"age":12})";
    auto verdict = eval_rule(data, "age > 18");
    ASSERT_TRUE(verdict.ok);
    EXPECT_FALSE(verdict.matched);
}

TEST(EngineTest, Evaluate_NestedDocumentFields) {
    std::string data = R"({"event":{"type":"login","tags":["vpn","mfa"]}})";
    auto verdict = eval_rule(data, "event.type == 'login' && 'mfa' in event.tags");
    ASSERT_TRUE(verdict.ok) << verdict.error.format();
    EXPECT_TRUE(verdict.matched);
}

TEST(EngineTest, Evaluate_ShortCircuitHidesRuntimeError) {
    std::string data = R"({"n":0})";
    auto verdict = eval_rule(data, "false && 10 / int(n) == 1");
    ASSERT_TRUE(verdict.ok) << verdict.error.format();
    EXPECT_FALSE(verdict.matched);
}

// ==============================================================================
// Числа документа
// ==============================================================================

TEST(EngineTest, DocumentNumbers_DoubleArithmetic) {
    // Arrange
    std::string data = R"({"bytes":1500})";

    // Act
    auto verdict = eval_rule(data, "bytes / 1000.0 > 1.2");

    // Assert
    ASSERT_TRUE(verdict.ok) << verdict.error.format();
    EXPECT_TRUE(verdict.matched);
}

TEST(EngineTest, DocumentNumbers_IntegralValueMultipliedByDouble) {
    std::string data = R"({"score":7})";
    auto verdict = eval_rule(data, "score * 1.5 > 10.0");
    ASSERT_TRUE(verdict.ok) << verdict.error.format();
    EXPECT_TRUE(verdict.matched);
}

TEST(EngineTest, DocumentNumbers_ComparedWithIntLiteral) {
    std::string data = R"({"bytes":1500})";
    auto verdict = eval_rule(data, "bytes > 1000 && bytes == 1500");
    ASSERT_TRUE(verdict.ok) << verdict.error.format();
    EXPECT_TRUE(verdict.matched);
}

TEST(EngineTest, DocumentNumbers_MixedArithmeticIsCompileError) {
    std::string data = R"({"bytes":1500})";
    auto verdict = eval_rule(data, "bytes / 1000 > 1.2");
    ASSERT_FALSE(verdict.ok);
    EXPECT_EQ(verdict.error.kind, ErrorKind::Compile);
    ASSERT_EQ(verdict.error.issues.size(), 1u);
    EXPECT_NE(verdict.error.format().find("found no matching overload for '_/_'"),
              std::string::npos);
}

TEST(EngineTest, DocumentNumbers_NestedValuesAreDouble) {
    std::string data = R"({"event":{"port":443,"ids":[1,2]}})";
    auto verdict = eval_rule(data, "event.port == 443.0 && event.ids[0] + 0.5 == 1.5");
    ASSERT_TRUE(verdict.ok) << verdict.error.format();
    EXPECT_TRUE(verdict.matched);
}

// ==============================================================================
// Большие входы
// ==============================================================================

TEST(EngineTest, Evaluate_LongOrChain) {
    // Arrange: список блокировки из 50000 адресов, совпадает последний
    std::string data = R"({"ip":"10.0.195.79"})";
    std::string expression = "ip == '10.0.0.0'";
    for (int i = 1; i < 50000; ++i) {
        expression += " || ip == '10.0." + std::to_string(i / 256) + "." +
                      std::to_string(i % 256) + "'";
    }

    // Act
    auto verdict = eval_rule(data, expression);

    // Assert
    ASSERT_TRUE(verdict.ok) << verdict.error.message;
    EXPECT_TRUE(verdict.matched);
}

TEST(EngineTest, Evaluate_LongAdditionChainIsCompileError) {
    std::string data = R"({"x":1})";
    std::string expression = "x";
    for (int i = 0; i < 50000; ++i) {
        expression += " + x";
    }
    expression += " > 0.0";

    auto verdict = eval_rule(data, expression);

    ASSERT_FALSE(verdict.ok);
    EXPECT_EQ(verdict.error.kind, ErrorKind::Compile);
}

TEST(EngineTest, Evaluate_DeeplyNestedPayload) {
    std::string data = "{\"a\":" + std::string(100000, '[') + std::string(100000, ']') + "}";
    auto verdict = eval_rule(data, "true");
    ASSERT_FALSE(verdict.ok);
    EXPECT_EQ(verdict.error.kind, ErrorKind::PayloadParse);
    EXPECT_EQ(verdict.error.cause, "document nesting exceeds maximum depth of 1000");
}

// ==============================================================================
// Таксономия ошибок
// ==============================================================================

TEST(EngineTest, Evaluate_NilInput) {
    auto verdict = evaluate(nullptr, "true");
    ASSERT_FALSE(verdict.ok);
    EXPECT_EQ(verdict.error.kind, ErrorKind::NilInput);
}

TEST(EngineTest, Evaluate_PayloadParse) {
    auto verdict = eval_rule("{broken", "true");
    ASSERT_FALSE(verdict.ok);
    EXPECT_EQ(verdict.error.kind, ErrorKind::PayloadParse);
    EXPECT_FALSE(verdict.error.cause.empty());
}

TEST(EngineTest, Evaluate_PayloadNotObject) {
    auto verdict = eval_rule("[1]", "true");
    ASSERT_FALSE(verdict.ok);
    EXPECT_EQ(verdict.error.kind, ErrorKind::PayloadParse);
}

TEST(EngineTest, Evaluate_CompileCollectsAllIssues) {
    std::string data = R"({"a":1})";
    auto verdict = eval_rule(data, "foo == 1 && bar == 2");
    ASSERT_FALSE(verdict.ok);
    EXPECT_EQ(verdict.error.kind, ErrorKind::Compile);
    ASSERT_EQ(verdict.error.issues.size(), 2u);
    EXPECT_EQ(verdict.error.message, "2 issues found");
}

TEST(EngineTest, Evaluate_SyntaxErrorIsCompile) {
    std::string data = "{}";
    auto verdict = eval_rule(data, "a &&");
    ASSERT_FALSE(verdict.ok);
    EXPECT_EQ(verdict.error.kind, ErrorKind::Compile);
    EXPECT_EQ(verdict.error.issues.size(), 1u);
}

TEST(EngineTest, Evaluate_RuntimeError) {
    std::string data = R"({"n":0})";
    auto verdict = eval_rule(data, "10 / int(n) == 1");
    ASSERT_FALSE(verdict.ok);
    EXPECT_EQ(verdict.error.kind, ErrorKind::Evaluation);
    EXPECT_EQ(verdict.error.cause, "division by zero");
}

TEST(EngineTest, Evaluate_NonBooleanResult) {
    std::string data = R"({"age":30})";
    auto verdict = eval_rule(data, "age + 1.0");
    ASSERT_FALSE(verdict.ok);
    EXPECT_EQ(verdict.error.kind, ErrorKind::NonBooleanResult);
    EXPECT_EQ(verdict.error.message, "expression result is double, expected bool");
}

// ==============================================================================
// Дополнительные декларации
// ==============================================================================

TEST(EngineTest, Extra_OverridesDocumentField) {
    std::string data = R"({"tenant":"acme"})";
    std::vector<Declaration> extra{{"tenant", KindTag::String, Value("globex")}};
    auto verdict = eval_rule(data, "tenant == 'globex'", extra);
    ASSERT_TRUE(verdict.ok) << verdict.error.format();
    EXPECT_TRUE(verdict.matched);
}

TEST(EngineTest, Extra_WithoutValueBindsDocumentField) {
    std::string data = R"({"request":{"method":"GET"}})";
    std::vector<Declaration> extra{{"request", ValueKind::dyn(), std::nullopt}};
    auto verdict = eval_rule(data, "request.method == 'GET'", extra);
    ASSERT_TRUE(verdict.ok) << verdict.error.format();
    EXPECT_TRUE(verdict.matched);
}

TEST(EngineTest, Extra_UnboundFailsAtUse) {
    std::string data = "{}";
    std::vector<Declaration> extra{{"tenant", KindTag::String, std::nullopt}};
    auto verdict = eval_rule(data, "tenant == 'acme'", extra);
    ASSERT_FALSE(verdict.ok);
    EXPECT_EQ(verdict.error.kind, ErrorKind::Evaluation);
}

TEST(EngineTest, Extra_IntBindsIntegralDocumentNumber) {
    // Arrange
    std::string data = R"({"count":3})";
    std::vector<Declaration> extra{{"count", KindTag::Int, std::nullopt}};

    // Act
    auto verdict = eval_rule(data, "count + 1 == 4", extra);

    // Assert
    ASSERT_TRUE(verdict.ok) << verdict.error.format();
    EXPECT_TRUE(verdict.matched);
}

TEST(EngineTest, Extra_UintBindsIntegralDocumentNumber) {
    std::string data = R"({"count":3})";
    std::vector<Declaration> extra{{"count", KindTag::Uint, std::nullopt}};
    auto verdict = eval_rule(data, "count * 2u == 6u", extra);
    ASSERT_TRUE(verdict.ok) << verdict.error.format();
    EXPECT_TRUE(verdict.matched);
}

TEST(EngineTest, Extra_IntRejectsFractionalDocumentNumber) {
    std::string data = R"({"count":3.5})";
    std::vector<Declaration> extra{{"count", KindTag::Int, std::nullopt}};
    auto verdict = eval_rule(data, "count > 1", extra);
    ASSERT_FALSE(verdict.ok);
    EXPECT_EQ(verdict.error.kind, ErrorKind::EnvironmentBuild);
    EXPECT_EQ(verdict.error.cause, "variable 'count' declared as int but its value is double");
}

TEST(EngineTest, Extra_KindMismatchWithDocument) {
    std::string data = R"({"age":"thirty"})";
    std::vector<Declaration> extra{{"age", KindTag::Int, std::nullopt}};
    auto verdict = eval_rule(data, "age > 18", extra);
    ASSERT_FALSE(verdict.ok);
    EXPECT_EQ(verdict.error.kind, ErrorKind::EnvironmentBuild);
}

TEST(EngineTest, Extra_SuppliedValueMismatch) {
    std::string data = "{}";
    std::vector<Declaration> extra{{"limit", KindTag::Int, Value("ten")}};
    auto verdict = eval_rule(data, "limit > 1", extra);
    ASSERT_FALSE(verdict.ok);
    EXPECT_EQ(verdict.error.kind, ErrorKind::EnvironmentBuild);
    EXPECT_EQ(verdict.error.cause, "variable 'limit' declared as int but its value is string");
}

TEST(EngineTest, Extra_DynAcceptsAnyValue) {
    std::string data = "{}";
    std::vector<Declaration> extra{{"meta", ValueKind::dyn(), Value(std::int64_t{5})}};
    auto verdict = eval_rule(data, "meta == 5", extra);
    ASSERT_TRUE(verdict.ok) << verdict.error.format();
    EXPECT_TRUE(verdict.matched);
}

TEST(EngineTest, Extra_DuplicateDeclaration) {
    std::string data = "{}";
    std::vector<Declaration> extra{{"x", KindTag::Int, Value(std::int64_t{1})},
                                   {"x", KindTag::Int, Value(std::int64_t{2})}};
    auto verdict = eval_rule(data, "x == 1", extra);
    ASSERT_FALSE(verdict.ok);
    EXPECT_EQ(verdict.error.kind, ErrorKind::EnvironmentBuild);
    EXPECT_EQ(verdict.error.cause, "duplicate declaration 'x'");
}

// ==============================================================================
// Стадии по отдельности
// ==============================================================================

TEST(EngineTest, BuildEnvironment_DeclaresDocumentFieldsAndAccessors) {
    auto payload = parse_payload(R"({"user":"alice","age":30})");
    ASSERT_TRUE(payload.ok);

    auto env = build_environment(payload.payload);
    ASSERT_TRUE(env.ok);

    const VariableBinding* age = env.environment->find_variable("age");
    ASSERT_NE(age, nullptr);
    EXPECT_EQ(age->kind, ValueKind(KindTag::Double));
    EXPECT_NE(env.environment->find_function("exists"), nullptr);
    EXPECT_NE(env.environment->find_function("safe"), nullptr);
    EXPECT_NE(env.environment->find_function("size"), nullptr);
}

TEST(EngineTest, BuildEnvironment_NullPayload) {
    auto env = build_environment(nullptr);
    ASSERT_FALSE(env.ok);
    EXPECT_EQ(env.error.kind, ErrorKind::NilInput);
}

TEST(EngineTest, Prepare_ExposesProgram) {
    std::string data = R"({"age":30})";
    auto prepared = prepare(&data, "age > 18");
    ASSERT_TRUE(prepared.ok);
    EXPECT_EQ(prepared.program->result_kind(), ValueKind(KindTag::Bool));
}

TEST(EngineTest, ValidateResult) {
    EXPECT_TRUE(validate_result(Value(true)).matched);
    EXPECT_EQ(validate_result(Value("x")).error.kind, ErrorKind::NonBooleanResult);
}

TEST(EngineTest, ErrorKindName) {
    EXPECT_STREQ(error_kind_name(ErrorKind::NilInput), "NilInput");
    EXPECT_STREQ(error_kind_name(ErrorKind::NonBooleanResult), "NonBooleanResult");
}

TEST(EngineTest, ErrorFormat_IncludesCauseAndIssues) {
    std::string data = R"({"n":0})";
    auto runtime = eval_rule(data, "10 / int(n) == 1");
    EXPECT_EQ(runtime.error.format(),
              "evaluation error: failed to evaluate expression: division by zero");

    auto compile_error = eval_rule(data, "missing");
    EXPECT_NE(compile_error.error.format().find("undeclared reference to 'missing'"),
              std::string::npos);
}

}  // namespace ruleval::test
