// ==============================================================================
// test_output_gtest.cpp - Тесты модуля вывода (GoogleTest)
// ==============================================================================
//
// Writer: префиксы, quiet/verbose, JSON, отчёт об ошибках конвейера.
// Table: рамка и выравнивание.
//
// ==============================================================================

#include "ruleval/output.hpp"

#include <gtest/gtest.h>
#include <rapidjson/document.h>
#include <string>

namespace ruleval::output::test {

namespace {

Error compile_error() {
    Error error;
    error.kind = ErrorKind::Compile;
    error.message = "1 issue found";
    error.expression = "a b";
    error.issues.push_back(expr::Issue{2, "Syntax error: extraneous input 'b'"});
    return error;
}

}  // namespace

// ==============================================================================
// Writer: создание и запись
// ==============================================================================

TEST(OutputTest, Writer_DefaultConfig_CreatesSuccessfully) {
    OutputConfig config;
    EXPECT_NO_THROW({ Writer writer(config); });
    EXPECT_EQ(config.format, Format::Text);
}

TEST(OutputTest, Writer_Write_GoesToStdout) {
    OutputConfig config;
    Writer writer(config);

    testing::internal::CaptureStdout();
    writer.write_line(Stream::Stdout, "plain");
    writer.flush();
    EXPECT_EQ(testing::internal::GetCapturedStdout(), "plain\n");
}

// ==============================================================================
// Префиксы и уровни
// ==============================================================================

TEST(OutputTest, Writer_Info_WritesPrefixToStderr) {
    OutputConfig config;
    Writer writer(config);

    testing::internal::CaptureStderr();
    writer.info("Loaded 2 declarations");
    EXPECT_EQ(testing::internal::GetCapturedStderr(), "[+] Loaded 2 declarations\n");
}

TEST(OutputTest, Writer_QuietMode_InfoSuppressed) {
    OutputConfig config;
    config.quiet = true;
    Writer writer(config);

    testing::internal::CaptureStderr();
    writer.info("suppressed");
    writer.warn("suppressed");
    EXPECT_EQ(testing::internal::GetCapturedStderr(), "");
}

TEST(OutputTest, Writer_QuietMode_ErrorNotSuppressed) {
    OutputConfig config;
    config.quiet = true;
    Writer writer(config);

    testing::internal::CaptureStderr();
    writer.error("boom");
    EXPECT_EQ(testing::internal::GetCapturedStderr(), "[x] boom\n");
}

TEST(OutputTest, Writer_Verbose0_DebugSuppressed) {
    OutputConfig config;
    Writer writer(config);

    testing::internal::CaptureStderr();
    writer.debug("hidden");
    EXPECT_EQ(testing::internal::GetCapturedStderr(), "");
}

TEST(OutputTest, Writer_Verbose1_DebugEnabledTraceSuppressed) {
    OutputConfig config;
    config.verbose = 1;
    Writer writer(config);

    testing::internal::CaptureStderr();
    writer.debug("shown");
    writer.trace("hidden");
    EXPECT_EQ(testing::internal::GetCapturedStderr(), "[*] shown\n");
}

TEST(OutputTest, Writer_Verbose2_TraceEnabled) {
    OutputConfig config;
    config.verbose = 2;
    Writer writer(config);

    testing::internal::CaptureStderr();
    writer.trace("shown");
    EXPECT_EQ(testing::internal::GetCapturedStderr(), "[~] shown\n");
}

// ==============================================================================
// JSON
// ==============================================================================

TEST(OutputTest, WriteJsonLine_Compact) {
    OutputConfig config;
    Writer writer(config);

    rapidjson::Document doc;
    doc.SetObject();
    doc.AddMember("matched", true, doc.GetAllocator());

    testing::internal::CaptureStdout();
    writer.write_json_line(doc);
    writer.flush();
    EXPECT_EQ(testing::internal::GetCapturedStdout(), "{\"matched\":true}\n");
}

TEST(OutputTest, ErrorToJson_Fields) {
    // Arrange
    Error error = compile_error();
    rapidjson::Document doc;

    // Act
    error_to_json(error, doc);

    // Assert
    ASSERT_TRUE(doc.HasMember("error"));
    const auto& body = doc["error"];
    EXPECT_STREQ(body["kind"].GetString(), "Compile");
    EXPECT_STREQ(body["message"].GetString(), "1 issue found");
    EXPECT_STREQ(body["expression"].GetString(), "a b");
    ASSERT_TRUE(body["issues"].IsArray());
    EXPECT_EQ(body["issues"].Size(), 1u);
    EXPECT_FALSE(body.HasMember("cause"));
}

TEST(OutputTest, ReportError_TextModeToStderr) {
    OutputConfig config;
    Writer writer(config);

    testing::internal::CaptureStderr();
    writer.report_error(compile_error());
    std::string err = testing::internal::GetCapturedStderr();

    EXPECT_EQ(err.rfind("[x] compile error: 1 issue found\n", 0), 0u);
    EXPECT_NE(err.find("ERROR: <input>:1:3"), std::string::npos);
}

TEST(OutputTest, ReportError_JsonModeToStdout) {
    OutputConfig config;
    config.format = Format::Json;
    Writer writer(config);

    Error error;
    error.kind = ErrorKind::Evaluation;
    error.message = "failed to evaluate expression";
    error.cause = "division by zero";

    testing::internal::CaptureStdout();
    writer.report_error(error);
    writer.flush();
    std::string out = testing::internal::GetCapturedStdout();

    rapidjson::Document doc;
    doc.Parse(out.c_str());
    ASSERT_FALSE(doc.HasParseError()) << out;
    EXPECT_STREQ(doc["error"]["kind"].GetString(), "Evaluation");
    EXPECT_STREQ(doc["error"]["cause"].GetString(), "division by zero");
}

// ==============================================================================
// Table
// ==============================================================================

TEST(OutputTest, Table_ToString_BoxAndPadding) {
    Table table;
    table.set_headers({"variable", "kind"});
    table.add_row({"age", "int"});

    std::string text = table.to_string();

    EXPECT_NE(text.find("\xe2\x94\x8c"), std::string::npos);  // ┌
    EXPECT_NE(text.find("variable"), std::string::npos);
    EXPECT_NE(text.find("\xe2\x94\x82 age      \xe2\x94\x82 int  \xe2\x94\x82"),
              std::string::npos);
    EXPECT_EQ(table.row_count(), 1u);
}

TEST(OutputTest, Table_ToString_Deterministic) {
    Table a;
    a.set_headers({"k"});
    a.add_row({"v"});
    Table b;
    b.set_headers({"k"});
    b.add_row({"v"});
    EXPECT_EQ(a.to_string(), b.to_string());
}

TEST(OutputTest, Table_WideCharactersAligned) {
    Table table;
    table.set_headers({"name"});
    table.add_row({"\xc3\xa9t\xc3\xa9"});  // "été": 3 колонки, 5 байт

    std::string text = table.to_string();
    EXPECT_NE(text.find("\xe2\x94\x82 \xc3\xa9t\xc3\xa9  \xe2\x94\x82"), std::string::npos);
}

// ==============================================================================
// ANSI
// ==============================================================================

TEST(OutputTest, AnsiCodes) {
    EXPECT_FALSE(ansi_color_code(Color::Red).empty());
    EXPECT_TRUE(ansi_color_code(Color::Default).empty());
    EXPECT_EQ(ansi_color_code(Color::Green).rfind("\x1b[", 0), 0u);
}

}  // namespace ruleval::output::test
