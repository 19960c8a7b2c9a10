//
// Created by gregorian on 12/03/2026.
//

#include <gtest/gtest.h>
#include "cilens/core/error.h"

using namespace cilens::core;

TEST(ErrorTest, BasicConstruction) {
    const Error error(ErrorCode::INVALID_ARGUMENT, "invalid value");

    EXPECT_EQ(error.code, ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(error.message, "invalid value");
    EXPECT_TRUE(error.context.empty());
}

TEST(ErrorTest, RecordsSourceLocation) {
    const Error error(ErrorCode::MALFORMED_DATA, "boom");

    EXPECT_NE(error.file.find("test_error.cpp"), std::string::npos);
    EXPECT_GT(error.line, 0u);
    EXPECT_FALSE(error.function.empty());
}

TEST(ErrorTest, WithContextLeavesOriginalUntouched) {
    const Error error(ErrorCode::JSON_PARSE_ERROR, "unexpected token");
    const Error wrapped = error.with_context("pipelines.json");

    EXPECT_TRUE(error.context.empty());
    EXPECT_EQ(wrapped.context, "pipelines.json");
    EXPECT_EQ(wrapped.code, ErrorCode::JSON_PARSE_ERROR);
    EXPECT_EQ(wrapped.message, "unexpected token");
    EXPECT_EQ(wrapped.line, error.line);
}

TEST(ErrorTest, OuterContextReadsFirst) {
    const Error error = Error(ErrorCode::CIRCULAR_DEPENDENCY, "cycle")
        .with_context("pipeline 7")
        .with_context("input.json");

    EXPECT_EQ(error.context, "input.json: pipeline 7");
}

TEST(ErrorTest, ToStringWithoutContext) {
    const Error error(ErrorCode::FILE_NOT_FOUND, "missing.json");
    const std::string text = error.to_string();

    EXPECT_EQ(text.rfind("File not found: missing.json", 0), 0u);
    EXPECT_EQ(text.find("While processing"), std::string::npos);
    EXPECT_NE(text.find("Raised at: "), std::string::npos);
    EXPECT_NE(text.find("test_error.cpp"), std::string::npos);
}

TEST(ErrorTest, ToStringIncludesContext) {
    const Error error = Error(ErrorCode::PARSE_ERROR, "expected '='").with_context("cilens.toml");
    const std::string text = error.to_string();

    EXPECT_NE(text.find("Configuration parse error: expected '='"), std::string::npos);
    EXPECT_NE(text.find("\n  While processing: cilens.toml"), std::string::npos);
}

TEST(ErrorTest, CodeNames) {
    EXPECT_STREQ(error_code_to_string(ErrorCode::FILE_NOT_FOUND), "File not found");
    EXPECT_STREQ(error_code_to_string(ErrorCode::FILE_READ_ERROR), "File read error");
    EXPECT_STREQ(error_code_to_string(ErrorCode::FILE_WRITE_ERROR), "File write error");
    EXPECT_STREQ(error_code_to_string(ErrorCode::INVALID_ARGUMENT), "Invalid argument");
    EXPECT_STREQ(error_code_to_string(ErrorCode::INVALID_CONFIG), "Invalid configuration");
    EXPECT_STREQ(error_code_to_string(ErrorCode::PARSE_ERROR), "Configuration parse error");
    EXPECT_STREQ(error_code_to_string(ErrorCode::JSON_PARSE_ERROR), "Pipeline JSON parse error");
    EXPECT_STREQ(error_code_to_string(ErrorCode::MALFORMED_DATA), "Malformed pipeline data");
    EXPECT_STREQ(error_code_to_string(ErrorCode::CIRCULAR_DEPENDENCY), "Circular job dependency");
}
