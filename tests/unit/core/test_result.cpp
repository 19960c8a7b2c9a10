//
// Created by gregorian on 12/03/2026.
//

#include <gtest/gtest.h>
#include "cilens/core/result.h"

#include <memory>
#include <string>
#include <vector>

using namespace cilens::core;

TEST(ResultTest, SuccessConstruction) {
    const auto result = Result<int>::success(42);

    EXPECT_TRUE(result.is_success());
    EXPECT_FALSE(result.is_failure());
    EXPECT_EQ(result.value(), 42);
}

TEST(ResultTest, FailureConstruction) {
    const auto result = Result<int>::failure(ErrorCode::FILE_NOT_FOUND, "missing.json");

    EXPECT_FALSE(result.is_success());
    EXPECT_TRUE(result.is_failure());
    EXPECT_EQ(result.error().code, ErrorCode::FILE_NOT_FOUND);
    EXPECT_EQ(result.error().message, "missing.json");
}

TEST(ResultTest, FailureRecordsCallerLocation) {
    const auto result = Result<int>::failure(ErrorCode::INVALID_ARGUMENT, "bad arg");

    EXPECT_NE(result.error().file.find("test_result.cpp"), std::string::npos);
    EXPECT_GT(result.error().line, 0u);
}

TEST(ResultTest, ValueThrowsOnFailure) {
    const auto result = Result<int>::failure(ErrorCode::INVALID_ARGUMENT, "bad arg");

    EXPECT_THROW((void)result.value(), std::runtime_error);
}

TEST(ResultTest, ErrorThrowsOnSuccess) {
    const auto result = Result<int>::success(10);

    EXPECT_THROW((void)result.error(), std::runtime_error);
}

TEST(ResultTest, MoveOutValue) {
    auto result = Result<std::unique_ptr<int>>::success(std::make_unique<int>(7));

    const std::unique_ptr<int> owned = std::move(result).value();
    ASSERT_TRUE(owned != nullptr);
    EXPECT_EQ(*owned, 7);
}

TEST(ResultTest, MapTransformsValue) {
    const auto result = Result<std::vector<int>>::success({3, 1, 2});

    const auto size = result.map([](const std::vector<int>& v) { return v.size(); });
    ASSERT_TRUE(size.is_success());
    EXPECT_EQ(size.value(), 3u);
}

TEST(ResultTest, MapPropagatesError) {
    const auto result = Result<int>::failure(ErrorCode::MALFORMED_DATA, "no id");

    bool called = false;
    const auto mapped = result.map([&](const int v) {
        called = true;
        return std::to_string(v);
    });

    EXPECT_FALSE(called);
    ASSERT_TRUE(mapped.is_failure());
    EXPECT_EQ(mapped.error().code, ErrorCode::MALFORMED_DATA);
    EXPECT_EQ(mapped.error().message, "no id");
}

TEST(ResultTest, MapErrorAttachesContext) {
    auto result = Result<int>::failure(ErrorCode::JSON_PARSE_ERROR, "unexpected token")
        .map_error([](const Error& e) { return e.with_context("pipelines.json"); });

    ASSERT_TRUE(result.is_failure());
    EXPECT_EQ(result.error().code, ErrorCode::JSON_PARSE_ERROR);
    EXPECT_EQ(result.error().context, "pipelines.json");
}

TEST(ResultTest, MapErrorLeavesSuccessAlone) {
    bool called = false;
    auto result = Result<std::string>::success("ok").map_error([&](const Error& e) {
        called = true;
        return e.with_context("unused");
    });

    EXPECT_FALSE(called);
    ASSERT_TRUE(result.is_success());
    EXPECT_EQ(result.value(), "ok");
}

TEST(ResultTest, VoidSuccess) {
    const auto result = Result<void>::success();

    EXPECT_TRUE(result.is_success());
    EXPECT_FALSE(result.is_failure());
    EXPECT_THROW((void)result.error(), std::runtime_error);
}

TEST(ResultTest, VoidFailure) {
    const auto result = Result<void>::failure(ErrorCode::FILE_WRITE_ERROR, "read-only");

    EXPECT_TRUE(result.is_failure());
    EXPECT_EQ(result.error().code, ErrorCode::FILE_WRITE_ERROR);
    EXPECT_EQ(result.error().message, "read-only");
    EXPECT_NE(result.error().file.find("test_result.cpp"), std::string::npos);
}

TEST(ResultTest, VoidFailureFromError) {
    const Error error(ErrorCode::INVALID_CONFIG, "bad level");
    const auto result = Result<void>::failure(error);

    ASSERT_TRUE(result.is_failure());
    EXPECT_EQ(result.error().code, ErrorCode::INVALID_CONFIG);
}
