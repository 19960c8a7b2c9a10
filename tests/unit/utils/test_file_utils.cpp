//
// Created by gregorian on 12/03/2026.
//

#include <gtest/gtest.h>
#include "cilens/utils/file_utils.h"

#include <filesystem>

using namespace cilens::utils;
namespace fs = std::filesystem;

class FileUtilsTest : public ::testing::Test {
protected:
    void SetUp() override {
        temp_dir = fs::temp_directory_path() / "cilens_file_utils_test";
        fs::create_directories(temp_dir);
    }

    void TearDown() override {
        if (fs::exists(temp_dir)) {
            fs::remove_all(temp_dir);
        }
    }

    fs::path temp_dir;
};

TEST_F(FileUtilsTest, WriteThenRead) {
    const auto path = (temp_dir / "insights.json").string();

    ASSERT_TRUE(write_file(path, "{\"pipeline_types\": []}"));
    EXPECT_TRUE(file_exists(path));

    const auto content = read_file(path);
    ASSERT_TRUE(content.has_value());
    EXPECT_EQ(*content, "{\"pipeline_types\": []}");
}

TEST_F(FileUtilsTest, WriteCreatesParentDirectories) {
    const auto path = (temp_dir / "a" / "b" / "out.json").string();

    ASSERT_TRUE(write_file(path, "x"));
    EXPECT_TRUE(fs::exists(temp_dir / "a" / "b"));
}

TEST_F(FileUtilsTest, WriteTruncatesExistingFile) {
    const auto path = (temp_dir / "out.txt").string();

    ASSERT_TRUE(write_file(path, "a much longer first version"));
    ASSERT_TRUE(write_file(path, "short"));
    EXPECT_EQ(read_file(path).value_or(""), "short");
}

TEST_F(FileUtilsTest, ReadMissingFile) {
    EXPECT_FALSE(read_file((temp_dir / "missing.json").string()).has_value());
    EXPECT_FALSE(file_exists((temp_dir / "missing.json").string()));
}

TEST_F(FileUtilsTest, DirectoryIsNotAFile) {
    EXPECT_FALSE(file_exists(temp_dir.string()));
}
