//
// Created by gregorian on 12/03/2026.
//

#include <gtest/gtest.h>
#include "cilens/utils/string_utils.h"

using namespace cilens::utils;

TEST(StringUtilsTest, JoinStrings) {
    EXPECT_EQ(join({"build", "test", "deploy"}, ", "), "build, test, deploy");
    EXPECT_EQ(join({"only"}, "-"), "only");
    EXPECT_EQ(join({}, "-"), "");
}

TEST(StringUtilsTest, Contains) {
    EXPECT_TRUE(contains("deploy-production", "prod"));
    EXPECT_FALSE(contains("deploy-Production", "prod"));
}

TEST(StringUtilsTest, ContainsIgnoreCase) {
    EXPECT_TRUE(contains_ignore_case("Deploy-PRODUCTION", "prod"));
    EXPECT_TRUE(contains_ignore_case("unit_Test", "TEST"));
    EXPECT_FALSE(contains_ignore_case("lint", "qa"));
}

TEST(StringUtilsTest, CaseConversion) {
    EXPECT_EQ(to_lower("SuCcEsS"), "success");
    EXPECT_EQ(to_upper("canceled"), "CANCELED");
}

TEST(StringUtilsTest, LastSegment) {
    EXPECT_EQ(last_segment("gid://gitlab/Ci::Pipeline/123", '/'), "123");
    EXPECT_EQ(last_segment("456", '/'), "456");
    EXPECT_EQ(last_segment("trailing/", '/'), "");
}
