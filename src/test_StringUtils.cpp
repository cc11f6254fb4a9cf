#include "StringUtils.h"

#include <gtest/gtest.h>

using namespace notifyall::utils;

TEST(StringUtilsTest, Trim)
{
    EXPECT_EQ(trim("  /usr/bin \t\n"), "/usr/bin");
    EXPECT_EQ(trim("   "), "");
    EXPECT_EQ(trim(""), "");
}

TEST(StringUtilsTest, SplitDropsEmptyTokens)
{
    std::vector<std::string> expected = { "/usr/bin", "/bin" };
    EXPECT_EQ(split("/usr/bin::/bin:", ':'), expected);
    EXPECT_TRUE(split("", ':').empty());
}

TEST(StringUtilsTest, FixedFieldStopsAtNulOrLength)
{
    const char padded[8] = { 'a', 'n', 'd', 'y', '\0', 'x', 'x', 'x' };
    EXPECT_EQ(fromFixedField(padded, sizeof(padded)), "andy");

    const char full[4] = { 'r', 'o', 'o', 't' };
    EXPECT_EQ(fromFixedField(full, sizeof(full)), "root");
}
