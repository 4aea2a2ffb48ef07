#include "cli_args.h"
#include <gtest/gtest.h>

using namespace marginalia;

// Option names
TEST(CliArgsTest, OptionNameMustMatchExactly) {
    EXPECT_TRUE(is_option("--files", "--files"));
    EXPECT_TRUE(is_option("--files=*.py", "--files"));
    EXPECT_TRUE(is_option("--fail=halt", "--fail"));
    EXPECT_FALSE(is_option("--filesx", "--files"));
    EXPECT_FALSE(is_option("--excludes=.git", "--exclude"));
    EXPECT_FALSE(is_option("--failure", "--fail"));
    EXPECT_FALSE(is_option("--fil", "--files"));
}

TEST(CliArgsTest, MatchOptionValue) {
    std::string value = "stale";
    EXPECT_TRUE(match_option("--inventory", "--inventory", &value));
    EXPECT_EQ(value, "");
    EXPECT_TRUE(match_option("--inventory=stdout", "--inventory", &value));
    EXPECT_EQ(value, "stdout");
    EXPECT_FALSE(match_option("--inventoryx", "--inventory", &value));
}

TEST(CliArgsTest, TakeValueFromNextArgument) {
    char prog[] = "marginalia";
    char flag[] = "--fail";
    char policy[] = "halt";
    char* argv[] = {prog, flag, policy};

    int i = 1;
    std::string value;
    ASSERT_TRUE(take_value("--fail", "--fail", 3, argv, &i, &value));
    EXPECT_EQ(value, "halt");
    EXPECT_EQ(i, 2);

    i = 2;
    EXPECT_FALSE(take_value("--fail", "--fail", 3, argv, &i, &value));
}

// Glob lists
TEST(CliArgsTest, SplitGlobsDropsEmptyEntries) {
    EXPECT_EQ(split_globs("*.py,*.pyw"), (std::vector<std::string>{"*.py", "*.pyw"}));
    EXPECT_EQ(split_globs(",build,,dist,"), (std::vector<std::string>{"build", "dist"}));
    EXPECT_TRUE(split_globs("").empty());
}
