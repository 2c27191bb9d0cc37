#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "sandrun/utils/string_utils.hpp"

namespace {

using ::testing::ElementsAre;
using ::testing::IsEmpty;
using sandrun::utils::StringUtils;

TEST(StringUtilsTest, SplitSkipsEmptyTokens) {
    EXPECT_THAT(StringUtils::Split("/usr/bin::/bin:", ':'), ElementsAre("/usr/bin", "/bin"));
    EXPECT_THAT(StringUtils::Split("", ':'), IsEmpty());
}

TEST(StringUtilsTest, JoinAndTrim) {
    EXPECT_EQ(StringUtils::Join({"a", "b", "c"}, ", "), "a, b, c");
    EXPECT_EQ(StringUtils::Join({}, ", "), "");
    EXPECT_EQ(StringUtils::Trim("  spawn\n"), "spawn");
    EXPECT_EQ(StringUtils::Trim(" \t "), "");
}

TEST(StringUtilsTest, QuoteArgument) {
    EXPECT_EQ(StringUtils::QuoteArgument("plain-arg_1.txt"), "plain-arg_1.txt");
    EXPECT_EQ(StringUtils::QuoteArgument(""), "''");
    EXPECT_EQ(StringUtils::QuoteArgument("two words"), "'two words'");
    EXPECT_EQ(StringUtils::QuoteArgument("it's"), "'it'\\''s'");
}

TEST(StringUtilsTest, FormatCommandLine) {
    EXPECT_EQ(StringUtils::FormatCommandLine("sh", {"-c", "echo $HOME"}), "sh -c 'echo $HOME'");
}

TEST(StringUtilsTest, ParseKeyValue) {
    auto kv = StringUtils::ParseKeyValue("OPTS=a=b");
    ASSERT_TRUE(kv.has_value());
    EXPECT_EQ(kv->first, "OPTS");
    EXPECT_EQ(kv->second, "a=b");

    auto empty_value = StringUtils::ParseKeyValue("EMPTY=");
    ASSERT_TRUE(empty_value.has_value());
    EXPECT_EQ(empty_value->second, "");

    EXPECT_FALSE(StringUtils::ParseKeyValue("NOEQUALS").has_value());
    EXPECT_FALSE(StringUtils::ParseKeyValue("=value").has_value());
}

TEST(StringUtilsTest, Truncate) {
    EXPECT_EQ(StringUtils::Truncate("short", 10), "short");
    EXPECT_EQ(StringUtils::Truncate("abcdefghij", 6), "abc...");
}

} // namespace
