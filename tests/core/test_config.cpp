#include "pepcheck/core/config.hpp"
#include <gtest/gtest.h>

namespace pepcheck {

TEST(CheckerConfigTest, Defaults)
{
    CheckerConfig config;

    EXPECT_EQ(config.max_line_length, 79);
    EXPECT_TRUE(config.is_ignored("E241"));
    EXPECT_TRUE(config.is_ignored("E242"));
    EXPECT_TRUE(config.is_ignored("W191"));
    EXPECT_FALSE(config.is_ignored("E101"));
    EXPECT_FALSE(config.is_ignored("E225"));
}

TEST(CheckerConfigTest, SelectOverridesIgnore)
{
    CheckerConfig config{.ignore = {"E2", "W"}, .select = {"E225", "W6"}};

    EXPECT_TRUE(config.is_ignored("E201"));
    EXPECT_FALSE(config.is_ignored("E225"));
    EXPECT_TRUE(config.is_ignored("W291"));
    EXPECT_FALSE(config.is_ignored("W601"));
    EXPECT_FALSE(config.is_ignored("E501"));
}

TEST(CheckerConfigTest, EmptyIgnoreReportsEverything)
{
    CheckerConfig config{.ignore = {}};

    EXPECT_FALSE(config.is_ignored("E241"));
    EXPECT_FALSE(config.is_ignored("W191"));
}

} // namespace pepcheck
