#include "pepcheck/core/text_utils.hpp"
#include <gtest/gtest.h>

namespace pepcheck {

TEST(TextUtilsTest, LeadingIndentation)
{
    EXPECT_EQ(leading_indentation("    a = 1"), "    ");
    EXPECT_EQ(leading_indentation("\t  b"), "\t  ");
    EXPECT_EQ(leading_indentation("c"), "");
    EXPECT_EQ(leading_indentation("   "), "   ");
}

TEST(TextUtilsTest, RstripNewlines)
{
    EXPECT_EQ(rstrip_newlines("abc"), "abc");
    EXPECT_EQ(rstrip_newlines(""), "");
    EXPECT_EQ(rstrip_newlines("abc\n"), "abc");
    EXPECT_EQ(rstrip_newlines("abc\r"), "abc");
    EXPECT_EQ(rstrip_newlines("abc\x0c"), "abc");
    EXPECT_EQ(rstrip_newlines("abc\r\x0c\n"), "abc");
    EXPECT_EQ(rstrip_newlines("abc \n"), "abc ");
}

TEST(TextUtilsTest, LineEnding)
{
    EXPECT_EQ(line_ending("abc"), "");
    EXPECT_EQ(line_ending("abc\n"), "\n");
    EXPECT_EQ(line_ending("abc\r\n"), "\r\n");
    EXPECT_EQ(line_ending("abc\r"), "\r");
}

TEST(TextUtilsTest, StripHelpers)
{
    EXPECT_EQ(rstrip("spam(1) \t\n"), "spam(1)");
    EXPECT_EQ(strip("  spam(1)  "), "spam(1)");
    EXPECT_TRUE(is_blank(" \t\n"));
    EXPECT_TRUE(is_blank(""));
    EXPECT_FALSE(is_blank("  x "));
}

TEST(TextUtilsTest, IndentationLevel)
{
    EXPECT_EQ(indentation_level("    "), 4);
    EXPECT_EQ(indentation_level("\t"), 8);
    EXPECT_EQ(indentation_level("    \t"), 8);
    EXPECT_EQ(indentation_level("       \t"), 8);
    EXPECT_EQ(indentation_level("        \t"), 16);
    EXPECT_EQ(indentation_level("\t "), 9);
    EXPECT_EQ(indentation_level("  x  "), 2);
    EXPECT_EQ(indentation_level(""), 0);
}

TEST(TextUtilsTest, IndentationLevelIsStable)
{
    for (std::string_view indent : {" ", "\t", " \t ", "\t\t   ", "   \t\t"}) {
        EXPECT_EQ(indentation_level(indent), indentation_level(std::string(indent)));
    }
}

TEST(TextUtilsTest, MuteString)
{
    EXPECT_EQ(mute_string("\"abc\""), "\"xxx\"");
    EXPECT_EQ(mute_string("'''abc'''"), "'''xxx'''");
    EXPECT_EQ(mute_string("r'abc'"), "r'xxx'");
    EXPECT_EQ(mute_string("ur\"abc\""), "ur\"xxx\"");
    EXPECT_EQ(mute_string("\"\"\"a\nb\"\"\""), "\"\"\"xxx\"\"\"");
    EXPECT_EQ(mute_string("''"), "''");
    EXPECT_EQ(mute_string("''''''"), "''''''");
}

TEST(TextUtilsTest, MuteStringIsIdempotentAndKeepsLength)
{
    for (std::string_view literal : {"'a, b'", "b\"(x)\"", "'''x = 1\n'''", "R'\\n'", "\"\""}) {
        auto muted = mute_string(literal);
        EXPECT_EQ(muted.size(), literal.size());
        EXPECT_EQ(mute_string(muted), muted);
    }
}

TEST(TextUtilsTest, Utf8Length)
{
    EXPECT_EQ(utf8_length("abc"), 3u);
    EXPECT_EQ(utf8_length("h\xc3\xa9llo"), 5u);          // é
    EXPECT_EQ(utf8_length("\xe2\x82\xac"), 1u);          // €
    EXPECT_EQ(utf8_length("\xf0\x9f\x98\x80"), 1u);      // emoji
    EXPECT_EQ(utf8_length("\xff"), std::nullopt);
    EXPECT_EQ(utf8_length("\xc3"), std::nullopt);         // Truncated sequence
}

TEST(TextUtilsTest, SplitLinesKeepsTerminators)
{
    auto lines = split_lines("a\nb\r\nc\rd");
    ASSERT_EQ(lines.size(), 4);
    EXPECT_EQ(lines[0], "a\n");
    EXPECT_EQ(lines[1], "b\r\n");
    EXPECT_EQ(lines[2], "c\r");
    EXPECT_EQ(lines[3], "d");

    EXPECT_TRUE(split_lines("").empty());
    EXPECT_EQ(split_lines("\n\n").size(), 2);
}

TEST(TextUtilsTest, StartsWithAny)
{
    EXPECT_TRUE(starts_with_any("E241", {"E24"}));
    EXPECT_TRUE(starts_with_any("W191", {"E", "W"}));
    EXPECT_FALSE(starts_with_any("E501", {"E24", "W"}));
    EXPECT_FALSE(starts_with_any("E501", {}));
    EXPECT_TRUE(starts_with_any("E501", {""}));
}

} // namespace pepcheck
