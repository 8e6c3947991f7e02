#include "pepcheck/checks/physical_checks.hpp"
#include <gtest/gtest.h>

namespace pepcheck {

class PhysicalChecksTest : public ::testing::Test {
protected:
    // Run `check` on line `row` of a document built from `lines`
    template <typename Check>
    auto run(Check check, std::vector<std::string> lines, int row = 1) -> std::optional<Finding> {
        document_.emplace(std::move(lines));
        line_ = PhysicalLine{.text = document_->line(row), .line_number = row};
        return check(PhysicalContext{.line = *line_, .document = *document_, .config = config_});
    }

    template <typename Fix>
    auto fix(Fix fixer, std::vector<std::string> lines, int row = 1) -> std::string {
        document_.emplace(std::move(lines));
        line_ = PhysicalLine{.text = document_->line(row), .line_number = row};
        return fixer(PhysicalContext{.line = *line_, .document = *document_, .config = config_});
    }

    CheckerConfig config_;
    std::optional<Document> document_;
    std::optional<PhysicalLine> line_;
};

TEST_F(PhysicalChecksTest, MixedIndentationAgainstSpaceDocument)
{
    auto finding = run(checks::tabs_or_spaces,
                       {"if a == 0:\n", "        a = 1\n", "        b = 1\n", "\tc = 1\n"}, 4);

    ASSERT_TRUE(finding.has_value());
    EXPECT_EQ(finding->code, "E101");
    EXPECT_EQ(std::get<size_t>(finding->column), 0u);
}

TEST_F(PhysicalChecksTest, ConsistentIndentationIsClean)
{
    EXPECT_FALSE(run(checks::tabs_or_spaces, {"if a:\n", "    b = 1\n"}, 2).has_value());
}

TEST_F(PhysicalChecksTest, TabIndentationIsObsolete)
{
    auto finding = run(checks::tabs_obsolete, {"if True:\n", "\treturn\n"}, 2);

    ASSERT_TRUE(finding.has_value());
    EXPECT_EQ(finding->code, "W191");
    EXPECT_EQ(std::get<size_t>(finding->column), 0u);
}

TEST_F(PhysicalChecksTest, TabAfterCodeIsNotIndentation)
{
    EXPECT_FALSE(run(checks::tabs_obsolete, {"x = 1\t# c\n"}).has_value());
}

TEST_F(PhysicalChecksTest, TrailingWhitespaceAfterCode)
{
    auto finding = run(checks::trailing_whitespace, {"spam(1) \n"});

    ASSERT_TRUE(finding.has_value());
    EXPECT_EQ(finding->code, "W291");
    EXPECT_EQ(std::get<size_t>(finding->column), 7u);
}

TEST_F(PhysicalChecksTest, WhitespaceOnlyLine)
{
    auto finding = run(checks::trailing_whitespace, {"class Foo(object):\n", "    \n"}, 2);

    ASSERT_TRUE(finding.has_value());
    EXPECT_EQ(finding->code, "W293");
    EXPECT_TRUE(std::holds_alternative<std::monostate>(finding->column));
}

TEST_F(PhysicalChecksTest, TerminatorIsNotTrailingWhitespace)
{
    EXPECT_FALSE(run(checks::trailing_whitespace, {"spam(1)\r\n"}).has_value());
    EXPECT_FALSE(run(checks::trailing_whitespace, {"\n"}).has_value());
}

TEST_F(PhysicalChecksTest, BlankLastLine)
{
    auto finding = run(checks::trailing_blank_lines, {"spam(1)\n", "\n"}, 2);

    ASSERT_TRUE(finding.has_value());
    EXPECT_EQ(finding->code, "W391");
}

TEST_F(PhysicalChecksTest, BlankLineBeforeTheEndIsFine)
{
    EXPECT_FALSE(run(checks::trailing_blank_lines, {"a\n", "\n", "b\n"}, 2).has_value());
}

TEST_F(PhysicalChecksTest, MissingNewlineAtEndOfFile)
{
    auto finding = run(checks::missing_newline, {"x = 1\n", "spam(1)"}, 2);

    ASSERT_TRUE(finding.has_value());
    EXPECT_EQ(finding->code, "W292");
    EXPECT_EQ(std::get<size_t>(finding->column), 7u);
    EXPECT_FALSE(run(checks::missing_newline, {"spam(1)\n"}).has_value());
}

TEST_F(PhysicalChecksTest, LineAtLimitIsAccepted)
{
    EXPECT_FALSE(run(checks::maximum_line_length, {std::string(79, 'x') + "\n"}).has_value());
}

TEST_F(PhysicalChecksTest, LineOverLimit)
{
    auto finding = run(checks::maximum_line_length, {std::string(80, 'x') + "\n"});

    ASSERT_TRUE(finding.has_value());
    EXPECT_EQ(finding->code, "E501");
    EXPECT_EQ(std::get<size_t>(finding->column), 79u);
    EXPECT_EQ(finding->context.count, 80u);
}

TEST_F(PhysicalChecksTest, TrailingWhitespaceDoesNotCountTowardsLength)
{
    EXPECT_FALSE(run(checks::maximum_line_length, {std::string(79, 'x') + "   \n"}).has_value());
}

TEST_F(PhysicalChecksTest, MultiByteCharactersCountOnce)
{
    std::string line;
    for (int i = 0; i < 79; ++i) {
        line += "\xc3\xa9";  // é
    }

    EXPECT_FALSE(run(checks::maximum_line_length, {line + "\n"}).has_value());
}

TEST_F(PhysicalChecksTest, InvalidUtf8FallsBackToBytes)
{
    auto finding = run(checks::maximum_line_length, {std::string(79, 'x') + "\xff\n"});

    ASSERT_TRUE(finding.has_value());
    EXPECT_EQ(finding->context.count, 80u);
}

TEST_F(PhysicalChecksTest, ConfiguredLimit)
{
    config_.max_line_length = 10;
    auto finding = run(checks::maximum_line_length, {"spam(1, 2, 3)\n"});

    ASSERT_TRUE(finding.has_value());
    EXPECT_EQ(std::get<size_t>(finding->column), 10u);
    EXPECT_EQ(finding->context.count, 13u);
}

TEST_F(PhysicalChecksTest, FixTrailingWhitespaceKeepsTerminator)
{
    EXPECT_EQ(fix(checks::fix_trailing_whitespace, {"spam(1)  \t\r\n"}), "spam(1)\r\n");
    EXPECT_EQ(fix(checks::fix_trailing_whitespace, {"    \n"}), "\n");
    EXPECT_EQ(fix(checks::fix_trailing_whitespace, {"spam(1) "}), "spam(1)");
}

TEST_F(PhysicalChecksTest, FixMissingNewlineUsesDocumentEnding)
{
    EXPECT_EQ(fix(checks::fix_missing_newline, {"a\r\n", "b"}, 2), "b\r\n");
    EXPECT_EQ(fix(checks::fix_missing_newline, {"b"}), "b\n");
    EXPECT_EQ(fix(checks::fix_missing_newline, {"b\n"}), "b\n");
}

TEST_F(PhysicalChecksTest, RegistrationOrder)
{
    CheckerRegistry registry;
    checks::register_physical_checks(registry);

    std::vector<std::string> names;
    for (const auto& checker : registry.physical()) {
        names.push_back(checker.name);
    }
    EXPECT_EQ(names, (std::vector<std::string>{"tabs_or_spaces", "tabs_obsolete",
                                               "trailing_whitespace", "trailing_blank_lines",
                                               "missing_newline", "maximum_line_length"}));
    EXPECT_TRUE(registry.physical()[2].fix);
    EXPECT_FALSE(registry.physical()[0].fix);
}

} // namespace pepcheck
