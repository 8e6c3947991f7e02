#include "pepcheck/core/diagnostic.hpp"
#include "pepcheck/core/diagnostic_sink.hpp"
#include <gtest/gtest.h>

namespace pepcheck {

TEST(DiagnosticTest, RendersCharacterContext)
{
    EXPECT_EQ(render_message("E201", {.character = '('}), "whitespace after '('");
    EXPECT_EQ(render_message("E231", {.character = ','}), "missing whitespace after ','");
    EXPECT_EQ(render_message("E242", {.character = '\t'}), "tab after '\\t'");
}

TEST(DiagnosticTest, RendersCountContext)
{
    EXPECT_EQ(render_message("E302", {.count = 1}), "expected 2 blank lines, found 1");
    EXPECT_EQ(render_message("E303", {.count = 3}), "too many blank lines (3)");
    EXPECT_EQ(render_message("E501", {.count = 85}), "line too long (85 characters)");
}

TEST(DiagnosticTest, PlainMessages)
{
    EXPECT_EQ(render_message("E101", {}), "indentation contains mixed spaces and tabs");
    EXPECT_EQ(render_message("W603", {}), "'<>' is deprecated, use '!='");
    EXPECT_TRUE(message_template("X999").empty());
}

TEST(DiagnosticTest, EveryCodeFollowsTheTaxonomy)
{
    for (std::string_view code : {"E101", "E111", "E112", "E113", "E201", "E202", "E203", "E211",
                                  "E221", "E222", "E223", "E224", "E225", "E231", "E241", "E242",
                                  "E251", "E261", "E262", "E301", "E302", "E303", "E304", "E401",
                                  "E501", "E701", "E702", "W191", "W291", "W292", "W293", "W391",
                                  "W601", "W602", "W603", "W604"}) {
        EXPECT_FALSE(message_template(code).empty()) << code;
    }
}

TEST(DiagnosticTest, Description)
{
    Diagnostic diagnostic{.code = "E225", .row = 1, .column = 5};
    EXPECT_EQ(diagnostic.description(), "E225 missing whitespace around operator");
}

class DiagnosticSinkTest : public ::testing::Test {
protected:
    static auto make(std::string code, int row, int column) -> Diagnostic {
        return Diagnostic{.code = std::move(code), .row = row, .column = column};
    }

    DiagnosticSink sink_;
};

TEST_F(DiagnosticSinkTest, KeepsInsertionOrder)
{
    sink_.add(make("E225", 3, 1));
    sink_.add(make("E101", 1, 0));

    ASSERT_EQ(sink_.size(), 2);
    EXPECT_EQ(sink_.diagnostics()[0].code, "E225");
    EXPECT_EQ(sink_.diagnostics()[1].code, "E101");
}

TEST_F(DiagnosticSinkTest, DropsExactDuplicates)
{
    EXPECT_TRUE(sink_.add(make("E225", 3, 1)));
    EXPECT_FALSE(sink_.add(make("E225", 3, 1)));
    EXPECT_TRUE(sink_.add(make("E225", 3, 2)));
    EXPECT_EQ(sink_.size(), 2);
}

TEST_F(DiagnosticSinkTest, LookupByCode)
{
    sink_.add(make("E225", 3, 1));
    sink_.add(make("W291", 4, 7));

    EXPECT_TRUE(sink_.contains_code("W291"));
    EXPECT_FALSE(sink_.contains_code("E501"));

    auto remaining = sink_.ignoring({"E225"});
    ASSERT_EQ(remaining.size(), 1);
    EXPECT_EQ(remaining[0].code, "W291");
}

TEST_F(DiagnosticSinkTest, FirstPerCodeAndCounts)
{
    sink_.add(make("E225", 1, 1));
    sink_.add(make("W291", 2, 3));
    sink_.add(make("E225", 5, 1));

    auto first = sink_.first_per_code();
    ASSERT_EQ(first.size(), 2);
    EXPECT_EQ(first[0].row, 1);
    EXPECT_EQ(first[1].code, "W291");

    auto counts = sink_.count_by_code();
    EXPECT_EQ(counts["E225"], 2);
    EXPECT_EQ(counts["W291"], 1);
}

TEST_F(DiagnosticSinkTest, ClearForgetsDuplicates)
{
    sink_.add(make("E225", 1, 1));
    sink_.clear();

    EXPECT_TRUE(sink_.empty());
    EXPECT_TRUE(sink_.add(make("E225", 1, 1)));
}

} // namespace pepcheck
