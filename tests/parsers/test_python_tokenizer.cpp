#include "pepcheck/parsers/python_tokenizer.hpp"
#include "pepcheck/core/errors.hpp"
#include <gtest/gtest.h>

namespace pepcheck {

class PythonTokenizerTest : public ::testing::Test {
protected:
    static auto kinds(const std::vector<Token>& tokens) -> std::vector<TokenKind> {
        std::vector<TokenKind> result;
        for (const auto& token : tokens) {
            result.push_back(token.kind);
        }
        return result;
    }

    // Readable token kinds for assertion messages
    static auto describe(const std::vector<Token>& tokens) -> std::string {
        std::string result;
        for (const auto& token : tokens) {
            if (!result.empty()) {
                result += ' ';
            }
            result += token_kind_name(token.kind);
        }
        return result;
    }

    static auto texts(const std::vector<Token>& tokens) -> std::vector<std::string> {
        std::vector<std::string> result;
        for (const auto& token : tokens) {
            result.push_back(token.text);
        }
        return result;
    }
};

using enum TokenKind;

TEST_F(PythonTokenizerTest, SimpleStatement)
{
    auto tokens = PythonTokenizer::tokenize("x = 1\n");

    EXPECT_EQ(kinds(tokens), (std::vector<TokenKind>{NAME, OP, NUMBER, NEWLINE, ENDMARKER})) << describe(tokens);
    EXPECT_EQ(tokens[0].start, (Position{1, 0}));
    EXPECT_EQ(tokens[0].end, (Position{1, 1}));
    EXPECT_EQ(tokens[0].line, "x = 1\n");
    EXPECT_EQ(tokens[3].text, "\n");
    EXPECT_EQ(tokens[3].start, (Position{1, 5}));
    EXPECT_EQ(tokens[4].start, (Position{2, 0}));
}

TEST_F(PythonTokenizerTest, IndentAndDedent)
{
    auto tokens = PythonTokenizer::tokenize("if x:\n    y\n");

    EXPECT_EQ(kinds(tokens), (std::vector<TokenKind>{NAME, NAME, OP, NEWLINE, INDENT, NAME, NEWLINE,
                                                     DEDENT, ENDMARKER})) << describe(tokens);
    EXPECT_EQ(tokens[4].text, "    ");
    EXPECT_EQ(tokens[4].end, (Position{2, 4}));
}

TEST_F(PythonTokenizerTest, NestedDedents)
{
    auto tokens = PythonTokenizer::tokenize("if a:\n    if b:\n        c\nd\n");

    EXPECT_EQ(kinds(tokens),
              (std::vector<TokenKind>{NAME, NAME, OP, NEWLINE, INDENT, NAME, NAME, OP, NEWLINE, INDENT,
                                      NAME, NEWLINE, DEDENT, DEDENT, NAME, NEWLINE, ENDMARKER})) << describe(tokens);
    EXPECT_EQ(tokens[12].start, (Position{4, 0}));
}

TEST_F(PythonTokenizerTest, TabIndentation)
{
    auto tokens = PythonTokenizer::tokenize("if a:\n\tb\n");

    ASSERT_EQ(tokens[4].kind, INDENT);
    EXPECT_EQ(tokens[4].text, "\t");
}

TEST_F(PythonTokenizerTest, BlankAndCommentLinesYieldNl)
{
    auto tokens = PythonTokenizer::tokenize("# c\n\nx\n");

    EXPECT_EQ(kinds(tokens), (std::vector<TokenKind>{COMMENT, NL, NL, NAME, NEWLINE, ENDMARKER})) << describe(tokens);
    EXPECT_EQ(tokens[0].text, "# c");
    EXPECT_EQ(tokens[1].text, "\n");
}

TEST_F(PythonTokenizerTest, IndentedCommentDoesNotIndent)
{
    auto tokens = PythonTokenizer::tokenize("x\n    # c\ny\n");

    EXPECT_EQ(kinds(tokens), (std::vector<TokenKind>{NAME, NEWLINE, COMMENT, NL, NAME, NEWLINE,
                                                     ENDMARKER})) << describe(tokens);
}

TEST_F(PythonTokenizerTest, InlineComment)
{
    auto tokens = PythonTokenizer::tokenize("x = 1  # c\n");

    EXPECT_EQ(kinds(tokens), (std::vector<TokenKind>{NAME, OP, NUMBER, COMMENT, NEWLINE, ENDMARKER})) << describe(tokens);
    EXPECT_EQ(tokens[3].start, (Position{1, 7}));
}

TEST_F(PythonTokenizerTest, LineBreakInsideBracketsIsNl)
{
    auto tokens = PythonTokenizer::tokenize("f(1,\n  2)\n");

    EXPECT_EQ(kinds(tokens),
              (std::vector<TokenKind>{NAME, OP, NUMBER, OP, NL, NUMBER, OP, NEWLINE, ENDMARKER})) << describe(tokens);
    EXPECT_EQ(tokens[5].start, (Position{2, 2}));
}

TEST_F(PythonTokenizerTest, BackslashContinuation)
{
    auto tokens = PythonTokenizer::tokenize("x = 1 + \\\n    2\n");

    EXPECT_EQ(kinds(tokens), (std::vector<TokenKind>{NAME, OP, NUMBER, OP, NUMBER, NEWLINE, ENDMARKER})) << describe(tokens);
    EXPECT_EQ(tokens[4].start, (Position{2, 4}));
}

TEST_F(PythonTokenizerTest, TripleQuotedStringSpansLines)
{
    auto tokens = PythonTokenizer::tokenize("s = '''a\nb'''\n");

    EXPECT_EQ(kinds(tokens), (std::vector<TokenKind>{NAME, OP, STRING, NEWLINE, ENDMARKER})) << describe(tokens);
    EXPECT_EQ(tokens[2].text, "'''a\nb'''");
    EXPECT_EQ(tokens[2].start, (Position{1, 4}));
    EXPECT_EQ(tokens[2].end, (Position{2, 4}));
    EXPECT_EQ(tokens[2].line, "s = '''a\nb'''\n");
}

TEST_F(PythonTokenizerTest, StringPrefixes)
{
    auto tokens = PythonTokenizer::tokenize("b = rb'x' + u\"y\"\n");

    EXPECT_EQ(texts(tokens), (std::vector<std::string>{"b", "=", "rb'x'", "+", "u\"y\"", "\n", ""}));
    EXPECT_EQ(tokens[2].kind, STRING);
}

TEST_F(PythonTokenizerTest, UnterminatedStringIsErrorToken)
{
    auto tokens = PythonTokenizer::tokenize("s = 'abc\n");

    EXPECT_EQ(kinds(tokens), (std::vector<TokenKind>{NAME, OP, ERRORTOKEN, NAME, NEWLINE, ENDMARKER})) << describe(tokens);
    EXPECT_EQ(tokens[2].text, "'");
}

TEST_F(PythonTokenizerTest, OperatorsMatchLongestFirst)
{
    auto tokens = PythonTokenizer::tokenize("a **= b // c -> d\n");

    EXPECT_EQ(texts(tokens),
              (std::vector<std::string>{"a", "**=", "b", "//", "c", "->", "d", "\n", ""}));
}

TEST_F(PythonTokenizerTest, NotEqualDiamondIsTwoTokens)
{
    auto tokens = PythonTokenizer::tokenize("a <> b\n");

    EXPECT_EQ(texts(tokens), (std::vector<std::string>{"a", "<", ">", "b", "\n", ""}));
    EXPECT_EQ(tokens[1].end, tokens[2].start);
}

TEST_F(PythonTokenizerTest, BackticksAreErrorTokens)
{
    auto tokens = PythonTokenizer::tokenize("`x`\n");

    EXPECT_EQ(kinds(tokens), (std::vector<TokenKind>{ERRORTOKEN, NAME, ERRORTOKEN, NEWLINE, ENDMARKER})) << describe(tokens);
}

TEST_F(PythonTokenizerTest, Numbers)
{
    auto tokens = PythonTokenizer::tokenize("x = 0x1F + 1.5e-3 + 10j\n");

    EXPECT_EQ(tokens[2].text, "0x1F");
    EXPECT_EQ(tokens[4].text, "1.5e-3");
    EXPECT_EQ(tokens[6].text, "10j");
    EXPECT_EQ(tokens[6].kind, NUMBER);
}

TEST_F(PythonTokenizerTest, MissingFinalNewlineStillClosesStatement)
{
    auto tokens = PythonTokenizer::tokenize("x = 1");

    EXPECT_EQ(kinds(tokens), (std::vector<TokenKind>{NAME, OP, NUMBER, NEWLINE, ENDMARKER})) << describe(tokens);
    EXPECT_EQ(tokens[3].text, "");
    EXPECT_EQ(tokens[3].start, (Position{1, 5}));
}

TEST_F(PythonTokenizerTest, CrLfLineEndings)
{
    auto tokens = PythonTokenizer::tokenize("x\r\n");

    EXPECT_EQ(kinds(tokens), (std::vector<TokenKind>{NAME, NEWLINE, ENDMARKER})) << describe(tokens);
    EXPECT_EQ(tokens[1].text, "\r\n");
}

TEST_F(PythonTokenizerTest, EofInsideBracketsThrows)
{
    EXPECT_THROW(PythonTokenizer::tokenize("f(1,\n"), StructuralError);
}

TEST_F(PythonTokenizerTest, EofInsideStringThrows)
{
    try {
        PythonTokenizer::tokenize("s = '''abc\n");
        FAIL() << "Expected StructuralError";
    } catch (const StructuralError& e) {
        EXPECT_EQ(e.position(), (Position{1, 4}));
    }
}

TEST_F(PythonTokenizerTest, ContinuedStringMustCloseOnLaterLine)
{
    try {
        PythonTokenizer::tokenize("s = 'abc\\\ndef\nx = 1\n");
        FAIL() << "Expected StructuralError";
    } catch (const StructuralError& e) {
        EXPECT_EQ(e.position(), (Position{1, 4}));
    }
}

TEST_F(PythonTokenizerTest, ContinuedStringClosedOnLaterLine)
{
    auto tokens = PythonTokenizer::tokenize("s = 'ab\\\ncd'\n");

    EXPECT_EQ(kinds(tokens), (std::vector<TokenKind>{NAME, OP, STRING, NEWLINE, ENDMARKER}))
        << describe(tokens);
    EXPECT_EQ(tokens[2].text, "'ab\\\ncd'");
    EXPECT_EQ(tokens[2].end, (Position{2, 3}));
}

TEST_F(PythonTokenizerTest, TokenKindNames)
{
    EXPECT_STREQ(token_kind_name(NAME), "NAME");
    EXPECT_STREQ(token_kind_name(ERRORTOKEN), "ERRORTOKEN");
    EXPECT_STREQ(token_kind_name(ENDMARKER), "ENDMARKER");
    EXPECT_EQ(describe(PythonTokenizer::tokenize("x\n")), "NAME NEWLINE ENDMARKER");
}

TEST_F(PythonTokenizerTest, KeepsReturningEndMarker)
{
    auto lines = std::vector<std::string>{"x\n"};
    size_t index = 0;
    PythonTokenizer tokenizer([&]() { return index < lines.size() ? lines[index++] : std::string(); });

    while (tokenizer.next_token().kind != ENDMARKER) {
    }
    EXPECT_EQ(tokenizer.next_token().kind, ENDMARKER);
    EXPECT_EQ(tokenizer.next_token().kind, ENDMARKER);
}

TEST_F(PythonTokenizerTest, ReadsLinesLazily)
{
    int reads = 0;
    std::vector<std::string> lines{"a\n", "b\n", "c\n"};
    PythonTokenizer tokenizer([&]() -> std::string {
        return static_cast<size_t>(reads) < lines.size() ? lines[static_cast<size_t>(reads++)] : "";
    });

    EXPECT_EQ(tokenizer.next_token().text, "a");
    EXPECT_EQ(reads, 1);
    EXPECT_EQ(tokenizer.next_token().kind, NEWLINE);
    EXPECT_EQ(reads, 1);
    EXPECT_EQ(tokenizer.next_token().text, "b");
    EXPECT_EQ(reads, 2);
}

TEST_F(PythonTokenizerTest, FactoryBuildsTokenizer)
{
    bool done = false;
    auto tokenizer = PythonTokenizer::factory()([&]() -> std::string {
        if (done) {
            return "";
        }
        done = true;
        return "pass\n";
    });

    EXPECT_EQ(tokenizer->next_token().text, "pass");
}

} // namespace pepcheck
