#include <gtest/gtest.h>

#include "lexer.hpp"
#include "token.hpp"

using namespace envx;

// Helper to get token types from source (EOF_TOKEN included)
std::vector<TokenType> getTokenTypes(const std::string& source) {
    Lexer lexer(source, "<test>");
    auto tokens = lexer.tokenize();
    std::vector<TokenType> types;
    for (const auto& tok : tokens) {
        types.push_back(tok.type);
    }
    return types;
}

TEST(LexerTest, TokenizesSimpleAssignment) {
    Lexer lexer("NAME=value", "<test>");
    auto tokens = lexer.tokenize();

    ASSERT_EQ(tokens.size(), 4u);
    EXPECT_EQ(tokens[0].type, TokenType::TEXT);
    EXPECT_EQ(tokens[0].value, "NAME");
    EXPECT_EQ(tokens[1].type, TokenType::ASSIGN);
    EXPECT_EQ(tokens[2].type, TokenType::TEXT);
    EXPECT_EQ(tokens[2].value, "value");
    EXPECT_EQ(tokens[3].type, TokenType::EOF_TOKEN);
}

TEST(LexerTest, EmptyInputIsJustEof) {
    auto types = getTokenTypes("");
    ASSERT_EQ(types.size(), 1u);
    EXPECT_EQ(types[0], TokenType::EOF_TOKEN);
}

TEST(LexerTest, TokenizesEverySpecialCharacter) {
    auto types = getTokenTypes("= # \" ' \\x \n");
    std::vector<TokenType> expected = {
        TokenType::ASSIGN, TokenType::WS,
        TokenType::COMMENT, TokenType::WS,
        TokenType::DQUOTE, TokenType::WS,
        TokenType::SQUOTE, TokenType::WS,
        TokenType::ESCAPE, TokenType::WS,
        TokenType::NEWLINE, TokenType::EOF_TOKEN};
    EXPECT_EQ(types, expected);
}

// Quotes
TEST(LexerTest, TripleQuotesWinOverSingleQuotes) {
    Lexer lexer("\"\"\"x\"'''y'", "<test>");
    auto tokens = lexer.tokenize();

    ASSERT_EQ(tokens.size(), 7u);
    EXPECT_EQ(tokens[0].type, TokenType::DQUOTE);
    EXPECT_EQ(tokens[0].value, "\"\"\"");
    EXPECT_EQ(tokens[1].value, "x");
    EXPECT_EQ(tokens[2].type, TokenType::DQUOTE);
    EXPECT_EQ(tokens[2].value, "\"");
    EXPECT_EQ(tokens[3].type, TokenType::SQUOTE);
    EXPECT_EQ(tokens[3].value, "'''");
    EXPECT_EQ(tokens[4].value, "y");
    EXPECT_EQ(tokens[5].type, TokenType::SQUOTE);
    EXPECT_EQ(tokens[5].value, "'");
}

TEST(LexerTest, FourQuotesAreTripleThenSingle) {
    Lexer lexer("''''", "<test>");
    auto tokens = lexer.tokenize();

    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0].value, "'''");
    EXPECT_EQ(tokens[1].value, "'");
}

// Whitespace
TEST(LexerTest, BlankRunIsOneToken) {
    Lexer lexer("a \t\r\f\vb", "<test>");
    auto tokens = lexer.tokenize();

    ASSERT_EQ(tokens.size(), 4u);
    EXPECT_EQ(tokens[1].type, TokenType::WS);
    EXPECT_EQ(tokens[1].value, " \t\r\f\v");
}

TEST(LexerTest, NewlineIsNotWhitespace) {
    auto types = getTokenTypes(" \n ");
    std::vector<TokenType> expected = {TokenType::WS, TokenType::NEWLINE, TokenType::WS, TokenType::EOF_TOKEN};
    EXPECT_EQ(types, expected);
}

// Escapes
TEST(LexerTest, EscapeTakesExactlyOneCharacter) {
    Lexer lexer("\\$ab", "<test>");
    auto tokens = lexer.tokenize();

    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0].type, TokenType::ESCAPE);
    EXPECT_EQ(tokens[0].value, "\\$");
    EXPECT_EQ(tokens[0].escaped(), "$");
    EXPECT_EQ(tokens[1].type, TokenType::TEXT);
    EXPECT_EQ(tokens[1].value, "ab");
}

TEST(LexerTest, EscapedNewline) {
    Lexer lexer("\\\n", "<test>");
    auto tokens = lexer.tokenize();

    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[0].type, TokenType::ESCAPE);
    EXPECT_TRUE(tokens[0].escapes_newline());
}

TEST(LexerTest, EscapedBackslash) {
    Lexer lexer("\\\\\\", "<test>");
    auto tokens = lexer.tokenize();

    // "\\" escapes a backslash; the last one has nothing to escape
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0].type, TokenType::ESCAPE);
    EXPECT_EQ(tokens[0].escaped(), "\\");
    EXPECT_EQ(tokens[1].type, TokenType::TEXT);
    EXPECT_EQ(tokens[1].value, "\\");
}

TEST(LexerTest, TrailingBackslashStaysInText) {
    Lexer lexer("abc\\", "<test>");
    auto tokens = lexer.tokenize();

    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[0].type, TokenType::TEXT);
    EXPECT_EQ(tokens[0].value, "abc\\");
}

TEST(LexerTest, EscapeCoversWholeUtf8Character) {
    Lexer lexer("\\\xC3\xA9x", "<test>");  // \é then x
    auto tokens = lexer.tokenize();

    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0].type, TokenType::ESCAPE);
    EXPECT_EQ(tokens[0].escaped(), "\xC3\xA9");
    EXPECT_EQ(tokens[1].value, "x");
}

// Text runs
TEST(LexerTest, TextRunsUntilSpecialCharacter) {
    Lexer lexer("${foo}/bar-baz.txt#", "<test>");
    auto tokens = lexer.tokenize();

    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0].type, TokenType::TEXT);
    EXPECT_EQ(tokens[0].value, "${foo}/bar-baz.txt");
    EXPECT_EQ(tokens[1].type, TokenType::COMMENT);
}

// Locations
TEST(LexerTest, TracksLinesAndColumns) {
    Lexer lexer("A=1\n  B = 2", "<test>");
    auto tokens = lexer.tokenize();

    // A = 1 \n WS B WS = WS 2 EOF
    ASSERT_EQ(tokens.size(), 11u);
    EXPECT_EQ(tokens[0].line(), 1);
    EXPECT_EQ(tokens[0].col(), 0);
    EXPECT_EQ(tokens[2].col(), 2);
    EXPECT_EQ(tokens[3].type, TokenType::NEWLINE);
    EXPECT_EQ(tokens[3].line(), 1);
    EXPECT_EQ(tokens[5].value, "B");
    EXPECT_EQ(tokens[5].line(), 2);
    EXPECT_EQ(tokens[5].col(), 2);
    EXPECT_EQ(tokens[7].type, TokenType::ASSIGN);
    EXPECT_EQ(tokens[7].col(), 4);
}

TEST(LexerTest, EscapedNewlineStartsANewLine) {
    Lexer lexer("A=\\\nB", "<test>");
    auto tokens = lexer.tokenize();

    ASSERT_EQ(tokens.size(), 5u);
    EXPECT_EQ(tokens[2].type, TokenType::ESCAPE);
    EXPECT_EQ(tokens[2].line(), 1);
    EXPECT_EQ(tokens[2].col(), 2);
    EXPECT_EQ(tokens[3].type, TokenType::TEXT);
    EXPECT_EQ(tokens[3].line(), 2);
    EXPECT_EQ(tokens[3].col(), 0);
}

TEST(LexerTest, LocationToStringUsesOneBasedColumn) {
    Lexer lexer("x", "env.txt");
    Token tok = lexer.next_token();
    EXPECT_EQ(tok.loc.to_string(), "env.txt:1:1");
}

// Pull interface
TEST(LexerTest, NextTokenKeepsReturningEof) {
    Lexer lexer("a", "<test>");
    EXPECT_EQ(lexer.next_token().type, TokenType::TEXT);
    EXPECT_EQ(lexer.next_token().type, TokenType::EOF_TOKEN);
    EXPECT_EQ(lexer.next_token().type, TokenType::EOF_TOKEN);
}

TEST(LexerTest, TokenizeIsRestartable) {
    Lexer lexer("A='x' # c\nB=\"y\"\n", "<test>");
    auto first = lexer.tokenize();
    auto second = lexer.tokenize();

    ASSERT_EQ(first.size(), second.size());
    for (size_t i = 0; i < first.size(); ++i) {
        EXPECT_EQ(first[i].type, second[i].type);
        EXPECT_EQ(first[i].value, second[i].value);
        EXPECT_EQ(first[i].line(), second[i].line());
        EXPECT_EQ(first[i].col(), second[i].col());
    }
}

TEST(LexerTest, TokensConcatenateBackToSource) {
    std::string src = "# header\n  first = \"a $b\" 'c\\'' \\\n  x=y#z\n\n";
    Lexer lexer(src, "<test>");
    std::string joined;
    for (const auto& tok : lexer.tokenize()) joined += tok.value;
    EXPECT_EQ(joined, src);
}
