#include <limits>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <gtest/gtest.h>
#include <lexer/token.hpp>
#include <lexer/token_type.hpp>
#include <object/object.hpp>

#include "testutils.hpp"

// NOLINTBEGIN(*-magic-numbers)
namespace
{
auto tok(token_type type, std::string lexeme, std::size_t line = 1, object literal = {}) -> token
{
    return token {.type = type, .lexeme = std::move(lexeme), .literal = std::move(literal), .line = line};
}

auto num(double value) -> object
{
    return object {value};
}

auto str(std::string value) -> object
{
    return object {std::move(value)};
}
}  // namespace

TEST(lexing, testScanTokens)
{
    using enum token_type;
    auto [tokens, diagnostics] = scan(R"r(var five = 5;
var ten = 10.5;
print five + ten;
!-/*5;
5 < 10 > 5;
5 <= 10 >= 5;
10 == 10;
10 != 9;
"foobar"
"foo bar"
""
{ , . }
class fun for if else while return this super and or nil true false
)r");
    const auto expected_tokens = std::vector<token> {
        tok(var, "var", 1),
        tok(ident, "five", 1),
        tok(assign, "=", 1),
        tok(number, "5", 1, num(5)),
        tok(semicolon, ";", 1),
        tok(var, "var", 2),
        tok(ident, "ten", 2),
        tok(assign, "=", 2),
        tok(number, "10.5", 2, num(10.5)),
        tok(semicolon, ";", 2),
        tok(print, "print", 3),
        tok(ident, "five", 3),
        tok(plus, "+", 3),
        tok(ident, "ten", 3),
        tok(semicolon, ";", 3),
        tok(exclamation, "!", 4),
        tok(minus, "-", 4),
        tok(slash, "/", 4),
        tok(asterisk, "*", 4),
        tok(number, "5", 4, num(5)),
        tok(semicolon, ";", 4),
        tok(number, "5", 5, num(5)),
        tok(less_than, "<", 5),
        tok(number, "10", 5, num(10)),
        tok(greater_than, ">", 5),
        tok(number, "5", 5, num(5)),
        tok(semicolon, ";", 5),
        tok(number, "5", 6, num(5)),
        tok(less_equal, "<=", 6),
        tok(number, "10", 6, num(10)),
        tok(greater_equal, ">=", 6),
        tok(number, "5", 6, num(5)),
        tok(semicolon, ";", 6),
        tok(number, "10", 7, num(10)),
        tok(equals, "==", 7),
        tok(number, "10", 7, num(10)),
        tok(semicolon, ";", 7),
        tok(number, "10", 8, num(10)),
        tok(not_equals, "!=", 8),
        tok(number, "9", 8, num(9)),
        tok(semicolon, ";", 8),
        tok(string, R"("foobar")", 9, str("foobar")),
        tok(string, R"("foo bar")", 10, str("foo bar")),
        tok(string, R"("")", 11, str("")),
        tok(lsquirly, "{", 12),
        tok(comma, ",", 12),
        tok(dot, ".", 12),
        tok(rsquirly, "}", 12),
        tok(clazz, "class", 13),
        tok(function, "fun", 13),
        tok(phor, "for", 13),
        tok(eef, "if", 13),
        tok(elze, "else", 13),
        tok(hwile, "while", 13),
        tok(ret, "return", 13),
        tok(self, "this", 13),
        tok(super, "super", 13),
        tok(logical_and, "and", 13),
        tok(logical_or, "or", 13),
        tok(nil, "nil", 13),
        tok(tru, "true", 13),
        tok(fals, "false", 13),
        tok(eof, "", 14),
    };
    EXPECT_TRUE(diagnostics.empty());
    ASSERT_EQ(tokens.size(), expected_tokens.size());
    for (std::size_t idx = 0; idx < expected_tokens.size(); ++idx) {
        EXPECT_EQ(tokens[idx], expected_tokens[idx]) << "at index " << idx;
    }
}

TEST(lexing, singleCharacterYieldsTokenAndEof)
{
    auto [tokens, diagnostics] = scan("(");
    EXPECT_TRUE(diagnostics.empty());
    ASSERT_EQ(tokens.size(), 2);
    EXPECT_EQ(tokens[0], tok(token_type::lparen, "(", 1));
    EXPECT_TRUE(tokens[0].literal.is_nil());
    EXPECT_EQ(tokens[1], tok(token_type::eof, "", 1));
}

TEST(lexing, emptyInputYieldsOnlyEof)
{
    auto [tokens, diagnostics] = scan("");
    EXPECT_TRUE(diagnostics.empty());
    ASSERT_EQ(tokens.size(), 1);
    EXPECT_EQ(tokens[0], tok(token_type::eof, "", 1));
}

TEST(lexing, keywordIsNotIdentifier)
{
    auto [tokens, diagnostics] = scan("class");
    ASSERT_EQ(tokens.size(), 2);
    EXPECT_EQ(tokens[0].type, token_type::clazz);
    EXPECT_EQ(tokens[0].lexeme, "class");
}

TEST(lexing, identifiers)
{
    auto [tokens, diagnostics] = scan("fooBar _under_score1 classy");
    EXPECT_TRUE(diagnostics.empty());
    ASSERT_EQ(tokens.size(), 4);
    EXPECT_EQ(tokens[0], tok(token_type::ident, "fooBar"));
    EXPECT_EQ(tokens[1], tok(token_type::ident, "_under_score1"));
    EXPECT_EQ(tokens[2], tok(token_type::ident, "classy"));
}

TEST(lexing, unexpectedCharacterIsReportedAndScanningContinues)
{
    auto [tokens, diagnostics] = scan("@");
    ASSERT_EQ(diagnostics.size(), 1);
    EXPECT_EQ(diagnostics[0], "[line 1] Error: Unexpected character.");
    ASSERT_EQ(tokens.size(), 1);
    EXPECT_EQ(tokens[0].type, token_type::eof);

    auto [more_tokens, more_diagnostics] = scan("1 @ # 2");
    EXPECT_EQ(more_diagnostics.size(), 2);
    ASSERT_EQ(more_tokens.size(), 3);
    EXPECT_EQ(more_tokens[0], tok(token_type::number, "1", 1, num(1)));
    EXPECT_EQ(more_tokens[1], tok(token_type::number, "2", 1, num(2)));
}

TEST(lexing, oneOrTwoCharacterOperators)
{
    using enum token_type;
    auto [tokens, diagnostics] = scan("! != = == < <= > >= !== <==");
    const auto expected = std::vector<token_type> {
        exclamation,
        not_equals,
        assign,
        equals,
        less_than,
        less_equal,
        greater_than,
        greater_equal,
        not_equals,
        assign,
        less_equal,
        assign,
        eof,
    };
    ASSERT_EQ(tokens.size(), expected.size());
    for (std::size_t idx = 0; idx < expected.size(); ++idx) {
        EXPECT_EQ(tokens[idx].type, expected[idx]) << "at index " << idx;
    }
}

TEST(lexing, commentsAndWhitespace)
{
    auto [tokens, diagnostics] = scan("// a comment with \"quotes\" and @\n\t+ / // trailing\r\n;");
    EXPECT_TRUE(diagnostics.empty());
    ASSERT_EQ(tokens.size(), 4);
    EXPECT_EQ(tokens[0], tok(token_type::plus, "+", 2));
    EXPECT_EQ(tokens[1], tok(token_type::slash, "/", 2));
    EXPECT_EQ(tokens[2], tok(token_type::semicolon, ";", 3));
    EXPECT_EQ(tokens[3], tok(token_type::eof, "", 3));
}

TEST(lexing, commentAtEndOfInput)
{
    auto [tokens, diagnostics] = scan("1 // done");
    EXPECT_TRUE(diagnostics.empty());
    ASSERT_EQ(tokens.size(), 2);
    EXPECT_EQ(tokens[1].type, token_type::eof);
}

TEST(lexing, numbers)
{
    using enum token_type;
    auto [tokens, diagnostics] = scan("123 12.5 7. .5 0.25");
    EXPECT_TRUE(diagnostics.empty());
    const auto expected = std::vector<token> {
        tok(number, "123", 1, num(123)),
        tok(number, "12.5", 1, num(12.5)),
        tok(number, "7", 1, num(7)),
        tok(dot, "."),
        tok(dot, "."),
        tok(number, "5", 1, num(5)),
        tok(number, "0.25", 1, num(0.25)),
        tok(eof, ""),
    };
    ASSERT_EQ(tokens.size(), expected.size());
    for (std::size_t idx = 0; idx < expected.size(); ++idx) {
        EXPECT_EQ(tokens[idx], expected[idx]) << "at index " << idx;
    }
}

TEST(lexing, numbersBeyondDoubleRangeKeepIeeeValue)
{
    const auto huge = std::string(400, '9');
    const auto tiny = "0." + std::string(400, '0') + "1";
    auto [tokens, diagnostics] = scan(huge + " " + tiny);
    EXPECT_TRUE(diagnostics.empty());
    ASSERT_EQ(tokens.size(), 3);
    EXPECT_EQ(tokens[0], tok(token_type::number, huge, 1, num(std::numeric_limits<double>::infinity())));
    EXPECT_EQ(tokens[1], tok(token_type::number, tiny, 1, num(0)));
}

TEST(lexing, stringContentIsVerbatim)
{
    auto [tokens, diagnostics] = scan(R"("tab\t // not a comment")");
    EXPECT_TRUE(diagnostics.empty());
    ASSERT_EQ(tokens.size(), 2);
    EXPECT_EQ(tokens[0].literal, str(R"(tab\t // not a comment)"));
}

TEST(lexing, multiLineStringCountsLines)
{
    auto [tokens, diagnostics] = scan("\"one\ntwo\" ;");
    EXPECT_TRUE(diagnostics.empty());
    ASSERT_EQ(tokens.size(), 3);
    EXPECT_EQ(tokens[0], tok(token_type::string, "\"one\ntwo\"", 2, str("one\ntwo")));
    EXPECT_EQ(tokens[1].line, 2);
}

TEST(lexing, unterminatedString)
{
    auto [tokens, diagnostics] = scan("\"abc\ndef");
    ASSERT_EQ(diagnostics.size(), 1);
    EXPECT_EQ(diagnostics[0], "[line 2] Error: Unterminated string.");
    ASSERT_EQ(tokens.size(), 1);
    EXPECT_EQ(tokens[0], tok(token_type::eof, "", 2));
}

TEST(lexing, tokenFormatting)
{
    EXPECT_EQ(fmt::format("{}", token_type::not_equals), "!=");
    EXPECT_EQ(fmt::format("{}", token_type::ident), "identifier");
    EXPECT_EQ(fmt::format("{}", tok(token_type::number, "1.5", 3, num(1.5))), "token{number, `1.5´, 1.5, 3}");
}

// NOLINTEND(*-magic-numbers)
