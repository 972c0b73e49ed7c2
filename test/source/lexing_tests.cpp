#include <stdexcept>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <gtest/gtest.h>
#include <lexer/lexer.hpp>
#include <lexer/token.hpp>
#include <lexer/token_type.hpp>

TEST(lexing, testNextToken)
{
    using enum token_type;
    auto lxr = lexer {R"r(let five = 5;
let ten = 10;
!-/*5;
5 < 10 > 5;
if (5 < 10) {
return true;
} else {
return false;
}
10 == 10;
10 != 9;
a_b, $
)r"};
    const auto expected = std::vector<std::pair<token_type, std::string_view>> {
        {kw_let, "let"}, {ident, "five"}, {assign, "="}, {integer, "5"}, {semicolon, ";"},
        {kw_let, "let"}, {ident, "ten"}, {assign, "="}, {integer, "10"}, {semicolon, ";"},
        {bang, "!"}, {minus, "-"}, {slash, "/"}, {asterisk, "*"}, {integer, "5"}, {semicolon, ";"},
        {integer, "5"}, {less_than, "<"}, {integer, "10"}, {greater_than, ">"}, {integer, "5"}, {semicolon, ";"},
        {kw_if, "if"}, {lparen, "("}, {integer, "5"}, {less_than, "<"}, {integer, "10"}, {rparen, ")"}, {lbrace, "{"},
        {kw_return, "return"}, {kw_true, "true"}, {semicolon, ";"},
        {rbrace, "}"}, {kw_else, "else"}, {lbrace, "{"},
        {kw_return, "return"}, {kw_false, "false"}, {semicolon, ";"},
        {rbrace, "}"},
        {integer, "10"}, {equals, "=="}, {integer, "10"}, {semicolon, ";"},
        {integer, "10"}, {not_equals, "!="}, {integer, "9"}, {semicolon, ";"},
        {ident, "a_b"}, {comma, ","}, {illegal, "$"},
        {eof, ""},
    };
    for (const auto& [type, literal] : expected) {
        const auto tkn = lxr.next_token();
        ASSERT_EQ(tkn.type, type) << "at " << tkn;
        ASSERT_EQ(tkn.literal, literal) << "at " << tkn;
    }
}

TEST(lexing, testLocations)
{
    using enum token_type;
    auto lxr = lexer {"let x = 5;\n  x == 5", "input.wt"};
    const auto expected = std::vector<token> {
        token {.type = kw_let, .literal = "let", .loc = {.filename = "input.wt", .line = 1, .column = 1}},
        token {.type = ident, .literal = "x", .loc = {.filename = "input.wt", .line = 1, .column = 5}},
        token {.type = assign, .literal = "=", .loc = {.filename = "input.wt", .line = 1, .column = 7}},
        token {.type = integer, .literal = "5", .loc = {.filename = "input.wt", .line = 1, .column = 9}},
        token {.type = semicolon, .literal = ";", .loc = {.filename = "input.wt", .line = 1, .column = 10}},
        token {.type = ident, .literal = "x", .loc = {.filename = "input.wt", .line = 2, .column = 3}},
        token {.type = equals, .literal = "==", .loc = {.filename = "input.wt", .line = 2, .column = 5}},
        token {.type = integer, .literal = "5", .loc = {.filename = "input.wt", .line = 2, .column = 8}},
        token {.type = eof, .literal = "", .loc = {.filename = "input.wt", .line = 2, .column = 9}},
    };
    for (const auto& expected_token : expected) {
        ASSERT_EQ(lxr.next_token(), expected_token);
    }
}

TEST(lexing, testOperatorAtEndOfInput)
{
    using enum token_type;
    auto lxr = lexer {"a =!"};
    EXPECT_EQ(lxr.next_token().type, ident);
    EXPECT_EQ(lxr.next_token().type, assign);
    EXPECT_EQ(lxr.next_token().type, bang);
    EXPECT_EQ(lxr.next_token().type, eof);
}

TEST(lexing, testEofIsSticky)
{
    auto lxr = lexer {""};
    EXPECT_EQ(lxr.next_token().type, token_type::eof);
    EXPECT_EQ(lxr.next_token().type, token_type::eof);
}

TEST(lexing, testTokenTypeSpelling)
{
    EXPECT_EQ(fmt::format("{}", token_type::not_equals), "!=");
    EXPECT_EQ(fmt::format("{}", token_type::kw_if), "if");
    EXPECT_EQ(fmt::format("{}", token_type::ident), "identifier");
    EXPECT_EQ(spelling(token_type::rbrace), "}");
    EXPECT_EQ(spelling(token_type::kw_return), "return");
    EXPECT_THROW((void)spelling(static_cast<token_type>(200)), std::invalid_argument);
}
