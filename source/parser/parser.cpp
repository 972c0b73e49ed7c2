#include <charconv>
#include <cstdint>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "parser.hpp"

#include <arena.hpp>

parser::parser(lexer lxr)
    : m_lexer {lxr}
{
    // fill both the current and the lookahead token
    advance();
    advance();
}

auto parser::parse_program() -> const program*
{
    const auto start = m_token.loc;
    auto stmts = statement_list {};
    while (m_token.type != token_type::eof) {
        if (const auto* stmt = parse_statement(); stmt != nullptr) {
            stmts.push_back(stmt);
        }
        advance();
    }
    return make<program>(start, std::move(stmts));
}

auto parser::errors() const -> const std::vector<std::string>&
{
    return m_errors;
}

auto parser::binding_power(token_type type) -> precedence
{
    using enum token_type;
    switch (type) {
        case equals:
        case not_equals:
            return precedence::equality;
        case less_than:
        case greater_than:
            return precedence::comparison;
        case plus:
        case minus:
            return precedence::sum;
        case asterisk:
        case slash:
            return precedence::product;
        default:
            return precedence::lowest;
    }
}

void parser::advance()
{
    m_token = m_next;
    m_next = m_lexer.next_token();
}

auto parser::expect_next(token_type type) -> bool
{
    if (!next_is(type)) {
        record_error("expected next token to be {}, got {} instead", type, m_next.type);
        return false;
    }
    advance();
    return true;
}

auto parser::next_is(token_type type) const -> bool
{
    return m_next.type == type;
}

void parser::skip_optional_semicolon()
{
    if (next_is(token_type::semicolon)) {
        advance();
    }
}

auto parser::parse_statement() -> const statement*
{
    switch (m_token.type) {
        case token_type::kw_let:
            return parse_let();
        case token_type::kw_return:
            return parse_return();
        default:
            return parse_expression_statement();
    }
}

auto parser::parse_let() -> const statement*
{
    const auto loc = m_token.loc;
    if (!expect_next(token_type::ident)) {
        return nullptr;
    }
    const auto* name = make<identifier>(m_token.loc, std::string {m_token.literal});
    if (!expect_next(token_type::assign)) {
        return nullptr;
    }
    advance();
    const auto* value = parse_expression(precedence::lowest);
    skip_optional_semicolon();
    return make<let_statement>(loc, name, value);
}

auto parser::parse_return() -> const statement*
{
    const auto loc = m_token.loc;
    advance();
    const auto* value = parse_expression(precedence::lowest);
    skip_optional_semicolon();
    return make<return_statement>(loc, value);
}

auto parser::parse_expression_statement() -> const statement*
{
    const auto loc = m_token.loc;
    const auto* expr = parse_expression(precedence::lowest);
    skip_optional_semicolon();
    return make<expression_statement>(loc, expr);
}

// Called with the current token on `{`, returns with it on the matching `}`.
auto parser::parse_block() -> const block_statement*
{
    const auto loc = m_token.loc;
    auto stmts = statement_list {};
    advance();
    while (m_token.type != token_type::rbrace && m_token.type != token_type::eof) {
        if (const auto* stmt = parse_statement(); stmt != nullptr) {
            stmts.push_back(stmt);
        }
        advance();
    }
    if (m_token.type != token_type::rbrace) {
        record_error("expected next token to be {}, got {} instead", token_type::rbrace, m_token.type);
    }
    return make<block_statement>(loc, std::move(stmts));
}

auto parser::parse_expression(precedence min_precedence) -> const expression*
{
    const auto* left = parse_prefix();
    while (left != nullptr && !next_is(token_type::semicolon) && min_precedence < binding_power(m_next.type)) {
        advance();
        left = parse_infix(left);
    }
    return left;
}

auto parser::parse_prefix() -> const expression*
{
    using enum token_type;
    switch (m_token.type) {
        case ident:
            return make<identifier>(m_token.loc, std::string {m_token.literal});
        case integer:
            return parse_integer();
        case kw_true:
        case kw_false:
            return make<boolean_literal>(m_token.loc, m_token.type == kw_true);
        case bang:
        case minus:
            return parse_unary();
        case lparen:
            return parse_grouped();
        case kw_if:
            return parse_if();
        default:
            record_error("no prefix parse function for {} found", m_token.type);
            return nullptr;
    }
}

auto parser::parse_infix(const expression* left) -> const expression*
{
    const auto oper = m_token;
    advance();
    const auto* right = parse_expression(binding_power(oper.type));
    if (right == nullptr) {
        return nullptr;
    }
    return make<binary_expression>(oper.loc, left, oper.type, right);
}

auto parser::parse_integer() -> const expression*
{
    const auto literal = m_token.literal;
    auto value = std::int64_t {};
    const auto [end, err] = std::from_chars(literal.data(), literal.data() + literal.size(), value);
    if (err != std::errc {} || end != literal.data() + literal.size()) {
        record_error("could not parse {} as integer", literal);
        return nullptr;
    }
    return make<integer_literal>(m_token.loc, value);
}

auto parser::parse_unary() -> const expression*
{
    const auto oper = m_token;
    advance();
    const auto* operand = parse_expression(precedence::prefix);
    if (operand == nullptr) {
        return nullptr;
    }
    return make<unary_expression>(oper.loc, oper.type, operand);
}

auto parser::parse_grouped() -> const expression*
{
    advance();
    const auto* inner = parse_expression(precedence::lowest);
    if (!expect_next(token_type::rparen)) {
        return nullptr;
    }
    return inner;
}

auto parser::parse_if() -> const expression*
{
    const auto loc = m_token.loc;
    if (!expect_next(token_type::lparen)) {
        return nullptr;
    }
    advance();
    const auto* condition = parse_expression(precedence::lowest);
    if (!expect_next(token_type::rparen) || !expect_next(token_type::lbrace)) {
        return nullptr;
    }
    const auto* consequence = parse_block();

    const block_statement* alternative = nullptr;
    if (next_is(token_type::kw_else)) {
        advance();
        if (!expect_next(token_type::lbrace)) {
            return nullptr;
        }
        alternative = parse_block();
    }
    return make<if_expression>(loc, condition, consequence, alternative);
}
