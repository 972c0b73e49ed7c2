#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include <ast/expression.hpp>
#include <ast/if_expression.hpp>
#include <ast/literals.hpp>
#include <ast/operators.hpp>
#include <ast/statements.hpp>
#include <fmt/format.h>
#include <lexer/lexer.hpp>
#include <lexer/token.hpp>
#include <lexer/token_type.hpp>

// Precedence climbing parser. Diagnostics are collected rather than thrown; check errors() before using the tree.
class parser final
{
  public:
    explicit parser(lexer lxr);

    auto parse_program() -> const program*;
    [[nodiscard]] auto errors() const -> const std::vector<std::string>&;

  private:
    enum class precedence : std::uint8_t
    {
        lowest,
        equality,
        comparison,
        sum,
        product,
        prefix,
    };

    [[nodiscard]] static auto binding_power(token_type type) -> precedence;

    void advance();
    auto expect_next(token_type type) -> bool;
    [[nodiscard]] auto next_is(token_type type) const -> bool;
    void skip_optional_semicolon();

    auto parse_statement() -> const statement*;
    auto parse_let() -> const statement*;
    auto parse_return() -> const statement*;
    auto parse_expression_statement() -> const statement*;
    auto parse_block() -> const block_statement*;

    auto parse_expression(precedence min_precedence) -> const expression*;
    auto parse_prefix() -> const expression*;
    auto parse_infix(const expression* left) -> const expression*;
    auto parse_integer() -> const expression*;
    auto parse_unary() -> const expression*;
    auto parse_grouped() -> const expression*;
    auto parse_if() -> const expression*;

    template<typename... Args>
    void record_error(fmt::format_string<Args...> format, Args&&... args)
    {
        m_errors.emplace_back(fmt::format(format, std::forward<Args>(args)...));
    }

    lexer m_lexer;
    token m_token;
    token m_next;
    std::vector<std::string> m_errors;
};
