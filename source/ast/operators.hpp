#pragma once

#include <string>

#include <lexer/location.hpp>
#include <lexer/token_type.hpp>

#include "expression.hpp"

// Prefix operator application, rendered as `(op operand)`.
struct unary_expression final : visitable<unary_expression>
{
    unary_expression(location loc, token_type oper, const expression* operand)
        : visitable {loc}
        , op {oper}
        , right {operand}
    {
    }

    [[nodiscard]] auto string() const -> std::string final;

    token_type op;
    const expression* right;
};

// Infix operator application, rendered as `(left op right)`.
struct binary_expression final : visitable<binary_expression>
{
    binary_expression(location loc, const expression* lhs, token_type oper, const expression* rhs)
        : visitable {loc}
        , left {lhs}
        , op {oper}
        , right {rhs}
    {
    }

    [[nodiscard]] auto string() const -> std::string final;

    const expression* left;
    token_type op;
    const expression* right;
};
