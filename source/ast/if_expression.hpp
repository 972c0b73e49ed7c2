#pragma once

#include <string>

#include <lexer/location.hpp>

#include "expression.hpp"
#include "statements.hpp"

// alternative is nullptr when there is no else branch
struct if_expression final : visitable<if_expression>
{
    if_expression(location loc,
                  const expression* cond,
                  const block_statement* then_branch,
                  const block_statement* else_branch)
        : visitable {loc}
        , condition {cond}
        , consequence {then_branch}
        , alternative {else_branch}
    {
    }

    [[nodiscard]] auto string() const -> std::string final;

    const expression* condition;
    const block_statement* consequence;
    const block_statement* alternative;
};
