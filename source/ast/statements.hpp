#pragma once

#include <string>
#include <utility>

#include <lexer/location.hpp>

#include "expression.hpp"
#include "literals.hpp"

struct program final : visitable<program>
{
    program(location loc, statement_list stmts)
        : visitable {loc}
        , statements {std::move(stmts)}
    {
    }

    [[nodiscard]] auto string() const -> std::string final;

    statement_list statements;
};

struct block_statement final : visitable<block_statement>
{
    block_statement(location loc, statement_list stmts)
        : visitable {loc}
        , statements {std::move(stmts)}
    {
    }

    [[nodiscard]] auto string() const -> std::string final;

    statement_list statements;
};

struct expression_statement final : visitable<expression_statement>
{
    expression_statement(location loc, const expression* wrapped)
        : visitable {loc}
        , expr {wrapped}
    {
    }

    [[nodiscard]] auto string() const -> std::string final;

    const expression* expr;
};

struct let_statement final : visitable<let_statement>
{
    let_statement(location loc, const identifier* target, const expression* init)
        : visitable {loc}
        , name {target}
        , value {init}
    {
    }

    [[nodiscard]] auto string() const -> std::string final;

    const identifier* name;
    const expression* value;
};

struct return_statement final : visitable<return_statement>
{
    return_statement(location loc, const expression* result)
        : visitable {loc}
        , value {result}
    {
    }

    [[nodiscard]] auto string() const -> std::string final;

    const expression* value;
};
