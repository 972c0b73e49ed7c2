#pragma once

struct program;
struct block_statement;
struct expression_statement;
struct let_statement;
struct return_statement;
struct identifier;
struct integer_literal;
struct boolean_literal;
struct unary_expression;
struct binary_expression;
struct if_expression;

// Adding a node kind adds an overload here, which every visitor then has to implement.
struct visitor
{
    visitor() = default;
    virtual ~visitor() = default;
    visitor(const visitor&) = delete;
    visitor(visitor&&) = delete;
    auto operator=(const visitor&) -> visitor& = delete;
    auto operator=(visitor&&) -> visitor& = delete;

    virtual void visit(const program& node) = 0;
    virtual void visit(const block_statement& node) = 0;
    virtual void visit(const expression_statement& node) = 0;
    virtual void visit(const let_statement& node) = 0;
    virtual void visit(const return_statement& node) = 0;
    virtual void visit(const identifier& node) = 0;
    virtual void visit(const integer_literal& node) = 0;
    virtual void visit(const boolean_literal& node) = 0;
    virtual void visit(const unary_expression& node) = 0;
    virtual void visit(const binary_expression& node) = 0;
    virtual void visit(const if_expression& node) = 0;
};
