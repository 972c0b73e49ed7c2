#pragma once

#include <ast/expression.hpp>
#include <ast/visitor.hpp>
#include <object/object.hpp>

#include "environment.hpp"

// Tree-walking evaluator. evaluate() returns nullptr when the node produced no value, e.g. an empty program or
// one ending in a let statement. Without an environment the evaluator creates its own.
class evaluator final : public visitor
{
  public:
    explicit evaluator(environment* env = nullptr);

    auto evaluate(const expression* node) -> const object*;

  private:
    void visit(const program& node) final;
    void visit(const block_statement& node) final;
    void visit(const expression_statement& node) final;
    void visit(const let_statement& node) final;
    void visit(const return_statement& node) final;
    void visit(const identifier& node) final;
    void visit(const integer_literal& node) final;
    void visit(const boolean_literal& node) final;
    void visit(const unary_expression& node) final;
    void visit(const binary_expression& node) final;
    void visit(const if_expression& node) final;

    auto eval_sequence(const statement_list& stmts) -> const object*;

    environment* m_env;
    const object* m_result {};
};
