#pragma once

#include <string>
#include <vector>

#include <lexer/location.hpp>

#include "visitor.hpp"

// Base of every syntax tree node. Nodes are built complete by the parser and never change afterwards.
struct expression
{
    explicit expression(location loc)
        : m_loc {loc}
    {
    }

    virtual ~expression() = default;
    expression(const expression&) = delete;
    expression(expression&&) = delete;
    auto operator=(const expression&) -> expression& = delete;
    auto operator=(expression&&) -> expression& = delete;

    [[nodiscard]] virtual auto string() const -> std::string = 0;
    virtual void accept(visitor& vis) const = 0;

    [[nodiscard]] auto loc() const -> location { return m_loc; }

  private:
    location m_loc;
};

using statement = expression;
using statement_list = std::vector<const statement*>;

// Dispatches accept() to the visit overload of the concrete node type.
template<typename Node>
struct visitable : expression
{
    using expression::expression;

    void accept(visitor& vis) const final { vis.visit(static_cast<const Node&>(*this)); }
};
