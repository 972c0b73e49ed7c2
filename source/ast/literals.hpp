#pragma once

#include <cstdint>
#include <string>
#include <utility>

#include <lexer/location.hpp>

#include "expression.hpp"

struct identifier final : visitable<identifier>
{
    identifier(location loc, std::string name)
        : visitable {loc}
        , value {std::move(name)}
    {
    }

    [[nodiscard]] auto string() const -> std::string final { return value; }

    std::string value;
};

struct integer_literal final : visitable<integer_literal>
{
    integer_literal(location loc, std::int64_t val)
        : visitable {loc}
        , value {val}
    {
    }

    [[nodiscard]] auto string() const -> std::string final { return std::to_string(value); }

    std::int64_t value;
};

struct boolean_literal final : visitable<boolean_literal>
{
    boolean_literal(location loc, bool val)
        : visitable {loc}
        , value {val}
    {
    }

    [[nodiscard]] auto string() const -> std::string final { return value ? "true" : "false"; }

    bool value;
};
