#pragma once

#include <ostream>
#include <string_view>

#include "location.hpp"
#include "token_type.hpp"

// The literal is a view into the lexer's input, which must outlive the token.
struct token final
{
    token_type type {token_type::illegal};
    std::string_view literal;
    location loc;

    auto operator==(const token& other) const -> bool = default;
};

auto operator<<(std::ostream& ostream, const token& tkn) -> std::ostream&;
