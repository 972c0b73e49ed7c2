#pragma once

#include <cstdint>
#include <ostream>
#include <string_view>

#include <fmt/ostream.h>

enum class token_type : std::uint8_t
{
    illegal,
    eof,
    ident,
    integer,

    // operators
    assign,
    plus,
    minus,
    asterisk,
    slash,
    bang,
    less_than,
    greater_than,
    equals,
    not_equals,

    // delimiters
    comma,
    semicolon,
    lparen,
    rparen,
    lbrace,
    rbrace,

    kw_let,
    kw_true,
    kw_false,
    kw_if,
    kw_else,
    kw_return,
};

// Source spelling of operators, delimiters and keywords; throws std::invalid_argument for values outside the enum.
[[nodiscard]] auto spelling(token_type type) -> std::string_view;

auto operator<<(std::ostream& ostream, token_type type) -> std::ostream&;

template<>
struct fmt::formatter<token_type> : ostream_formatter
{
};
