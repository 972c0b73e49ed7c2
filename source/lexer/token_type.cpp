#include <array>
#include <cstddef>
#include <ostream>
#include <stdexcept>
#include <string_view>

#include "token_type.hpp"

#include <fmt/format.h>

namespace
{
constexpr auto token_type_count = static_cast<std::size_t>(token_type::kw_return) + 1;

// indexed by token_type, keep in enum order
constexpr auto spellings = std::array<std::string_view, token_type_count> {
    "illegal", "eof", "identifier", "integer",
    "=", "+", "-", "*", "/", "!", "<", ">", "==", "!=",
    ",", ";", "(", ")", "{", "}",
    "let", "true", "false", "if", "else", "return",
};
}  // namespace

auto spelling(token_type type) -> std::string_view
{
    const auto index = static_cast<std::size_t>(type);
    if (index >= spellings.size()) {
        throw std::invalid_argument(fmt::format("invalid token_type {}", index));
    }
    return spellings.at(index);
}

auto operator<<(std::ostream& ostream, token_type type) -> std::ostream&
{
    return ostream << spelling(type);
}
