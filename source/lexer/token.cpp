#include <ostream>

#include "token.hpp"

#include <fmt/format.h>

auto operator<<(std::ostream& ostream, const location& loc) -> std::ostream&
{
    return ostream << fmt::format("{}:{}:{}", loc.filename, loc.line, loc.column);
}

auto operator<<(std::ostream& ostream, const token& tkn) -> std::ostream&
{
    return ostream << fmt::format("{} `{}` at {}", tkn.type, tkn.literal, tkn.loc);
}
