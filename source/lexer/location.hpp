#pragma once

#include <cstddef>
#include <ostream>
#include <string_view>

#include <fmt/ostream.h>

// 1-based position of a token in its source, printed as file:line:column.
struct location final
{
    std::string_view filename;
    std::size_t line {};
    std::size_t column {};

    auto operator==(const location& other) const -> bool = default;
};

auto operator<<(std::ostream& ostream, const location& loc) -> std::ostream&;

template<>
struct fmt::formatter<location> : ostream_formatter
{
};
