#include <string>

#include "operators.hpp"

#include <fmt/format.h>

auto unary_expression::string() const -> std::string
{
    return fmt::format("({}{})", op, right->string());
}

auto binary_expression::string() const -> std::string
{
    return fmt::format("({} {} {})", left->string(), op, right->string());
}
