#include <string>

#include "if_expression.hpp"

#include <fmt/format.h>

auto if_expression::string() const -> std::string
{
    auto out = fmt::format("if {} {}", condition->string(), consequence->string());
    if (alternative != nullptr) {
        out += fmt::format(" else {}", alternative->string());
    }
    return out;
}
