#pragma once

#include <string_view>

#include <ast/statements.hpp>
#include <parser/parser.hpp>

auto assert_no_parse_errors(const parser& prsr) -> bool;
auto assert_program(std::string_view input) -> const program*;
