#include <string>
#include <string_view>

#include "statements.hpp"

#include <fmt/format.h>

namespace
{
auto render(const statement_list& stmts, std::string_view separator) -> std::string
{
    auto out = std::string {};
    for (auto itr = stmts.begin(); itr != stmts.end(); ++itr) {
        if (itr != stmts.begin()) {
            out.append(separator);
        }
        out.append((*itr)->string());
    }
    return out;
}

auto render_optional(const expression* expr) -> std::string
{
    return expr != nullptr ? expr->string() : std::string {};
}
}  // namespace

auto program::string() const -> std::string
{
    return render(statements, "");
}

auto block_statement::string() const -> std::string
{
    return fmt::format("{{ {} }}", render(statements, " "));
}

auto expression_statement::string() const -> std::string
{
    return render_optional(expr);
}

auto let_statement::string() const -> std::string
{
    return fmt::format("let {} = {};", name->string(), render_optional(value));
}

auto return_statement::string() const -> std::string
{
    return fmt::format("return {};", render_optional(value));
}
