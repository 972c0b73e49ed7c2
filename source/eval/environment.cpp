#include <optional>
#include <ostream>
#include <string>

#include "environment.hpp"

#include <fmt/ostream.h>
#include <object/object.hpp>

environment::environment(const environment* enclosing)
    : outer {enclosing}
{
}

auto environment::get(const std::string& name) const -> std::optional<const object*>
{
    for (const auto* scope = this; scope != nullptr; scope = scope->outer) {
        if (const auto found = scope->bindings.find(name); found != scope->bindings.end()) {
            return found->second;
        }
    }
    return std::nullopt;
}

void environment::set(const std::string& name, const object* value)
{
    bindings.insert_or_assign(name, value);
}

void environment::debug(std::ostream& out) const
{
    for (const auto& [name, value] : bindings) {
        fmt::print(out, "{} = {}\n", name, value != nullptr ? value->inspect() : std::string {"<no value>"});
    }
}
