#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <unordered_map>

struct object;

// Name to value bindings. A name may be bound to nullptr when a let statement's value produced no value, so
// lookups report "not found" through an empty optional.
struct environment final
{
    explicit environment(const environment* enclosing = nullptr);

    [[nodiscard]] auto get(const std::string& name) const -> std::optional<const object*>;
    void set(const std::string& name, const object* value);

    // Writes every binding of this scope to out, one per line.
    void debug(std::ostream& out) const;

    std::unordered_map<std::string, const object*> bindings;
    const environment* outer;
};
