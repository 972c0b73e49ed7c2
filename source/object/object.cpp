#include <array>
#include <cstddef>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>

#include "object.hpp"

namespace
{
constexpr auto type_names = std::array<std::string_view, 5> {
    "INTEGER",
    "BOOLEAN",
    "NULL",
    "RETURN_VALUE",
    "ERROR",
};
}  // namespace

auto object::is_null() const -> bool
{
    return this == null();
}

auto operator<<(std::ostream& ostrm, object::object_type type) -> std::ostream&
{
    const auto index = static_cast<std::size_t>(type);
    if (index >= type_names.size()) {
        throw std::invalid_argument(fmt::format("invalid object_type {}", index));
    }
    return ostrm << type_names.at(index);
}

auto integer_object::inspect() const -> std::string
{
    return std::to_string(value);
}

auto boolean_object::inspect() const -> std::string
{
    return value ? "true" : "false";
}

auto null_object::inspect() const -> std::string
{
    return "null";
}

auto return_value_object::inspect() const -> std::string
{
    return return_value != nullptr ? return_value->inspect() : std::string {};
}

auto error_object::inspect() const -> std::string
{
    return fmt::format("ERROR: {}", value);
}

auto tru() -> const object*
{
    static const boolean_object instance {true};
    return &instance;
}

auto fals() -> const object*
{
    static const boolean_object instance {false};
    return &instance;
}

auto null() -> const object*
{
    static const null_object instance;
    return &instance;
}

auto native_bool_to_object(bool val) -> const object*
{
    return val ? tru() : fals();
}
