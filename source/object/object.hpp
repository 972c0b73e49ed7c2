#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <utility>

#include <arena.hpp>
#include <fmt/format.h>
#include <fmt/ostream.h>

// Runtime value produced by the evaluator. Objects are immutable once built and are passed around as
// `const object*`; a nullptr stands for "no value".
struct object
{
    enum class object_type : std::uint8_t
    {
        integer,
        boolean,
        null,
        return_value,
        error,
    };

    object() = default;
    virtual ~object() = default;
    object(const object&) = delete;
    object(object&&) = delete;
    auto operator=(const object&) -> object& = delete;
    auto operator=(object&&) -> object& = delete;

    [[nodiscard]] virtual auto type() const -> object_type = 0;
    [[nodiscard]] virtual auto inspect() const -> std::string = 0;

    [[nodiscard]] auto is(object_type tag) const -> bool { return type() == tag; }
    [[nodiscard]] auto is_error() const -> bool { return is(object_type::error); }
    [[nodiscard]] auto is_return_value() const -> bool { return is(object_type::return_value); }
    [[nodiscard]] auto is_null() const -> bool;

    // Unchecked downcast, callers test the tag first.
    template<typename T>
    [[nodiscard]] auto as() const -> const T*
    {
        return static_cast<const T*>(this);
    }

    template<typename T>
    [[nodiscard]] auto val() const -> const typename T::value_type&
    {
        return as<T>()->value;
    }
};

auto operator<<(std::ostream& ostrm, object::object_type type) -> std::ostream&;

template<>
struct fmt::formatter<object::object_type> : ostream_formatter
{
};

// An object carrying a single payload of type T under a fixed type tag.
template<object::object_type Tag, typename T>
struct value_object : object
{
    using value_type = T;

    explicit value_object(value_type val)
        : value {std::move(val)}
    {
    }

    [[nodiscard]] auto type() const -> object_type final { return Tag; }

    value_type value;
};

struct integer_object final : value_object<object::object_type::integer, std::int64_t>
{
    using value_object::value_object;
    [[nodiscard]] auto inspect() const -> std::string final;
};

// Only the two instances behind tru() and fals() exist.
struct boolean_object final : value_object<object::object_type::boolean, bool>
{
    using value_object::value_object;
    [[nodiscard]] auto inspect() const -> std::string final;
};

struct null_object final : object
{
    [[nodiscard]] auto type() const -> object_type final { return object_type::null; }
    [[nodiscard]] auto inspect() const -> std::string final;
};

// Carries a return statement's payload up through enclosing blocks. The payload is nullptr when the returned
// expression produced no value.
struct return_value_object final : object
{
    explicit return_value_object(const object* payload)
        : return_value {payload}
    {
    }

    [[nodiscard]] auto type() const -> object_type final { return object_type::return_value; }
    [[nodiscard]] auto inspect() const -> std::string final;

    const object* return_value;
};

struct error_object final : value_object<object::object_type::error, std::string>
{
    using value_object::value_object;
    [[nodiscard]] auto inspect() const -> std::string final;
};

auto tru() -> const object*;
auto fals() -> const object*;
auto null() -> const object*;
auto native_bool_to_object(bool val) -> const object*;

template<typename... Args>
auto make_error(fmt::format_string<Args...> format, Args&&... args) -> const object*
{
    return make<error_object>(fmt::format(format, std::forward<Args>(args)...));
}
