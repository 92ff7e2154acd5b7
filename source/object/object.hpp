#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <utility>
#include <variant>

#include <fmt/core.h>
#include <fmt/ostream.h>

// helper type for std::visit
template<typename... T>
struct overloaded : T...
{
    using T::operator()...;
};
template<class... T>
overloaded(T...) -> overloaded<T...>;

using nil_type = std::monostate;
using number_value = double;
using string_value = std::string;

struct error
{
    std::string message;
    std::size_t line {};
    auto operator==(const error& other) const -> bool = default;
};

using value_type = std::variant<nil_type, bool, number_value, string_value, error>;

struct object
{
    template<typename T>
    [[nodiscard]] auto is() const -> bool
    {
        return std::holds_alternative<T>(value);
    }

    [[nodiscard]] auto is_nil() const -> bool { return is<nil_type>(); }

    [[nodiscard]] auto is_error() const -> bool { return is<error>(); }

    [[nodiscard]] auto is_truthy() const -> bool;

    template<typename T>
    [[nodiscard]] auto as() const -> const T&
    {
        return std::get<T>(value);
    }

    [[nodiscard]] auto type_name() const -> std::string;

    /// Display form used by `print`, the AST dump and the debug output.
    [[nodiscard]] auto inspect() const -> std::string;

    value_type value {};
};

template<typename... T>
auto make_error(std::size_t line, fmt::format_string<T...> fmt, T&&... args) -> object
{
    return object {error {.message = fmt::format(fmt, std::forward<T>(args)...), .line = line}};
}

auto number_to_string(number_value val) -> std::string;

auto operator==(const object& lhs, const object& rhs) -> bool;
auto operator<<(std::ostream& ostrm, const object& obj) -> std::ostream&;

template<>
struct fmt::formatter<object> : ostream_formatter
{
};
