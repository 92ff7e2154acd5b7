#include <cmath>
#include <ostream>
#include <string>
#include <variant>

#include "object.hpp"

#include <fmt/format.h>

auto number_to_string(number_value val) -> std::string
{
    if (val == 0) {
        // negative zero prints as 0
        return "0";
    }
    if (std::isfinite(val) && std::trunc(val) == val) {
        return fmt::format("{:.0f}", val);
    }
    return fmt::format("{}", val);
}

auto object::is_truthy() const -> bool
{
    return std::visit(overloaded {
                          [](const nil_type&) { return false; },
                          [](const bool val) { return val; },
                          [](const error&) { return false; },
                          [](const auto&) { return true; },
                      },
                      value);
}

auto object::type_name() const -> std::string
{
    return std::visit(overloaded {
                          [](const nil_type&) { return "nil"; },
                          [](const bool) { return "bool"; },
                          [](const number_value) { return "number"; },
                          [](const string_value&) { return "string"; },
                          [](const error&) { return "error"; },
                      },
                      value);
}

auto object::inspect() const -> std::string
{
    return std::visit(overloaded {
                          [](const nil_type&) -> std::string { return "nil"; },
                          [](const bool val) -> std::string { return val ? "true" : "false"; },
                          [](const number_value val) -> std::string { return number_to_string(val); },
                          [](const string_value& val) -> std::string { return fmt::format("\"{}\"", val); },
                          [](const error& err) -> std::string { return fmt::format("ERROR: {}", err.message); },
                      },
                      value);
}

auto operator==(const object& lhs, const object& rhs) -> bool
{
    return std::visit(overloaded {
                          [](const nil_type&, const nil_type&) { return true; },
                          [](const bool val1, const bool val2) { return val1 == val2; },
                          [](const number_value val1, const number_value val2) { return val1 == val2; },
                          [](const string_value& val1, const string_value& val2) { return val1 == val2; },
                          [](const error& err1, const error& err2) { return err1 == err2; },
                          [](const auto&, const auto&) { return false; },
                      },
                      lhs.value,
                      rhs.value);
}

auto operator<<(std::ostream& ostrm, const object& obj) -> std::ostream&
{
    return ostrm << obj.inspect();
}
