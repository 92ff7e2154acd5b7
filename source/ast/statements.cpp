#include <string>

#include "statements.hpp"

#include <fmt/format.h>

#include "visitor.hpp"

auto expression_statement::string() const -> std::string
{
    return fmt::format("{};", expr->string());
}

void expression_statement::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto print_statement::string() const -> std::string
{
    return fmt::format("print {};", expr->string());
}

void print_statement::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto var_statement::string() const -> std::string
{
    if (initializer != nullptr) {
        return fmt::format("var {} = {};", name.lexeme, initializer->string());
    }
    return fmt::format("var {};", name.lexeme);
}

void var_statement::accept(visitor& visitor) const
{
    visitor.visit(*this);
}
