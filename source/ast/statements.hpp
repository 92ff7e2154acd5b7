#pragma once

#include <memory>
#include <string>

#include <lexer/token.hpp>

#include "expression.hpp"

struct statement
{
    statement() = default;
    virtual ~statement() = default;
    statement(const statement&) = delete;
    statement(statement&&) = delete;
    auto operator=(const statement&) -> statement& = delete;
    auto operator=(statement&&) -> statement& = delete;

    [[nodiscard]] virtual auto string() const -> std::string = 0;
    virtual void accept(struct visitor& visitor) const = 0;
};

using statement_ptr = std::unique_ptr<statement>;

struct expression_statement final : statement
{
    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    expression_ptr expr {};
};

struct print_statement final : statement
{
    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    expression_ptr expr {};
};

struct var_statement final : statement
{
    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    token name {};
    // null when declared without initializer
    expression_ptr initializer {};
};
