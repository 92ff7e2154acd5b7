#pragma once

#include <string>

#include <lexer/token.hpp>

#include "expression.hpp"

struct unary_expression final : expression
{
    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    token op {};
    expression_ptr right {};
};
