#pragma once

#include <string>

#include <lexer/token.hpp>

#include "expression.hpp"

struct binary_expression final : expression
{
    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    expression_ptr left {};
    token op {};
    expression_ptr right {};
};
