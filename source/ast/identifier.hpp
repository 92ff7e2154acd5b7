#pragma once

#include <string>
#include <utility>

#include <lexer/token.hpp>

#include "expression.hpp"

/// A variable reference by name.
struct identifier final : expression
{
    explicit identifier(token tkn)
        : name {std::move(tkn)}
    {
    }

    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    token name;
};
