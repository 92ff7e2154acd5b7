#pragma once

#include <string>
#include <utility>

#include <object/object.hpp>

#include "expression.hpp"

struct literal final : expression
{
    explicit literal(object val)
        : value {std::move(val)}
    {
    }

    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    object value;
};
