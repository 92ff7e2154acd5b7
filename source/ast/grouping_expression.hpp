#pragma once

#include <string>

#include "expression.hpp"

struct grouping_expression final : expression
{
    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    expression_ptr inner {};
};
