#pragma once

#include <memory>
#include <string>
#include <vector>

#include "statements.hpp"

struct program final
{
    [[nodiscard]] auto string() const -> std::string;

    std::vector<statement_ptr> statements;
};

using program_ptr = std::unique_ptr<program>;
