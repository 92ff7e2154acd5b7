#pragma once

#include <cstddef>
#include <ostream>
#include <string>

#include <fmt/ostream.h>
#include <object/object.hpp>

#include "token_type.hpp"

struct token final
{
    token_type type {token_type::eof};
    std::string lexeme;
    object literal {};
    std::size_t line {1};
    auto operator==(const token& other) const -> bool;
};

auto operator<<(std::ostream& ostream, const token& token) -> std::ostream&;

template<>
struct fmt::formatter<token> : ostream_formatter
{
};
