#include <ostream>

#include "token.hpp"

auto token::operator==(const token& other) const -> bool
{
    return type == other.type && lexeme == other.lexeme && literal == other.literal && line == other.line;
}

auto operator<<(std::ostream& ostream, const token& token) -> std::ostream&
{
    return ostream << "token{" << token.type << ", `" << token.lexeme << "´, " << token.literal << ", " << token.line
                   << "}";
}
