#pragma once

#include <cstdint>
#include <ostream>

#include <fmt/ostream.h>

enum class token_type : std::uint8_t
{
    // special tokens
    illegal,
    eof,

    // single character tokens
    lparen,
    rparen,
    lsquirly,
    rsquirly,
    comma,
    dot,
    minus,
    plus,
    semicolon,
    slash,
    asterisk,

    // one or two character tokens
    exclamation,
    not_equals,
    assign,
    equals,
    greater_than,
    greater_equal,
    less_than,
    less_equal,

    // multi character tokens
    ident,
    string,
    number,

    // keywords
    logical_and,
    clazz,
    elze,
    fals,
    function,
    phor,
    eef,
    nil,
    logical_or,
    print,
    ret,
    super,
    self,
    tru,
    var,
    hwile,
};

auto operator<<(std::ostream& ostream, token_type type) -> std::ostream&;

template<>
struct fmt::formatter<token_type> : ostream_formatter
{
};
