#pragma once

#include <cstddef>
#include <string_view>
#include <vector>

#include <object/object.hpp>

#include "token.hpp"
#include "token_type.hpp"

class reporter;

/// Single forward pass over a source text. Lexical errors are reported and
/// skipped, the resulting token list always ends with an eof token.
class lexer final
{
  public:
    lexer(std::string_view input, reporter& rep);

    auto scan_tokens() -> std::vector<token>;

  private:
    auto scan_token() -> void;
    auto read_char() -> std::string_view::value_type;
    auto match(std::string_view::value_type expected) -> bool;
    [[nodiscard]] auto peek_char() const -> std::string_view::value_type;
    [[nodiscard]] auto peek_next_char() const -> std::string_view::value_type;
    [[nodiscard]] auto at_end() const -> bool;
    auto skip_line_comment() -> void;
    auto read_identifier_or_keyword() -> void;
    auto read_number() -> void;
    auto read_string() -> void;
    auto add_token(token_type type, object literal = {}) -> void;

    std::string_view m_input;
    reporter& m_reporter;
    std::vector<token> m_tokens;
    std::string_view::size_type m_start {0};
    std::string_view::size_type m_position {0};
    std::size_t m_line {1};
};
