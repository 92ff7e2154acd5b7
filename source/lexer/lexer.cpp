#include <algorithm>
#include <array>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "lexer.hpp"

#include <diagnostics/reporter.hpp>

#include "token.hpp"
#include "token_type.hpp"

using char_literal_lookup_table = std::array<token_type, std::numeric_limits<unsigned char>::max() + 1>;

namespace
{
constexpr auto build_char_to_token_type_map() -> char_literal_lookup_table
{
    auto arr = char_literal_lookup_table {};
    using enum token_type;
    arr.fill(illegal);
    arr['('] = lparen;
    arr[')'] = rparen;
    arr['{'] = lsquirly;
    arr['}'] = rsquirly;
    arr[','] = comma;
    arr['.'] = dot;
    arr['-'] = minus;
    arr['+'] = plus;
    arr[';'] = semicolon;
    arr['/'] = slash;
    arr['*'] = asterisk;
    arr['!'] = exclamation;
    arr['='] = assign;
    arr['>'] = greater_than;
    arr['<'] = less_than;
    return arr;
}

constexpr auto char_literal_tokens = build_char_to_token_type_map();
constexpr auto keyword_count = 16;
using keyword_pair = std::pair<std::string_view, token_type>;
using keyword_lookup_table = std::array<keyword_pair, keyword_count>;

constexpr auto build_keyword_to_token_type_map() -> keyword_lookup_table
{
    return {
        std::pair {"and", token_type::logical_and},
        std::pair {"class", token_type::clazz},
        std::pair {"else", token_type::elze},
        std::pair {"false", token_type::fals},
        std::pair {"for", token_type::phor},
        std::pair {"fun", token_type::function},
        std::pair {"if", token_type::eef},
        std::pair {"nil", token_type::nil},
        std::pair {"or", token_type::logical_or},
        std::pair {"print", token_type::print},
        std::pair {"return", token_type::ret},
        std::pair {"super", token_type::super},
        std::pair {"this", token_type::self},
        std::pair {"true", token_type::tru},
        std::pair {"var", token_type::var},
        std::pair {"while", token_type::hwile},
    };
}

constexpr auto keyword_tokens = build_keyword_to_token_type_map();

using token_pair = std::pair<token_type, token_type>;

struct token_pair_hash
{
    auto operator()(const std::pair<token_type, token_type>& pair) const -> size_t
    {
        return static_cast<uint8_t>(pair.first) ^ static_cast<size_t>(static_cast<uint8_t>(pair.second) << 8U);
    }
};

using two_token_lookup = std::unordered_map<token_pair, token_type, token_pair_hash>;

auto build_two_token_lookup() -> two_token_lookup
{
    using enum token_type;
    two_token_lookup lookup;
    lookup.insert({{exclamation, assign}, not_equals});
    lookup.insert({{assign, assign}, equals});
    lookup.insert({{greater_than, assign}, greater_equal});
    lookup.insert({{less_than, assign}, less_equal});
    return lookup;
}

inline auto is_letter(char chr) -> bool
{
    return std::isalpha(static_cast<unsigned char>(chr)) != 0 || chr == '_';
}

inline auto is_digit(char chr) -> bool
{
    return std::isdigit(static_cast<unsigned char>(chr)) != 0;
}

inline auto is_alpha_numeric(char chr) -> bool
{
    return is_letter(chr) || is_digit(chr);
}

}  // namespace

lexer::lexer(std::string_view input, reporter& rep)
    : m_input {input}
    , m_reporter {rep}
{
}

auto lexer::scan_tokens() -> std::vector<token>
{
    while (!at_end()) {
        m_start = m_position;
        scan_token();
    }
    m_tokens.push_back(token {.type = token_type::eof, .lexeme = "", .literal = {}, .line = m_line});
    return std::move(m_tokens);
}

auto lexer::scan_token() -> void
{
    using enum token_type;
    const auto chr = read_char();
    const auto char_token_type = char_literal_tokens[static_cast<unsigned char>(chr)];
    const static auto two_token = build_two_token_lookup();
    if (char_token_type == slash && match('/')) {
        skip_line_comment();
        return;
    }
    if (char_token_type != illegal) {
        const auto peek_token_type = char_literal_tokens[static_cast<unsigned char>(peek_char())];
        if (const auto itr = two_token.find({char_token_type, peek_token_type}); itr != two_token.end()) {
            read_char();
            add_token(itr->second);
            return;
        }
        add_token(char_token_type);
        return;
    }
    switch (chr) {
        case ' ':
        case '\r':
        case '\t':
            return;
        case '\n':
            m_line++;
            return;
        case '"':
            read_string();
            return;
        default:
            break;
    }
    if (is_digit(chr)) {
        read_number();
        return;
    }
    if (is_letter(chr)) {
        read_identifier_or_keyword();
        return;
    }
    m_reporter.error(m_line, "Unexpected character.");
}

auto lexer::read_char() -> std::string_view::value_type
{
    return m_input[m_position++];
}

auto lexer::match(std::string_view::value_type expected) -> bool
{
    if (at_end() || m_input[m_position] != expected) {
        return false;
    }
    m_position++;
    return true;
}

auto lexer::peek_char() const -> std::string_view::value_type
{
    if (at_end()) {
        return '\0';
    }
    return m_input[m_position];
}

auto lexer::peek_next_char() const -> std::string_view::value_type
{
    if (m_position + 1 >= m_input.size()) {
        return '\0';
    }
    return m_input[m_position + 1];
}

auto lexer::at_end() const -> bool
{
    return m_position >= m_input.size();
}

auto lexer::skip_line_comment() -> void
{
    while (peek_char() != '\n' && !at_end()) {
        read_char();
    }
}

auto lexer::read_identifier_or_keyword() -> void
{
    while (is_alpha_numeric(peek_char())) {
        read_char();
    }
    const auto identifier_or_keyword = m_input.substr(m_start, m_position - m_start);
    // NOLINTBEGIN(*-qualified-auto)
    const auto itr =
        std::find_if(keyword_tokens.cbegin(),
                     keyword_tokens.cend(),
                     [&identifier_or_keyword](auto pair) -> bool { return pair.first == identifier_or_keyword; });
    if (itr != keyword_tokens.end()) {
        add_token(itr->second);
        return;
    }
    // NOLINTEND(*-qualified-auto)
    add_token(token_type::ident);
}

auto lexer::read_number() -> void
{
    while (is_digit(peek_char())) {
        read_char();
    }
    // the dot only belongs to the number if a digit follows it
    if (peek_char() == '.' && is_digit(peek_next_char())) {
        read_char();
        while (is_digit(peek_char())) {
            read_char();
        }
    }
    const auto literal = std::string {m_input.substr(m_start, m_position - m_start)};
    // overflow and underflow keep the IEEE result (inf, zero or a subnormal)
    add_token(token_type::number, object {std::strtod(literal.c_str(), nullptr)});
}

auto lexer::read_string() -> void
{
    while (peek_char() != '"' && !at_end()) {
        if (peek_char() == '\n') {
            m_line++;
        }
        read_char();
    }
    if (at_end()) {
        m_reporter.error(m_line, "Unterminated string.");
        return;
    }
    // closing quote
    read_char();
    const auto count = m_position - m_start - 2;
    add_token(token_type::string, object {std::string {m_input.substr(m_start + 1, count)}});
}

auto lexer::add_token(token_type type, object literal) -> void
{
    m_tokens.push_back(token {
        .type = type,
        .lexeme = std::string {m_input.substr(m_start, m_position - m_start)},
        .literal = std::move(literal),
        .line = m_line,
    });
}
