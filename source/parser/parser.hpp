#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <ast/expression.hpp>
#include <ast/program.hpp>
#include <ast/statements.hpp>
#include <lexer/token.hpp>
#include <lexer/token_type.hpp>

class reporter;

struct parse_error
{
    token where;
    std::string message;
};

/// Recursive descent parser over a scanned token list.
///
/// A failing parse routine records a parse_error and returns a null node.
/// Declarations are the recovery point: the pending error is reported there,
/// the parser skips to the next statement boundary and continues, so a
/// program with errors yields the statements that did parse.
class parser final
{
  public:
    parser(std::vector<token> tokens, reporter& rep);
    parser(const parser&) = delete;
    parser(parser&&) = delete;
    auto operator=(const parser&) -> parser& = delete;
    auto operator=(parser&&) -> parser& = delete;
    ~parser() = default;

    auto parse_program() -> program_ptr;

  private:
    using binary_parser = std::function<expression_ptr(expression_ptr)>;
    using unary_parser = std::function<expression_ptr()>;

    auto parse_declaration() -> statement_ptr;
    auto parse_var_declaration() -> statement_ptr;
    auto parse_statement() -> statement_ptr;
    auto parse_print_statement() -> statement_ptr;
    auto parse_expression_statement() -> statement_ptr;

    auto parse_expression(int precedence) -> expression_ptr;
    auto parse_literal() -> expression_ptr;
    auto parse_boolean() -> expression_ptr;
    auto parse_nil() -> expression_ptr;
    auto parse_identifier() -> expression_ptr;
    auto parse_unary_expression() -> expression_ptr;
    auto parse_binary_expression(expression_ptr left) -> expression_ptr;
    auto parse_grouped_expression() -> expression_ptr;

    auto synchronize() -> void;
    auto report_pending_error() -> void;
    auto consume(token_type type, std::string_view message) -> bool;
    auto match(token_type type) -> bool;
    [[nodiscard]] auto check(token_type type) const -> bool;
    auto advance() -> const token&;
    [[nodiscard]] auto at_end() const -> bool;
    [[nodiscard]] auto peek() const -> const token&;
    [[nodiscard]] auto previous() const -> const token&;
    auto new_error(const token& where, std::string_view message) -> void;
    auto register_binary(token_type type, binary_parser binary) -> void;
    auto register_unary(token_type type, unary_parser unary) -> void;
    [[nodiscard]] auto peek_precedence() const -> int;

    std::vector<token> m_tokens;
    std::size_t m_current {0};
    reporter& m_reporter;
    std::optional<parse_error> m_error;

    std::unordered_map<token_type, unary_parser> m_unary_parsers;
    std::unordered_map<token_type, binary_parser> m_binary_parsers;
};
