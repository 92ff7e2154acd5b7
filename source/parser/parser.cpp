#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "parser.hpp"

#include <ast/binary_expression.hpp>
#include <ast/expression.hpp>
#include <ast/grouping_expression.hpp>
#include <ast/identifier.hpp>
#include <ast/literal.hpp>
#include <ast/program.hpp>
#include <ast/statements.hpp>
#include <ast/unary_expression.hpp>
#include <diagnostics/reporter.hpp>
#include <lexer/token.hpp>
#include <lexer/token_type.hpp>
#include <object/object.hpp>

namespace
{
enum precedence : std::uint8_t
{
    lowest,
    equals,
    lessgreater,
    sum,
    product,
    prefix,
};

auto precedence_of_token(token_type type) -> std::uint8_t
{
    switch (type) {
        case token_type::equals:
        case token_type::not_equals:
            return equals;
        case token_type::less_than:
        case token_type::less_equal:
        case token_type::greater_than:
        case token_type::greater_equal:
            return lessgreater;
        case token_type::plus:
        case token_type::minus:
            return sum;
        case token_type::slash:
        case token_type::asterisk:
            return product;
        default:
            return lowest;
    }
}
}  // namespace

parser::parser(std::vector<token> tokens, reporter& rep)
    : m_tokens {std::move(tokens)}
    , m_reporter {rep}
{
    // the cursor never moves past a terminating eof
    if (m_tokens.empty() || m_tokens.back().type != token_type::eof) {
        const auto line = m_tokens.empty() ? 1 : m_tokens.back().line;
        m_tokens.push_back(token {.type = token_type::eof, .lexeme = "", .literal = {}, .line = line});
    }
    using enum token_type;
    register_unary(number, [this] { return parse_literal(); });
    register_unary(string, [this] { return parse_literal(); });
    register_unary(tru, [this] { return parse_boolean(); });
    register_unary(fals, [this] { return parse_boolean(); });
    register_unary(nil, [this] { return parse_nil(); });
    register_unary(ident, [this] { return parse_identifier(); });
    register_unary(exclamation, [this] { return parse_unary_expression(); });
    register_unary(minus, [this] { return parse_unary_expression(); });
    register_unary(lparen, [this] { return parse_grouped_expression(); });
    register_binary(plus, [this](expression_ptr left) { return parse_binary_expression(std::move(left)); });
    register_binary(minus, [this](expression_ptr left) { return parse_binary_expression(std::move(left)); });
    register_binary(slash, [this](expression_ptr left) { return parse_binary_expression(std::move(left)); });
    register_binary(asterisk, [this](expression_ptr left) { return parse_binary_expression(std::move(left)); });
    register_binary(equals, [this](expression_ptr left) { return parse_binary_expression(std::move(left)); });
    register_binary(not_equals, [this](expression_ptr left) { return parse_binary_expression(std::move(left)); });
    register_binary(less_than, [this](expression_ptr left) { return parse_binary_expression(std::move(left)); });
    register_binary(less_equal, [this](expression_ptr left) { return parse_binary_expression(std::move(left)); });
    register_binary(greater_than, [this](expression_ptr left) { return parse_binary_expression(std::move(left)); });
    register_binary(greater_equal, [this](expression_ptr left) { return parse_binary_expression(std::move(left)); });
}

auto parser::parse_program() -> program_ptr
{
    auto prog = std::make_unique<program>();
    while (!at_end()) {
        auto stmt = parse_declaration();
        if (stmt != nullptr) {
            prog->statements.push_back(std::move(stmt));
        }
    }
    return prog;
}

auto parser::parse_declaration() -> statement_ptr
{
    auto stmt = match(token_type::var) ? parse_var_declaration() : parse_statement();
    if (stmt == nullptr) {
        report_pending_error();
        synchronize();
        return {};
    }
    return stmt;
}

auto parser::parse_var_declaration() -> statement_ptr
{
    using enum token_type;
    if (!consume(ident, "Expect variable name.")) {
        return {};
    }
    auto stmt = std::make_unique<var_statement>();
    stmt->name = previous();

    if (match(assign)) {
        stmt->initializer = parse_expression(lowest);
        if (stmt->initializer == nullptr) {
            return {};
        }
    }

    if (!consume(semicolon, "Expect ';' after variable declaration.")) {
        return {};
    }
    return stmt;
}

auto parser::parse_statement() -> statement_ptr
{
    if (match(token_type::print)) {
        return parse_print_statement();
    }
    return parse_expression_statement();
}

auto parser::parse_print_statement() -> statement_ptr
{
    auto stmt = std::make_unique<print_statement>();
    stmt->expr = parse_expression(lowest);
    if (stmt->expr == nullptr || !consume(token_type::semicolon, "Expect ';' after value.")) {
        return {};
    }
    return stmt;
}

auto parser::parse_expression_statement() -> statement_ptr
{
    auto stmt = std::make_unique<expression_statement>();
    stmt->expr = parse_expression(lowest);
    if (stmt->expr == nullptr || !consume(token_type::semicolon, "Expect ';' after expression.")) {
        return {};
    }
    return stmt;
}

auto parser::parse_expression(int precedence) -> expression_ptr
{
    const auto unary = m_unary_parsers.find(peek().type);
    if (unary == m_unary_parsers.end()) {
        new_error(peek(), "Expect expression.");
        return {};
    }
    advance();
    auto left_expr = unary->second();
    while (left_expr != nullptr && precedence < peek_precedence()) {
        const auto binary = m_binary_parsers.find(peek().type);
        if (binary == m_binary_parsers.end()) {
            return left_expr;
        }
        advance();
        left_expr = binary->second(std::move(left_expr));
    }
    return left_expr;
}

auto parser::parse_literal() -> expression_ptr
{
    return std::make_unique<literal>(previous().literal);
}

auto parser::parse_boolean() -> expression_ptr
{
    return std::make_unique<literal>(object {previous().type == token_type::tru});
}

auto parser::parse_nil() -> expression_ptr
{
    return std::make_unique<literal>(object {});
}

auto parser::parse_identifier() -> expression_ptr
{
    return std::make_unique<identifier>(previous());
}

auto parser::parse_unary_expression() -> expression_ptr
{
    auto unary = std::make_unique<unary_expression>();
    unary->op = previous();
    unary->right = parse_expression(prefix);
    if (unary->right == nullptr) {
        return {};
    }
    return unary;
}

auto parser::parse_binary_expression(expression_ptr left) -> expression_ptr
{
    auto bin_expr = std::make_unique<binary_expression>();
    bin_expr->op = previous();
    bin_expr->left = std::move(left);

    bin_expr->right = parse_expression(precedence_of_token(bin_expr->op.type));
    if (bin_expr->right == nullptr) {
        return {};
    }
    return bin_expr;
}

auto parser::parse_grouped_expression() -> expression_ptr
{
    auto group = std::make_unique<grouping_expression>();
    group->inner = parse_expression(lowest);
    if (group->inner == nullptr || !consume(token_type::rparen, "Expect ')' after expression.")) {
        return {};
    }
    return group;
}

auto parser::synchronize() -> void
{
    using enum token_type;
    advance();
    while (!at_end()) {
        if (previous().type == semicolon) {
            return;
        }
        switch (peek().type) {
            case clazz:
            case function:
            case var:
            case phor:
            case eef:
            case hwile:
            case print:
            case ret:
                return;
            default:
                break;
        }
        advance();
    }
}

auto parser::report_pending_error() -> void
{
    if (m_error.has_value()) {
        m_reporter.error(m_error->where, m_error->message);
        m_error.reset();
    }
}

auto parser::consume(token_type type, std::string_view message) -> bool
{
    if (check(type)) {
        advance();
        return true;
    }
    new_error(peek(), message);
    return false;
}

auto parser::match(token_type type) -> bool
{
    if (check(type)) {
        advance();
        return true;
    }
    return false;
}

auto parser::check(token_type type) const -> bool
{
    if (at_end()) {
        return false;
    }
    return peek().type == type;
}

auto parser::advance() -> const token&
{
    if (!at_end()) {
        m_current++;
    }
    return previous();
}

auto parser::at_end() const -> bool
{
    return peek().type == token_type::eof;
}

auto parser::peek() const -> const token&
{
    return m_tokens[m_current];
}

auto parser::previous() const -> const token&
{
    return m_tokens[m_current - 1];
}

auto parser::new_error(const token& where, std::string_view message) -> void
{
    m_error = parse_error {.where = where, .message = std::string {message}};
}

auto parser::register_binary(token_type type, binary_parser binary) -> void
{
    m_binary_parsers[type] = std::move(binary);
}

auto parser::register_unary(token_type type, unary_parser unary) -> void
{
    m_unary_parsers[type] = std::move(unary);
}

auto parser::peek_precedence() const -> int
{
    return precedence_of_token(peek().type);
}
