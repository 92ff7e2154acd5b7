#include <ostream>
#include <string>

#include "evaluator.hpp"

#include <ast/binary_expression.hpp>
#include <ast/expression.hpp>
#include <ast/grouping_expression.hpp>
#include <ast/identifier.hpp>
#include <ast/literal.hpp>
#include <ast/program.hpp>
#include <ast/statements.hpp>
#include <ast/unary_expression.hpp>
#include <diagnostics/reporter.hpp>
#include <fmt/format.h>
#include <fmt/ostream.h>
#include <lexer/token.hpp>
#include <lexer/token_type.hpp>
#include <object/object.hpp>

namespace
{
auto operands_must_be_numbers(const token& oper) -> object
{
    return make_error(oper.line, "Operand(s) must be numbers.");
}

auto apply_plus(const token& oper, const object& left, const object& right) -> object
{
    if (left.is<number_value>() && right.is<number_value>()) {
        return object {left.as<number_value>() + right.as<number_value>()};
    }
    if (left.is<string_value>() && right.is<string_value>()) {
        return object {left.as<string_value>() + right.as<string_value>()};
    }
    return make_error(oper.line, "Operands must be two numbers or two strings.");
}

auto apply_binary_operator(const token& oper, const object& left, const object& right) -> object
{
    using enum token_type;
    switch (oper.type) {
        case equals:
            return object {left == right};
        case not_equals:
            return object {!(left == right)};
        case plus:
            return apply_plus(oper, left, right);
        default:
            break;
    }

    if (!left.is<number_value>() || !right.is<number_value>()) {
        return operands_must_be_numbers(oper);
    }
    const auto lhs = left.as<number_value>();
    const auto rhs = right.as<number_value>();
    switch (oper.type) {
        case minus:
            return object {lhs - rhs};
        case asterisk:
            return object {lhs * rhs};
        case slash:
            // IEEE semantics, a zero divisor yields inf or nan
            return object {lhs / rhs};
        case greater_than:
            return object {lhs > rhs};
        case greater_equal:
            return object {lhs >= rhs};
        case less_than:
            return object {lhs < rhs};
        case less_equal:
            return object {lhs <= rhs};
        default:
            return make_error(oper.line, "unknown operator: {}", oper.type);
    }
}

}  // namespace

evaluator::evaluator(reporter& rep, std::ostream& out)
    : m_reporter {rep}
    , m_out {out}
{
}

auto evaluator::evaluate(const expression& expr) -> object
{
    expr.accept(*this);
    return m_result;
}

auto evaluator::execute(const statement& stmt) -> object
{
    stmt.accept(*this);
    return m_result;
}

auto evaluator::interpret(const program& prgrm) -> void
{
    for (const auto& stmt : prgrm.statements) {
        const auto result = execute(*stmt);
        if (result.is_error()) {
            m_reporter.runtime_error(result.as<error>());
            return;
        }
    }
}

void evaluator::visit(const binary_expression& expr)
{
    expr.left->accept(*this);
    if (m_result.is_error()) {
        return;
    }
    const auto evaluated_left = m_result;
    expr.right->accept(*this);
    if (m_result.is_error()) {
        return;
    }
    const auto evaluated_right = m_result;

    m_result = apply_binary_operator(expr.op, evaluated_left, evaluated_right);
}

void evaluator::visit(const expression_statement& stmt)
{
    stmt.expr->accept(*this);
    if (m_result.is_error()) {
        return;
    }
    m_result = object {};
}

void evaluator::visit(const grouping_expression& expr)
{
    expr.inner->accept(*this);
}

void evaluator::visit(const identifier& expr)
{
    // there is no variable storage, so no name is ever defined
    m_result = make_error(expr.name.line, "Undefined variable '{}'.", expr.name.lexeme);
}

void evaluator::visit(const literal& expr)
{
    m_result = expr.value;
}

void evaluator::visit(const print_statement& stmt)
{
    stmt.expr->accept(*this);
    if (m_result.is_error()) {
        return;
    }
    fmt::print(m_out, "{}\n", m_result.inspect());
    m_result = object {};
}

void evaluator::visit(const unary_expression& expr)
{
    expr.right->accept(*this);
    if (m_result.is_error()) {
        return;
    }
    using enum token_type;
    switch (expr.op.type) {
        case minus:
            if (!m_result.is<number_value>()) {
                m_result = operands_must_be_numbers(expr.op);
                return;
            }
            m_result = object {-m_result.as<number_value>()};
            return;
        case exclamation:
            m_result = object {!m_result.is_truthy()};
            return;
        default:
            m_result = make_error(expr.op.line, "unknown operator: {}", expr.op.type);
    }
}

void evaluator::visit(const var_statement& stmt)
{
    if (stmt.initializer != nullptr) {
        stmt.initializer->accept(*this);
        if (m_result.is_error()) {
            return;
        }
    }
    m_result = object {};
}
