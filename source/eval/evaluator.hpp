#pragma once

#include <iostream>
#include <ostream>

#include <ast/expression.hpp>
#include <ast/program.hpp>
#include <ast/statements.hpp>
#include <ast/visitor.hpp>
#include <object/object.hpp>

class reporter;

/// Tree-walking evaluator.
///
/// Every rule leaves its outcome in m_result. Runtime errors are error
/// objects that each rule passes through unchanged, `interpret` reports the
/// first one and stops executing the program.
struct evaluator final : visitor
{
    explicit evaluator(reporter& rep, std::ostream& out = std::cout);

    auto evaluate(const expression& expr) -> object;
    auto execute(const statement& stmt) -> object;
    auto interpret(const program& prgrm) -> void;

  protected:
    void visit(const binary_expression& expr) final;
    void visit(const expression_statement& stmt) final;
    void visit(const grouping_expression& expr) final;
    void visit(const identifier& expr) final;
    void visit(const literal& expr) final;
    void visit(const print_statement& stmt) final;
    void visit(const unary_expression& expr) final;
    void visit(const var_statement& stmt) final;

  private:
    object m_result {};
    reporter& m_reporter;
    std::ostream& m_out;
};
