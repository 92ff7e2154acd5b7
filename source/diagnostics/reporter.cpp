#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

#include "reporter.hpp"

#include <fmt/format.h>
#include <fmt/ostream.h>

reporter::reporter(std::ostream& out)
    : m_out {out}
{
}

auto reporter::error(std::size_t line, std::string_view message) -> void
{
    report(line, "", message);
}

auto reporter::error(const token& where, std::string_view message) -> void
{
    if (where.type == token_type::eof) {
        report(where.line, " at end", message);
        return;
    }
    report(where.line, fmt::format(" at '{}'", where.lexeme), message);
}

auto reporter::runtime_error(const ::error& err) -> void
{
    emit(fmt::format("{} [line {}]", err.message, err.line));
    m_had_runtime_error = true;
}

auto reporter::had_error() const -> bool
{
    return m_had_error;
}

auto reporter::had_runtime_error() const -> bool
{
    return m_had_runtime_error;
}

auto reporter::diagnostics() const -> const std::vector<std::string>&
{
    return m_diagnostics;
}

auto reporter::reset() -> void
{
    m_had_error = false;
    m_had_runtime_error = false;
    m_diagnostics.clear();
}

auto reporter::report(std::size_t line, std::string_view where, std::string_view message) -> void
{
    emit(fmt::format("[line {}] Error{}: {}", line, where, message));
    m_had_error = true;
}

auto reporter::emit(std::string diagnostic) -> void
{
    fmt::print(m_out, "{}\n", diagnostic);
    m_diagnostics.push_back(std::move(diagnostic));
}
