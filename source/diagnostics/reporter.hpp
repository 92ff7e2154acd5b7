#pragma once

#include <cstddef>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include <lexer/token.hpp>
#include <object/object.hpp>

/// Collects the diagnostics of one run and writes each of them to a stream as
/// soon as it is reported.
///
/// Compile errors (lexing and parsing) and runtime errors are flagged
/// separately so a driver can pick its exit code. `reset()` clears both flags
/// between interactive prompt lines.
class reporter final
{
  public:
    explicit reporter(std::ostream& out = std::cerr);

    auto error(std::size_t line, std::string_view message) -> void;
    auto error(const token& where, std::string_view message) -> void;
    auto runtime_error(const ::error& err) -> void;

    [[nodiscard]] auto had_error() const -> bool;
    [[nodiscard]] auto had_runtime_error() const -> bool;
    [[nodiscard]] auto diagnostics() const -> const std::vector<std::string>&;

    auto reset() -> void;

  private:
    auto report(std::size_t line, std::string_view where, std::string_view message) -> void;
    auto emit(std::string diagnostic) -> void;

    std::ostream& m_out;
    std::vector<std::string> m_diagnostics;
    bool m_had_error {};
    bool m_had_runtime_error {};
};
