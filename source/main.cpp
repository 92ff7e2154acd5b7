#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <iostream>
#include <iterator>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <diagnostics/reporter.hpp>
#include <eval/evaluator.hpp>
#include <fmt/format.h>
#include <fmt/ostream.h>
#include <lexer/lexer.hpp>
#include <lexer/token.hpp>
#include <parser/parser.hpp>

namespace
{
constexpr auto prompt = "> ";

// sysexits.h
enum exit_code : std::uint8_t
{
    ok = 0,
    usage = 64,
    data_error = 65,
    no_input = 66,
    software = 70,
};

struct command_line_args
{
    bool help {};
    bool debug {};
    std::string_view file;
};

auto show_usage(std::string_view program_name, std::string_view error_msg = {}) -> int
{
    auto code = static_cast<int>(ok);
    if (!error_msg.empty()) {
        fmt::print(std::cerr, "Error: {}\n", error_msg);
        code = usage;
    }
    fmt::print("Usage: {} [-d] [-h] [<file>]\n\n", program_name);
    return code;
}

auto parse_command_line(int argc, char** argv, std::string& error_msg) -> command_line_args
{
    command_line_args opts {};
    for (std::string_view arg : std::span(argv, static_cast<size_t>(argc))) {
        if (arg.size() > 1 && arg[0] == '-') {
            switch (arg[1]) {
                case 'h':
                    opts.help = true;
                    break;
                case 'd':
                    opts.debug = true;
                    break;
                default:
                    error_msg = fmt::format("invalid option {}", arg);
                    return opts;
            }
        } else {
            if (!opts.file.empty()) {
                error_msg = fmt::format("unexpected argument {}, already have file {}", arg, opts.file);
                return opts;
            }
            opts.file = arg;
        }
    }
    return opts;
}

void debug_dump(const std::vector<token>& tokens, const program& prgrm)
{
    std::cout << "Tokens:\n";
    for (const auto& tkn : tokens) {
        fmt::print("  {}\n", tkn);
    }
    std::cout << "Program:\n  " << prgrm.string() << '\n';
}

auto run(std::string_view source, reporter& rep, evaluator& eval, bool debug) -> void
{
    auto lxr = lexer {source, rep};
    auto tokens = lxr.scan_tokens();
    auto prsr = parser {tokens, rep};
    auto prgrm = prsr.parse_program();
    if (debug) {
        debug_dump(tokens, *prgrm);
    }
    if (rep.had_error()) {
        return;
    }
    eval.interpret(*prgrm);
}

auto run_file(const command_line_args& opts) -> int
{
    std::ifstream ifs(std::string {opts.file});
    if (!ifs) {
        fmt::print(std::cerr, "ERROR: could not open file: {}\n", opts.file);
        return no_input;
    }
    const std::string contents {(std::istreambuf_iterator<char>(ifs)), (std::istreambuf_iterator<char>())};
    auto rep = reporter {};
    auto eval = evaluator {rep};
    run(contents, rep, eval, opts.debug);
    if (rep.had_error()) {
        return data_error;
    }
    if (rep.had_runtime_error()) {
        return software;
    }
    return ok;
}

auto run_prompt(const command_line_args& opts) -> int
{
    auto rep = reporter {};
    auto eval = evaluator {rep};
    auto show_prompt = []() { std::cout << prompt << std::flush; };
    auto input = std::string {};
    show_prompt();
    while (getline(std::cin, input)) {
        run(input, rep, eval, opts.debug);
        rep.reset();
        show_prompt();
    }
    return ok;
}
}  // namespace

auto main(int argc, char* argv[]) -> int
{
    auto program_name = std::string_view(*argv);
    auto error_msg = std::string {};
    auto opts = parse_command_line(argc - 1, ++argv, error_msg);
    if (!error_msg.empty()) {
        return show_usage(program_name, error_msg);
    }
    if (opts.help) {
        return show_usage(program_name);
    }
    try {
        if (!opts.file.empty()) {
            return run_file(opts);
        }
        return run_prompt(opts);
    } catch (const std::exception& e) {
        fmt::print(std::cerr, "Caught an exception: {}\n", e.what());
        return software;
    }
}
