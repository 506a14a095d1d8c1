/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/logger.hpp"
#include "tools/calculator.hpp"
#include <args.hxx>
#include <algorithm>
#include <array>
#include <expected>
#include <format>
#include <functional>
#include <iostream>
#include <optional>
#include <print>
#include <string>

namespace {

    using gv::tools::CalcErrorInfo;
    using gv::tools::format_number;

    // A command produces either the line to print or an error
    using Outcome = std::expected<std::string, CalcErrorInfo>;

    constexpr std::array<std::string_view, 8> COMMANDS = {
        "add", "subtract", "multiply", "divide", "power", "sqrt", "eval", "interactive"};

    std::expected<double, CalcErrorInfo> number_arg(::args::Positional<std::string>& arg) {
        return gv::tools::parse_number(::args::get(arg));
    }

    // Binary command: parses both operands and formats "<a> <symbol> <b> = <result>"
    Outcome run_binary(::args::Positional<std::string>& a_arg, ::args::Positional<std::string>& b_arg,
                       std::string_view symbol,
                       const std::function<gv::tools::CalcResult(double, double)>& op) {
        auto a = number_arg(a_arg);
        if (!a)
            return std::unexpected(a.error());
        auto b = number_arg(b_arg);
        if (!b)
            return std::unexpected(b.error());
        auto result = op(*a, *b);
        if (!result)
            return std::unexpected(result.error());
        return std::format("{}{}{} = {}", format_number(*a), symbol, format_number(*b), format_number(*result));
    }

    void binary_command(::args::Subparser& sub, std::optional<Outcome>& outcome,
                        std::string_view first, std::string_view second, std::string_view symbol,
                        const std::function<gv::tools::CalcResult(double, double)>& op) {
        ::args::Positional<std::string> a(sub, std::string(first), "First operand", ::args::Options::Required);
        ::args::Positional<std::string> b(sub, std::string(second), "Second operand", ::args::Options::Required);
        sub.Parse();
        outcome = run_binary(a, b, symbol, op);
    }

    void print_usage_examples() {
        std::println("No command provided. Use --help for usage information.");
        std::println("Quick examples:");
        std::println("  calc_cli add 10 5");
        std::println("  calc_cli eval \"2 + 3 * 4\"");
        std::println("  calc_cli interactive");
    }

} // namespace

int main(int argc, char* argv[]) {
    gv::core::Logger::get().init(gv::core::LogLevel::Warn);

    // Reject unknown operations before args.hxx sees them
    if (argc > 1 && argv[1][0] != '-') {
        const std::string_view requested = argv[1];
        if (std::ranges::find(COMMANDS, requested) == COMMANDS.end()) {
            const CalcErrorInfo unknown{gv::tools::CalcError::UnknownOperation, std::string(requested)};
            std::println(stderr, "Error: {}", unknown.message());
            return 1;
        }
    }

    std::optional<Outcome> outcome;
    bool interactive = false;

    ::args::ArgumentParser parser("calc_cli: A simple calculator CLI tool",
                                  "Negative operands go after '--', e.g. calc_cli add -- -5 3");
    parser.RequireCommand(false);
    ::args::Group commands(parser, "commands");

    ::args::Command add_cmd(commands, "add", "Add two numbers", [&](::args::Subparser& sub) {
        binary_command(sub, outcome, "a", "b", " + ", gv::tools::add);
    });
    ::args::Command subtract_cmd(commands, "subtract", "Subtract two numbers", [&](::args::Subparser& sub) {
        binary_command(sub, outcome, "a", "b", " - ", gv::tools::subtract);
    });
    ::args::Command multiply_cmd(commands, "multiply", "Multiply two numbers", [&](::args::Subparser& sub) {
        binary_command(sub, outcome, "a", "b", " * ", gv::tools::multiply);
    });
    ::args::Command divide_cmd(commands, "divide", "Divide two numbers", [&](::args::Subparser& sub) {
        binary_command(sub, outcome, "dividend", "divisor", " / ", gv::tools::divide);
    });
    ::args::Command power_cmd(commands, "power", "Calculate power (base^exp)", [&](::args::Subparser& sub) {
        binary_command(sub, outcome, "base", "exp", "^", gv::tools::power);
    });
    ::args::Command sqrt_cmd(commands, "sqrt", "Calculate square root", [&](::args::Subparser& sub) {
        ::args::Positional<std::string> number(sub, "number", "Number to calculate square root", ::args::Options::Required);
        sub.Parse();
        auto value = number_arg(number);
        if (!value) {
            outcome = std::unexpected(value.error());
            return;
        }
        auto result = gv::tools::square_root(*value);
        if (!result) {
            outcome = std::unexpected(result.error());
            return;
        }
        outcome = std::format("√{} = {}", format_number(*value), format_number(*result));
    });
    ::args::Command eval_cmd(commands, "eval", "Evaluate mathematical expression", [&](::args::Subparser& sub) {
        ::args::Positional<std::string> expression(sub, "expression", "Mathematical expression (e.g. \"2 + 3 * 4\")",
                                                   ::args::Options::Required);
        sub.Parse();
        const auto& expr = ::args::get(expression);
        auto result = gv::tools::evaluate_expression(expr);
        if (!result) {
            outcome = std::unexpected(result.error());
            return;
        }
        outcome = std::format("{} = {}", expr, format_number(*result));
    });
    ::args::Command interactive_cmd(commands, "interactive", "Interactive mode", [&](::args::Subparser& sub) {
        sub.Parse();
        interactive = true;
    });

    ::args::Group options(parser, "options");
    ::args::HelpFlag help(options, "help", "Display help menu", {'h', "help"});

    try {
        parser.ParseCLI(argc, argv);
    } catch (const ::args::Help&) {
        std::print("{}", parser.Help());
        return 0;
    } catch (const ::args::Error& e) {
        std::println(stderr, "Error: {}", e.what());
        std::print(stderr, "{}", parser.Help());
        return 1;
    }

    if (interactive) {
        gv::tools::run_interactive(std::cin, std::cout);
        return 0;
    }

    if (!outcome) {
        print_usage_examples();
        return 0;
    }

    if (!*outcome) {
        LOG_DEBUG("Calculation failed: {}", gv::tools::to_string(outcome->error().code));
        std::println(stderr, "Error: {}", outcome->error().message());
        return 1;
    }

    std::println("{}", **outcome);
    return 0;
}
