/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "tools/calculator.hpp"
#include "core/logger.hpp"
#include <charconv>
#include <cmath>
#include <format>
#include <istream>
#include <ostream>
#include <print>

namespace gv::tools {

    namespace {
        CalcResult fail(CalcError code, std::string details = {}) {
            return std::unexpected(CalcErrorInfo{code, std::move(details)});
        }

        CalcResult checked(double result, std::string_view overflow_message = "Result overflow") {
            if (std::isinf(result) || std::isnan(result)) {
                return fail(CalcError::InvalidExpression, std::string(overflow_message));
            }
            return result;
        }

        std::string_view trim(std::string_view text) {
            constexpr std::string_view whitespace = " \t\r\n\v\f";
            const auto first = text.find_first_not_of(whitespace);
            if (first == std::string_view::npos)
                return {};
            const auto last = text.find_last_not_of(whitespace);
            return text.substr(first, last - first + 1);
        }

        // Applies a binary operation to both halves around position pos
        template <typename Op>
        CalcResult split_and_apply(std::string_view expr, size_t pos, Op op) {
            auto left = evaluate_expression(expr.substr(0, pos));
            if (!left)
                return left;
            auto right = evaluate_expression(expr.substr(pos + 1));
            if (!right)
                return right;
            return op(*left, *right);
        }

        void print_help(std::ostream& out) {
            std::println(out, "Available operations:");
            std::println(out, "  Basic: +, -, *, /");
            std::println(out, "  Special: sqrt <number>");
            std::println(out, "  Commands: help, quit, exit");
            std::println(out, "Examples:");
            std::println(out, "  2 + 3");
            std::println(out, "  10 / 2");
            std::println(out, "  sqrt 16");
            std::println(out, "  -5 + 3");
        }
    } // namespace

    std::string CalcErrorInfo::message() const {
        switch (code) {
        case CalcError::DivisionByZero: return "Division by zero";
        case CalcError::InvalidExpression: return std::format("Invalid expression: {}", details);
        case CalcError::ParseError: return std::format("Number parsing error: {}", details);
        case CalcError::UnknownOperation: return std::format("Unknown operation: {}", details);
        default: return details;
        }
    }

    CalcResult add(double a, double b) {
        return checked(a + b);
    }

    CalcResult subtract(double a, double b) {
        return checked(a - b);
    }

    CalcResult multiply(double a, double b) {
        return checked(a * b);
    }

    CalcResult divide(double a, double b) {
        if (b == 0.0) {
            return fail(CalcError::DivisionByZero);
        }
        return checked(a / b);
    }

    CalcResult power(double base, double exponent) {
        if (base < 0.0 && std::trunc(exponent) != exponent) {
            return fail(CalcError::InvalidExpression, "Cannot calculate non-integer power of negative number");
        }
        return checked(std::pow(base, exponent), "Result overflow or invalid");
    }

    CalcResult square_root(double number) {
        if (number < 0.0) {
            return fail(CalcError::InvalidExpression, "Cannot calculate square root of negative number");
        }
        return std::sqrt(number);
    }

    CalcResult parse_number(std::string_view text) {
        double value = 0.0;
        const char* end = text.data() + text.size();
        auto [ptr, ec] = std::from_chars(text.data(), end, value);
        if (text.empty() || ec != std::errc{} || ptr != end) {
            return fail(CalcError::ParseError, std::format("invalid float literal '{}'", text));
        }
        return value;
    }

    CalcResult evaluate_expression(std::string_view expression) {
        std::string expr;
        expr.reserve(expression.size());
        for (char c : expression) {
            if (c != ' ')
                expr.push_back(c);
        }
        const std::string_view view = expr;

        if (auto pos = view.rfind('+'); pos != std::string_view::npos) {
            return split_and_apply(view, pos, add);
        }
        if (auto pos = view.rfind('-'); pos != std::string_view::npos) {
            if (pos == 0) {
                auto operand = evaluate_expression(view.substr(1));
                if (!operand)
                    return operand;
                return -*operand;
            }
            return split_and_apply(view, pos, subtract);
        }
        if (auto pos = view.rfind('*'); pos != std::string_view::npos) {
            return split_and_apply(view, pos, multiply);
        }
        if (auto pos = view.rfind('/'); pos != std::string_view::npos) {
            return split_and_apply(view, pos, divide);
        }

        auto number = parse_number(view);
        if (!number) {
            LOG_DEBUG("Operand '{}' is not a number", view);
            return fail(CalcError::InvalidExpression, expr);
        }
        return number;
    }

    std::string format_number(double value) {
        return std::format("{}", value);
    }

    void run_interactive(std::istream& in, std::ostream& out) {
        std::println(out, "Calculator Interactive Mode");
        std::println(out, "Enter mathematical expressions or 'quit' to exit");
        std::println(out, "Examples: 2 + 3, 10 / 2, sqrt 16");

        std::string line;
        while (true) {
            std::print(out, "calc> ");
            out.flush();

            if (!std::getline(in, line)) {
                LOG_DEBUG("Input closed, leaving interactive mode");
                break;
            }

            const std::string_view input = trim(line);
            if (input.empty())
                continue;

            if (input == "quit" || input == "exit") {
                std::println(out, "Goodbye!");
                break;
            }

            if (input == "help") {
                print_help(out);
                continue;
            }

            if (input.starts_with("sqrt ")) {
                auto number = parse_number(input.substr(5));
                if (!number) {
                    std::println(out, "Error: Invalid number format");
                    continue;
                }
                if (auto result = square_root(*number)) {
                    std::println(out, "√{} = {}", format_number(*number), format_number(*result));
                } else {
                    std::println(out, "Error: {}", result.error().message());
                }
                continue;
            }

            if (auto result = evaluate_expression(input)) {
                std::println(out, "{} = {}", input, format_number(*result));
            } else {
                std::println(out, "Error: {}", result.error().message());
            }
        }
    }

} // namespace gv::tools
