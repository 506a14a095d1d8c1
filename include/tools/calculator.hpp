/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <expected>
#include <iosfwd>
#include <string>
#include <string_view>

namespace gv::tools {

    enum class CalcError {
        DivisionByZero,
        InvalidExpression,
        ParseError,
        UnknownOperation
    };

    inline std::string_view to_string(CalcError error) {
        switch (error) {
        case CalcError::DivisionByZero: return "DivisionByZero";
        case CalcError::InvalidExpression: return "InvalidExpression";
        case CalcError::ParseError: return "ParseError";
        case CalcError::UnknownOperation: return "UnknownOperation";
        default: return "Unknown";
        }
    }

    struct CalcErrorInfo {
        CalcError code;
        std::string details;

        // User-facing text, e.g. "Invalid expression: abc"
        [[nodiscard]] std::string message() const;
    };

    using CalcResult = std::expected<double, CalcErrorInfo>;

    CalcResult add(double a, double b);
    CalcResult subtract(double a, double b);
    CalcResult multiply(double a, double b);
    CalcResult divide(double a, double b);
    CalcResult power(double base, double exponent);
    CalcResult square_root(double number);

    // Parses a complete decimal number; trailing characters are an error
    CalcResult parse_number(std::string_view text);

    /**
     * @brief Evaluate an expression made of numbers and + - * /
     *
     * Spaces are removed, then the expression is split at the last '+', else the last '-'
     * (a leading '-' negates the remainder), else the last '*', else the last '/'.
     * Both halves are evaluated recursively.
     */
    CalcResult evaluate_expression(std::string_view expression);

    // Formats a result the way the CLI prints numbers ("5", "2.5")
    std::string format_number(double value);

    // Read-eval-print loop; returns when input ends or on quit/exit
    void run_interactive(std::istream& in, std::ostream& out);

} // namespace gv::tools
