#include "tools/calculator.hpp"

#include <cmath>
#include <gtest/gtest.h>
#include <limits>
#include <sstream>

using namespace gv::tools;

TEST(CalculatorTest, BasicOperations) {
    EXPECT_EQ(*add(2.0, 3.0), 5.0);
    EXPECT_EQ(*subtract(5.0, 3.0), 2.0);
    EXPECT_EQ(*multiply(4.0, 3.0), 12.0);
    EXPECT_EQ(*divide(10.0, 2.0), 5.0);
}

TEST(CalculatorTest, DivisionByZero) {
    auto result = divide(5.0, 0.0);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, CalcError::DivisionByZero);
    EXPECT_EQ(result.error().message(), "Division by zero");
}

TEST(CalculatorTest, OverflowIsInvalidExpression) {
    const double big = std::numeric_limits<double>::max();
    auto result = multiply(big, 10.0);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().message(), "Invalid expression: Result overflow");
    EXPECT_FALSE(add(big, big));
}

TEST(CalculatorTest, SquareRoot) {
    EXPECT_EQ(*square_root(16.0), 4.0);
    EXPECT_EQ(*square_root(9.0), 3.0);
    EXPECT_FALSE(square_root(-1.0));
}

TEST(CalculatorTest, Power) {
    EXPECT_EQ(*power(2.0, 3.0), 8.0);
    EXPECT_EQ(*power(5.0, 2.0), 25.0);
    EXPECT_EQ(*power(-2.0, 3.0), -8.0);
    EXPECT_FALSE(power(-2.0, 0.5));
    EXPECT_FALSE(power(10.0, 400.0));
}

TEST(CalculatorTest, ExpressionEvaluation) {
    EXPECT_EQ(*evaluate_expression("2 + 3"), 5.0);
    EXPECT_EQ(*evaluate_expression("10 - 4"), 6.0);
    EXPECT_EQ(*evaluate_expression("3 * 4"), 12.0);
    EXPECT_EQ(*evaluate_expression("15 / 3"), 5.0);
    EXPECT_EQ(*evaluate_expression("2 + 3 * 4"), 14.0);
}

TEST(CalculatorTest, SplitsAtLastOperator) {
    // Same-precedence chains associate to the left
    EXPECT_EQ(*evaluate_expression("10 - 4 - 3"), 3.0);
    EXPECT_EQ(*evaluate_expression("100 / 10 / 2"), 5.0);
}

TEST(CalculatorTest, NegativeNumbers) {
    EXPECT_EQ(*evaluate_expression("-5"), -5.0);
    EXPECT_EQ(*evaluate_expression("-5 + 3"), -2.0);
}

TEST(CalculatorTest, ErrorCases) {
    auto by_zero = evaluate_expression("5 / 0");
    ASSERT_FALSE(by_zero);
    EXPECT_EQ(by_zero.error().code, CalcError::DivisionByZero);

    auto letters = evaluate_expression("abc");
    ASSERT_FALSE(letters);
    EXPECT_EQ(letters.error().message(), "Invalid expression: abc");

    EXPECT_FALSE(evaluate_expression(""));
    EXPECT_FALSE(evaluate_expression("2 +"));
}

TEST(CalculatorTest, ParseNumberRequiresWholeInput) {
    EXPECT_EQ(*parse_number("2.5"), 2.5);
    auto trailing = parse_number("2.5x");
    ASSERT_FALSE(trailing);
    EXPECT_EQ(trailing.error().code, CalcError::ParseError);
}

TEST(CalculatorTest, NumbersPrintWithoutTrailingZeros) {
    EXPECT_EQ(format_number(5.0), "5");
    EXPECT_EQ(format_number(2.5), "2.5");
    EXPECT_EQ(format_number(-3.0), "-3");
}

TEST(CalculatorTest, UnknownOperationMessage) {
    EXPECT_EQ((CalcErrorInfo{CalcError::UnknownOperation, "modulo"}.message()), "Unknown operation: modulo");
}

TEST(CalculatorInteractiveTest, EvaluatesLinesUntilQuit) {
    std::istringstream in("2 + 3\n\nsqrt 16\nsqrt -4\nsqrt x\n5 / 0\nquit\n1 + 1\n");
    std::ostringstream out;

    run_interactive(in, out);

    const std::string text = out.str();
    EXPECT_NE(text.find("calc> "), std::string::npos);
    EXPECT_NE(text.find("2 + 3 = 5\n"), std::string::npos);
    EXPECT_NE(text.find("√16 = 4\n"), std::string::npos);
    EXPECT_NE(text.find("Error: Invalid expression: Cannot calculate square root of negative number\n"), std::string::npos);
    EXPECT_NE(text.find("Error: Invalid number format\n"), std::string::npos);
    EXPECT_NE(text.find("Error: Division by zero\n"), std::string::npos);
    EXPECT_NE(text.find("Goodbye!"), std::string::npos);
    // Nothing after quit is evaluated
    EXPECT_EQ(text.find("1 + 1 ="), std::string::npos);
}

TEST(CalculatorInteractiveTest, HelpAndEndOfInput) {
    std::istringstream in("help\n");
    std::ostringstream out;

    run_interactive(in, out);

    EXPECT_NE(out.str().find("Available operations:"), std::string::npos);
    EXPECT_EQ(out.str().find("Goodbye!"), std::string::npos);
}
