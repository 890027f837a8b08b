#include <gtest/gtest.h>

#include <cmath>
#include <cstring>
#include <future>
#include <limits>
#include <string>
#include <vector>

#include "expression.hpp"

using namespace veq;

class ExpressionTest : public ::testing::Test {
protected:
    static constexpr double kTolerance = 1e-9;

    static double eval(const std::string& text, double x = 0.0, double t = 0.0) {
        return parse(text).evaluate(x, t);
    }

    static bool bitIdentical(double a, double b) {
        return std::memcmp(&a, &b, sizeof(double)) == 0;
    }
};

// =============================================================================
// Precedence, as seen through evaluation
// =============================================================================

TEST_F(ExpressionTest, Power_IsRightAssociative)
{
    EXPECT_EQ(eval("2^3^2"), 512.0);
}

TEST_F(ExpressionTest, UnaryMinus_AppliesAfterPower)
{
    EXPECT_EQ(eval("-2^2"), -4.0);
    EXPECT_EQ(eval("(-2)^2"), 4.0);
    EXPECT_EQ(eval("-x^2", 3.0), -9.0);
}

TEST_F(ExpressionTest, ArithmeticLiterals_MatchDirectComputation)
{
    EXPECT_NEAR(eval("1 + 2 * 3 - 4 / 8"), 1.0 + 2.0 * 3.0 - 4.0 / 8.0, kTolerance);
    EXPECT_NEAR(eval("(1.5 + 2.5) * (3 - 0.25)"), 4.0 * 2.75, kTolerance);
    EXPECT_NEAR(eval("10 % 4 + 2^0.5"), 2.0 + std::sqrt(2.0), kTolerance);
    EXPECT_NEAR(eval("100 / 10 / 5"), 2.0, kTolerance);
    EXPECT_NEAR(eval("2 * -3"), -6.0, kTolerance);
}

// =============================================================================
// IEEE semantics
// =============================================================================

TEST_F(ExpressionTest, DivisionByZero)
{
    EXPECT_EQ(eval("1/0"), std::numeric_limits<double>::infinity());
    EXPECT_EQ(eval("-1/0"), -std::numeric_limits<double>::infinity());
    EXPECT_TRUE(std::isnan(eval("0/0")));
}

TEST_F(ExpressionTest, DomainViolation_IsNaNNotError)
{
    EXPECT_TRUE(std::isnan(eval("asin(2)")));
    EXPECT_TRUE(std::isnan(eval("log(x)", -1.0)));
    EXPECT_TRUE(std::isnan(eval("(-8)^(1/3)")));
    EXPECT_TRUE(std::isnan(eval("asin(2) + 1")));
}

TEST_F(ExpressionTest, Constants)
{
    EXPECT_NEAR(eval("sin(pi/2)"), 1.0, kTolerance);
    EXPECT_NEAR(eval("log(e)"), 1.0, kTolerance);
    EXPECT_EQ(eval("g"), 9.81);
}

TEST_F(ExpressionTest, Variables_AreBoundPerCall)
{
    auto expression = parse("x * 10 + t");
    EXPECT_EQ(expression.evaluate(1.0, 2.0), 12.0);
    EXPECT_EQ(expression.evaluate(Bindings{3.0, 4.0}), 34.0);
}

TEST_F(ExpressionTest, CaseInsensitive)
{
    EXPECT_NEAR(eval("SIN(PI/2) + X", 1.0), 2.0, kTolerance);
}

TEST_F(ExpressionTest, TextIsKept)
{
    auto expression = parse("sin(x) * t");
    EXPECT_EQ(expression.text(), "sin(x) * t");
    EXPECT_EQ(toString(expression.root()), "(sin(x) * t)");
}

// =============================================================================
// Errors
// =============================================================================

TEST_F(ExpressionTest, MissingParen_IsParseError)
{
    try {
        parse("(1+2");
        FAIL() << "expected ParseError";
    }
    catch (const ParseError& error) {
        EXPECT_EQ(error.position(), 4u);
        EXPECT_EQ(error.expected(), ")");
    }
}

TEST_F(ExpressionTest, UnknownIdentifier_IsParseError)
{
    try {
        parse("q");
        FAIL() << "expected ParseError";
    }
    catch (const ParseError& error) {
        EXPECT_EQ(error.position(), 0u);
        EXPECT_STREQ(error.what(), "unknown identifier");
    }
}

TEST_F(ExpressionTest, LexError_PropagatesFromParse)
{
    EXPECT_THROW(parse("x # 2"), LexError);
}

TEST_F(ExpressionTest, DeepNesting_IsBoundedParseError)
{
    std::string text = std::string(300, '(') + "x" + std::string(300, ')');
    EXPECT_THROW(parse(text), ParseError);
}

TEST_F(ExpressionTest, Diagnostic_PointsAtColumn)
{
    try {
        parse("x + q");
        FAIL() << "expected ParseError";
    }
    catch (const SyntaxError& error) {
        EXPECT_EQ(formatDiagnostic("x + q", error),
                  "column 4: unknown identifier\n  x + q\n      ^");
    }
}

// =============================================================================
// Determinism and sharing
// =============================================================================

TEST_F(ExpressionTest, RepeatedEvaluation_IsBitIdentical)
{
    auto expression = parse("sin(x * t) / (x - 1) + atanh(x / 3) ^ 2 % 0.7");
    for (double x = -2.0; x <= 2.0; x += 0.125) {
        double first = expression.evaluate(x, 1.3);
        double second = expression.evaluate(x, 1.3);
        EXPECT_TRUE(bitIdentical(first, second)) << "x = " << x;
    }
}

TEST_F(ExpressionTest, SharedAcrossThreads_MatchesSequential)
{
    const auto expression = parse("sin(x) * cos(t) + x^2 / (1 + abs(t))");

    std::vector<double> expected;
    for (int i = 0; i < 1000; ++i) {
        expected.push_back(expression.evaluate(i * 0.01, 0.5));
    }

    std::vector<std::future<std::vector<double>>> futures;
    for (int thread = 0; thread < 4; ++thread) {
        futures.push_back(std::async(std::launch::async, [&expression]() {
            std::vector<double> values;
            for (int i = 0; i < 1000; ++i) {
                values.push_back(expression.evaluate(i * 0.01, 0.5));
            }
            return values;
        }));
    }

    for (auto& future : futures) {
        auto values = future.get();
        ASSERT_EQ(values.size(), expected.size());
        for (std::size_t i = 0; i < values.size(); ++i) {
            EXPECT_TRUE(bitIdentical(values[i], expected[i]));
        }
    }
}

TEST_F(ExpressionTest, MovedExpression_StillEvaluates)
{
    auto first = parse("x + 1");
    Expression second = std::move(first);
    EXPECT_EQ(second.evaluate(1.0, 0.0), 2.0);
}
