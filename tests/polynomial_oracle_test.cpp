#include "polynomial_oracle.hpp"
#include "test_utils.hpp"
#include "units.hpp"
#include <cmath>
#include <gtest/gtest.h>
#include <vector>

using namespace branch_eqs;
using namespace branch_eqs::test_utils;

namespace {

Relation
rel(const Expression &lhs, const Expression &rhs) {
    return Relation{ lhs, rhs, "test" };
}

} // namespace

class PolynomialOracleTest : public ::testing::Test {
  protected:
    PolynomialOracle oracle;
    Expression X{ x };
    Expression Y{ y };
};

TEST_F(PolynomialOracleTest, SimplifyAndFreeVariables) {
    EXPECT_EQ(oracle.name(), "PolynomialOracle");

    EXPECT_TRUE(oracle.simplify(X - X).is_zero());
    EXPECT_EQ(oracle.simplify(2.0 * X / 2.0), X);
    EXPECT_EQ(oracle.simplify(X * Y / Y), X);

    std::set<Variable> const expected = { x, y };
    EXPECT_EQ(oracle.free_variables(X * units::m + Y / units::s), expected);
    EXPECT_TRUE(oracle.free_variables(3.0 * units::kg).empty());
}

TEST_F(PolynomialOracleTest, LinearSystem) {
    // x + y = 3, x - y = 1
    SolutionSet const result = oracle.solve({ rel(X + Y, 3.0), rel(X - Y, 1.0) }, { x, y });
    ASSERT_EQ(result.kind, SolutionKind::Solved);
    ASSERT_EQ(result.solutions.size(), 1);
    EXPECT_EXPR_NEAR(result.solutions[0].at(x), 2.0);
    EXPECT_EXPR_NEAR(result.solutions[0].at(y), 1.0);
}

TEST_F(PolynomialOracleTest, UnderdeterminedLinearSystemIsParametric) {
    // x + y = 3 leaves x in terms of y
    SolutionSet const result = oracle.solve({ rel(X + Y, 3.0) }, { x, y });
    ASSERT_EQ(result.kind, SolutionKind::Solved);
    ASSERT_EQ(result.solutions.size(), 1);
    ASSERT_EQ(result.solutions[0].size(), 1);

    auto const entry = *result.solutions[0].begin();
    Variable const other = entry.first == x ? y : x;
    std::set<Variable> const expected = { other };
    EXPECT_EQ(oracle.free_variables(entry.second), expected);
    EXPECT_TRUE(oracle.simplify(entry.second + Expression(other) - 3.0).is_zero());
}

TEST_F(PolynomialOracleTest, InconsistentLinearSystem) {
    SolutionSet const result = oracle.solve({ rel(X + Y, 1.0), rel(X + Y, 2.0) }, { x, y });
    EXPECT_EQ(result.kind, SolutionKind::NoSolution);
    EXPECT_TRUE(result.solutions.empty());
}

TEST_F(PolynomialOracleTest, LinearWithUnits) {
    // x * 2 s = 10 m
    SolutionSet const result = oracle.solve({ rel(X * (2.0 * units::s), 10.0 * units::m) }, { x });
    ASSERT_EQ(result.kind, SolutionKind::Solved);
    ASSERT_EQ(result.solutions.size(), 1);
    EXPECT_EXPR_NEAR(result.solutions[0].at(x), 5.0, units::m / units::s);
}

TEST_F(PolynomialOracleTest, QuadraticGivesEveryRealRoot) {
    SolutionSet const result = oracle.solve({ rel(pow(X, 2), 4.0) }, { x });
    ASSERT_EQ(result.kind, SolutionKind::Solved);
    ASSERT_EQ(result.solutions.size(), 2);
    EXPECT_EXPR_NEAR(result.solutions[0].at(x), -2.0);
    EXPECT_EXPR_NEAR(result.solutions[1].at(x), 2.0);
}

TEST_F(PolynomialOracleTest, QuadraticWithoutRealRoots) {
    EXPECT_EQ(oracle.solve({ rel(pow(X, 2), -4.0) }, { x }).kind, SolutionKind::NoSolution);
    // x^2 + x + 1 has only complex roots
    EXPECT_EQ(oracle.solve({ rel(pow(X, 2) + X + 1.0, 0.0) }, { x }).kind, SolutionKind::NoSolution);
}

TEST_F(PolynomialOracleTest, OddPowerHasOneRealRoot) {
    SolutionSet const result = oracle.solve({ rel(pow(X, 3), -8.0) }, { x });
    ASSERT_EQ(result.kind, SolutionKind::Solved);
    ASSERT_EQ(result.solutions.size(), 1);
    EXPECT_EXPR_NEAR(result.solutions[0].at(x), -2.0);
}

TEST_F(PolynomialOracleTest, PowerWithUnits) {
    // x^2 = 4 m^2
    SolutionSet const result = oracle.solve({ rel(pow(X, 2), 4.0 * units::m * units::m) }, { x });
    ASSERT_EQ(result.kind, SolutionKind::Solved);
    ASSERT_EQ(result.solutions.size(), 2);
    EXPECT_EXPR_NEAR(result.solutions[0].at(x), -2.0, units::m);
    EXPECT_EXPR_NEAR(result.solutions[1].at(x), 2.0, units::m);

    // t^2 = 40 m / g0 is only a perfect square once rewritten in base units
    SolutionSet const fall = oracle.solve({ rel(units::standard_gravity * pow(X, 2) / 2.0, 20.0 * units::m) }, { x });
    ASSERT_EQ(fall.kind, SolutionKind::Solved);
    ASSERT_EQ(fall.solutions.size(), 2);
    EXPECT_EXPR_NEAR(fall.solutions[1].at(x), std::sqrt(40.0 / 9.80665), units::s, 1e-9);
}

TEST_F(PolynomialOracleTest, NonlinearSystemByElimination) {
    // x*y = 6, x + y = 5
    SolutionSet const result = oracle.solve({ rel(X * Y, 6.0), rel(X + Y, 5.0) }, { x, y });
    ASSERT_EQ(result.kind, SolutionKind::Solved);
    ASSERT_EQ(result.solutions.size(), 2);
    for (const auto &solution : result.solutions) {
        double const xv = solution.at(x).constant_value();
        double const yv = solution.at(y).constant_value();
        EXPECT_NEAR(xv * yv, 6.0, 1e-9);
        EXPECT_NEAR(xv + yv, 5.0, 1e-9);
    }
    EXPECT_GT(std::abs(result.solutions[0].at(x).constant_value() - result.solutions[1].at(x).constant_value()), 0.5);
}

TEST_F(PolynomialOracleTest, NewtonFallbackForCoupledQuadratics) {
    // x^2 + y^2 = 25, x^2 - y^2 = 7 has the solutions (+-4, +-3)
    SolutionSet const result =
      oracle.solve({ rel(pow(X, 2) + pow(Y, 2), 25.0), rel(pow(X, 2) - pow(Y, 2), 7.0) }, { x, y });
    ASSERT_EQ(result.kind, SolutionKind::Solved);
    ASSERT_FALSE(result.solutions.empty());
    for (const auto &solution : result.solutions) {
        EXPECT_NEAR(std::abs(solution.at(x).constant_value()), 4.0, 1e-8);
        EXPECT_NEAR(std::abs(solution.at(y).constant_value()), 3.0, 1e-8);
    }
}

TEST_F(PolynomialOracleTest, IndeterminateCases) {
    // No unknowns requested
    EXPECT_EQ(oracle.solve({ rel(X, 1.0) }, {}).kind, SolutionKind::Indeterminate);
    // Only identities
    EXPECT_EQ(oracle.solve({ rel(X, X) }, { x }).kind, SolutionKind::Indeterminate);
    // x^2 = p with p an undeclared symbol
    Variable const p("p");
    EXPECT_EQ(oracle.solve({ rel(pow(X, 2), Expression(p)) }, { x }).kind, SolutionKind::Indeterminate);
}

TEST_F(PolynomialOracleTest, ConstantContradictionWithinSubset) {
    // x = 2 together with x^2 = 9 is inconsistent
    SolutionSet const result = oracle.solve({ rel(X, 2.0), rel(pow(X, 2), 9.0) }, { x });
    EXPECT_EQ(result.kind, SolutionKind::NoSolution);
}

TEST_F(PolynomialOracleTest, OptionsAreKept) {
    OracleOptions options;
    options.newton_starts = 3;
    options.residual_tolerance = 1e-6;
    PolynomialOracle const custom(options);
    EXPECT_EQ(custom.options().newton_starts, 3);
    EXPECT_DOUBLE_EQ(custom.options().residual_tolerance, 1e-6);
}
