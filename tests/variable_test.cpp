#include "polynomial.hpp" // Includes Variable definition
#include "rational_function_operators.hpp"
#include "test_utils.hpp"
#include "variable_operators.hpp"
#include <gtest/gtest.h>
#include <set> // For testing comparison operators in a set
#include <sstream>

using namespace branch_eqs;
using namespace branch_eqs::test_utils;

TEST(VariableTest, ConstructorAndAttributes) {
    Variable const v1; // Default
    EXPECT_EQ(v1.name, "");
    EXPECT_FALSE(v1.is_unit);

    Variable const v2("x");
    EXPECT_EQ(v2.name, "x");
    EXPECT_FALSE(v2.is_unit);

    Variable const v3("m", true);
    EXPECT_EQ(v3.name, "m");
    EXPECT_TRUE(v3.is_unit);
}

TEST(VariableTest, EqualityOperator) {
    Variable const x1("x");
    Variable const x2("x", false);
    Variable const y1("y");
    Variable const x_unit("x", true);

    EXPECT_TRUE(x1 == x2);
    EXPECT_FALSE(x1 == y1);     // Different name
    EXPECT_FALSE(x1 == x_unit); // An unknown never equals a unit tag of the same name
    EXPECT_TRUE(x1 != x_unit);
}

TEST(VariableTest, LessThanOperator) {
    Variable const a("a");
    Variable const b("b");
    Variable const b_unit("b", true);

    // Primary sort by name
    EXPECT_TRUE(a < b);
    EXPECT_FALSE(b < a);

    // Secondary sort by is_unit (false < true)
    EXPECT_TRUE(b < b_unit);
    EXPECT_FALSE(b_unit < b);

    std::set<Variable> var_set;
    var_set.insert(b_unit);
    var_set.insert(a);
    var_set.insert(b);
    var_set.insert(Variable("a")); // Duplicate

    ASSERT_EQ(var_set.size(), 3);
    auto it = var_set.begin();
    EXPECT_EQ(*it++, a);
    EXPECT_EQ(*it++, b);
    EXPECT_EQ(*it++, b_unit);
}

TEST(VariableTest, StreamOutput) {
    std::stringstream ss;
    ss << Variable("speed");
    EXPECT_EQ(ss.str(), "speed");

    ss.str("");
    ss << Variable("kg", true);
    EXPECT_EQ(ss.str(), "kg");
}

TEST(VariableOperatorsTest, BuildPolynomials) {
    EXPECT_POLY_EQ(x + y, Polynomial<double>({ Monomial<double>(1.0, x), Monomial<double>(1.0, y) }));
    EXPECT_POLY_EQ(x - 2.0, Polynomial<double>({ Monomial<double>(1.0, x), Monomial<double>(-2.0) }));
    EXPECT_POLY_EQ(3.0 - x, Polynomial<double>({ Monomial<double>(3.0), Monomial<double>(-1.0, x) }));
    EXPECT_POLY_EQ(-x, Polynomial<double>(Monomial<double>(-1.0, x)));
    EXPECT_POLY_EQ(x * y, Polynomial<double>(Monomial<double>(1.0, { { x, 1 }, { y, 1 } })));
    EXPECT_POLY_EQ(2.0 * x, Polynomial<double>(Monomial<double>(2.0, x)));
    EXPECT_POLY_EQ(x * 2.0, Polynomial<double>(Monomial<double>(2.0, x)));
    EXPECT_TRUE((x - x).is_zero());
}

TEST(VariableOperatorsTest, DivisionAndPowers) {
    RationalFunction<double> const ratio = x / y;
    EXPECT_RF_EQ(ratio, RationalFunction<double>(Polynomial<double>(x), Polynomial<double>(y)));

    EXPECT_RF_EQ(x / 4.0, RationalFunction<double>(Polynomial<double>(Monomial<double>(0.25, x))));
    EXPECT_THROW(x / 0.0, std::invalid_argument);

    EXPECT_RF_EQ(pow(x, 3), RationalFunction<double>(Polynomial<double>(Monomial<double>(1.0, x, 3))));
    EXPECT_RF_EQ(pow(x, -2),
                 RationalFunction<double>(Polynomial<double>(Monomial<double>(1.0)),
                                          Polynomial<double>(Monomial<double>(1.0, x, 2))));
    EXPECT_RF_EQ(pow(x, 0), RationalFunction<double>(1.0));

    EXPECT_POLY_EQ(constant(7.5), Polynomial<double>(Monomial<double>(7.5)));
}
