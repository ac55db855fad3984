#include "test_utils.hpp" // Include common test utilities
#include <cmath>
#include <gtest/gtest.h>
#include <map>
#include <sstream>
#include <vector>

using namespace branch_eqs;
using namespace branch_eqs::test_utils;

TEST(RationalFunctionTest, ConstructorsAndNormalization) {
    Polynomial<double> const Px(x); // x
    Polynomial<double> const Py(y); // y
    Polynomial<double> const P1{ Monomial<double>(1.0) };
    Polynomial<double> const P0;
    Monomial<double> const My(1.0, y);

    // Default: 0/1
    RationalFunction<double> const rf_default;
    EXPECT_POLY_EQ(rf_default.numerator, P0);
    EXPECT_POLY_EQ(rf_default.denominator, P1);
    EXPECT_TRUE(rf_default.is_zero());

    // From Polynomials: x/y (Use {} initializer)
    RationalFunction<double> const rf_xy{ Px, Py };
    EXPECT_POLY_EQ(rf_xy.numerator, Px);
    EXPECT_POLY_EQ(rf_xy.denominator, Py);

    // From Polynomial (implicit denominator 1)
    RationalFunction<double> const rf_x_over_1{ Px };
    EXPECT_POLY_EQ(rf_x_over_1.numerator, Px);
    EXPECT_POLY_EQ(rf_x_over_1.denominator, P1);

    // From Monomial
    RationalFunction<double> const rf_y_over_1{ My };
    EXPECT_POLY_EQ(rf_y_over_1.numerator, Py);
    EXPECT_POLY_EQ(rf_y_over_1.denominator, P1);

    // From Variable
    RationalFunction<double> const rf_z_over_1{ z };
    EXPECT_POLY_EQ(rf_z_over_1.numerator, Polynomial<double>(z));
    EXPECT_POLY_EQ(rf_z_over_1.denominator, P1);

    // From Coeff
    RationalFunction<double> const rf_5_over_1(5.0);
    EXPECT_POLY_EQ(rf_5_over_1.numerator, Polynomial<double>(Monomial<double>(5.0)));
    EXPECT_POLY_EQ(rf_5_over_1.denominator, P1);

    // Normalization: 0/y -> 0/1
    RationalFunction<double> const rf_0_over_y{ P0, Py };
    EXPECT_POLY_EQ(rf_0_over_y.numerator, P0);
    EXPECT_POLY_EQ(rf_0_over_y.denominator, P1);

    // Denominator is zero polynomial - throws
    EXPECT_THROW(RationalFunction<double>(Px, P0), std::invalid_argument);

    // Denominator simplifies to zero - throws
    Polynomial<double> const Px_minus_x = Px - Px;
    EXPECT_THROW(RationalFunction<double>(Px, Px_minus_x), std::invalid_argument);
}

TEST(RationalFunctionTest, CanonicalForm) {
    // (2x)/(4y) -> 0.5x / y: the last denominator term gets coefficient one
    RationalFunction<double> const rf_scaled{ Polynomial<double>(Monomial<double>(2.0, x)),
                                              Polynomial<double>(Monomial<double>(4.0, y)) };
    EXPECT_POLY_EQ(rf_scaled.numerator, Polynomial<double>(Monomial<double>(0.5, x)));
    EXPECT_POLY_EQ(rf_scaled.denominator, Polynomial<double>(y));

    // x^2*y / (x*y^3) -> x / y^2
    RationalFunction<double> const rf_shared{ Polynomial<double>(Monomial<double>(1.0, { { x, 2 }, { y, 1 } })),
                                              Polynomial<double>(Monomial<double>(1.0, { { x, 1 }, { y, 3 } })) };
    EXPECT_POLY_EQ(rf_shared.numerator, Polynomial<double>(x));
    EXPECT_POLY_EQ(rf_shared.denominator, Polynomial<double>(Monomial<double>(1.0, y, 2)));

    // Negative exponents move to the denominator: x^-1 -> 1/x
    RationalFunction<double> const rf_inverse{ Polynomial<double>(Monomial<double>(1.0, x, -1)) };
    EXPECT_POLY_EQ(rf_inverse.numerator, Polynomial<double>(Monomial<double>(1.0)));
    EXPECT_POLY_EQ(rf_inverse.denominator, Polynomial<double>(x));

    // Equal values built differently compare structurally equal
    RationalFunction<double> const two_x_over_two{ Polynomial<double>(Monomial<double>(2.0, x)),
                                                   Polynomial<double>(Monomial<double>(2.0)) };
    EXPECT_EQ(two_x_over_two, RationalFunction<double>(x));
    EXPECT_NE(two_x_over_two, RationalFunction<double>(y));
}

TEST(RationalFunctionTest, ConstantQueries) {
    RationalFunction<double> const six(6.0);
    RationalFunction<double> const three(3.0);
    RationalFunction<double> const ratio = six / three;
    ASSERT_TRUE(ratio.is_constant());
    EXPECT_DOUBLE_EQ(ratio.constant_value(), 2.0);

    RationalFunction<double> const rf_x(x);
    EXPECT_FALSE(rf_x.is_constant());
    EXPECT_THROW((void)rf_x.constant_value(), std::invalid_argument);

    // Unit tags are symbols too
    RationalFunction<double> const one_meter(Variable("m", true));
    EXPECT_FALSE(one_meter.is_constant());

    std::set<Variable> const expected = { x, y };
    EXPECT_EQ(RationalFunction<double>(Polynomial<double>(x), Polynomial<double>(y)).variables(), expected);
}

TEST(RationalFunctionTest, Arithmetic) {
    RationalFunction<double> const A{ x };                                                                // x/1
    RationalFunction<double> const B{ y };                                                                // y/1
    RationalFunction<double> const C{ Polynomial<double>(Monomial<double>(1.0)), Polynomial<double>(x) }; // 1/x
    RationalFunction<double> const D{ Polynomial<double>(y), Polynomial<double>(x) };                     // y/x

    // Addition: x + y = (x+y)/1
    RationalFunction<double> const res_add = A + B;
    EXPECT_RF_EQ(res_add, RationalFunction<double>{ Polynomial<double>(x) + Polynomial<double>(y) });

    // Addition: x + 1/x = (x^2 + 1)/x
    RationalFunction<double> const res_add2 = A + C;
    Polynomial<double> const num_add2 =
      Polynomial<double>(Monomial<double>(1.0, x, 2)) + Polynomial<double>(Monomial<double>(1.0));
    EXPECT_RF_EQ(res_add2, RationalFunction<double>{ num_add2, Polynomial<double>(x) });

    // Subtraction: y/x - 1/x = (y-1)/x
    RationalFunction<double> const res_sub2 = D - C;
    Polynomial<double> const num_sub2 = Polynomial<double>(y) - Polynomial<double>(Monomial<double>(1.0));
    EXPECT_RF_EQ(res_sub2, RationalFunction<double>{ num_sub2, Polynomial<double>(x) });

    // Subtracting a value from itself gives exactly zero
    EXPECT_TRUE((D - D).is_zero());

    // Multiplication: (x/1) * (y/x) = y
    RationalFunction<double> const res_mul2 = A * D;
    EXPECT_EQ(res_mul2, B);

    // Division: (x/1) / (1/x) = x^2 / 1
    RationalFunction<double> const res_div2 = A / C;
    EXPECT_RF_EQ(res_div2, RationalFunction<double>{ Monomial<double>(1.0, x, 2) });

    // Division: (y/x) / (x/1) = y / x^2
    RationalFunction<double> const res_div3 = D / A;
    EXPECT_RF_EQ(res_div3,
                 RationalFunction<double>{ Polynomial<double>(y), Polynomial<double>(Monomial<double>(1.0, x, 2)) });

    // Negation
    EXPECT_RF_EQ(-D, RationalFunction<double>{ Polynomial<double>(Monomial<double>(-1.0, y)), Polynomial<double>(x) });

    // Division by zero RF
    RationalFunction<double> const R0{};
    EXPECT_THROW(A / R0, std::invalid_argument);
}

TEST(RationalFunctionTest, ScalarOperatorsAndPowers) {
    RationalFunction<double> const rx(x);

    EXPECT_RF_EQ(2 * rx + 1, RationalFunction<double>(Polynomial<double>({ Monomial<double>(2.0, x), Monomial<double>(1.0) })));
    EXPECT_RF_EQ(1.0 - rx, RationalFunction<double>(Polynomial<double>({ Monomial<double>(-1.0, x), Monomial<double>(1.0) })));
    EXPECT_RF_EQ(rx / 4.0, RationalFunction<double>(Polynomial<double>(Monomial<double>(0.25, x))));
    EXPECT_THROW(rx / 0.0, std::invalid_argument);

    EXPECT_RF_EQ(pow(rx + 1.0, 2),
                 RationalFunction<double>(Polynomial<double>(
                   { Monomial<double>(1.0, x, 2), Monomial<double>(2.0, x), Monomial<double>(1.0) })));
    EXPECT_RF_EQ(pow(rx, -1), RationalFunction<double>(Polynomial<double>(Monomial<double>(1.0)), Polynomial<double>(x)));
    EXPECT_EQ(pow(rx, 0), RationalFunction<double>(1.0));
}

TEST(RationalFunctionTest, ArithmeticWithPolynomials) {
    RationalFunction<double> const rf{ Polynomial<double>(x), Polynomial<double>(y) }; // x/y
    Polynomial<double> const Pz(z);                                                    // z

    // RF + Poly: x/y + z = (x + yz) / y
    RationalFunction<double> const res_add = rf + Pz;
    Polynomial<double> const num_add = Polynomial<double>(x) + Polynomial<double>(y) * Pz;
    EXPECT_RF_EQ(res_add, RationalFunction<double>{ num_add, Polynomial<double>(y) });

    // Poly + RF
    RationalFunction<double> const res_add2 = Pz + rf;
    EXPECT_RF_EQ(res_add2, res_add);

    // RF * Poly: (x/y) * z = xz / y
    RationalFunction<double> const res_mul = rf * Pz;
    EXPECT_RF_EQ(res_mul, RationalFunction<double>{ Polynomial<double>(x) * Pz, Polynomial<double>(y) });

    // RF / Poly: (x/y) / z = x / (yz)
    RationalFunction<double> const res_div = rf / Pz;
    EXPECT_RF_EQ(res_div, RationalFunction<double>{ Polynomial<double>(x), Polynomial<double>(y) * Pz });

    // Poly / RF: z / (x/y) = zy / x
    RationalFunction<double> const res_div2 = Pz / rf;
    EXPECT_RF_EQ(res_div2, RationalFunction<double>{ Pz * Polynomial<double>(y), Polynomial<double>(x) });
}

TEST(RationalFunctionTest, Evaluation) {
    RationalFunction<double> rf{ Polynomial<double>(x), Polynomial<double>(y) };
    std::map<Variable, double> values = { { x, 6.0 }, { y, 2.0 } };
    EXPECT_NEAR(rf.evaluate<double>(values), 3.0, 1e-9);

    std::map<Variable, double> values_y0 = { { x, 6.0 }, { y, 0.0 } };
    EXPECT_THROW({ (void)rf.evaluate<double>(values_y0); }, std::invalid_argument);

    std::map<Variable, double> values_x0 = { { x, 0.0 }, { y, 2.0 } };
    EXPECT_DOUBLE_EQ(rf.evaluate<double>(values_x0), 0.0);

    // Missing variable - Polynomial::evaluate throws runtime_error
    std::map<Variable, double> missing_y = { { x, 3.0 } };
    EXPECT_THROW({ (void)rf.evaluate<double>(missing_y); }, std::runtime_error);
}

TEST(RationalFunctionTest, EvaluationWithNaN) {
    // rf = (x - 1) / (y - 2)
    Polynomial<double> const num = Polynomial<double>(x) - 1.0;
    Polynomial<double> const den = Polynomial<double>(y) - 2.0;
    RationalFunction<double> rf(num, den);

    // Denominator zero, numerator non-zero
    std::map<Variable, double> const values_y2 = { { x, 3.0 }, { y, 2.0 } };
    EXPECT_THROW({ (void)rf.evaluate<double>(values_y2); }, std::invalid_argument);

    // Numerator zero
    std::map<Variable, double> const values_x1 = { { x, 1.0 }, { y, 3.0 } };
    EXPECT_DOUBLE_EQ(rf.evaluate<double>(values_x1), 0.0);

    // 0/0
    std::map<Variable, double> const values_x1_y2 = { { x, 1.0 }, { y, 2.0 } };
    EXPECT_TRUE(std::isnan(rf.evaluate<double>(values_x1_y2)));

    // y(x-1)/x(x-1): only monomial content is cancelled, so x = 1 stays 0/0
    Polynomial<double> const num_orig = Polynomial<double>(x) * Polynomial<double>(y) - Polynomial<double>(y);
    Polynomial<double> const den_orig = Polynomial<double>(x) * Polynomial<double>(x) - Polynomial<double>(x);
    RationalFunction<double> rf_orig(num_orig, den_orig);

    std::map<Variable, double> const values_x1_orig = { { x, 1.0 }, { y, 3.0 } };
    EXPECT_TRUE(std::isnan(rf_orig.evaluate<double>(values_x1_orig)));

    std::map<Variable, double> const values_x0_orig = { { x, 0.0 }, { y, 3.0 } };
    EXPECT_THROW({ (void)rf_orig.evaluate<double>(values_x0_orig); }, std::invalid_argument);
}

TEST(RationalFunctionTest, Substitution) {
    // (x + 1) / y with x = 3, y = 2 -> 2
    RationalFunction<double> const rf(Polynomial<double>(x) + 1.0, Polynomial<double>(y));
    RationalFunction<double> const numeric = rf.substitute(std::map<Variable, double>{ { x, 3.0 }, { y, 2.0 } });
    ASSERT_TRUE(numeric.is_constant());
    EXPECT_DOUBLE_EQ(numeric.constant_value(), 2.0);

    // Partial numeric substitution keeps the other symbols
    RationalFunction<double> const partial = rf.substitute(std::map<Variable, double>{ { x, 1.0 } });
    EXPECT_RF_EQ(partial, RationalFunction<double>(Polynomial<double>(Monomial<double>(2.0)), Polynomial<double>(y)));

    // x / y with x = y^2 -> y
    RationalFunction<double> const rf_xy{ Polynomial<double>(x), Polynomial<double>(y) };
    std::map<Variable, RationalFunction<double>> const replacements = {
        { x, RationalFunction<double>(Monomial<double>(1.0, y, 2)) }
    };
    EXPECT_EQ(rf_xy.substitute(replacements), RationalFunction<double>(y));

    // Substituting zero into the denominator of a non-zero value throws
    EXPECT_THROW((void)rf_xy.substitute(std::map<Variable, double>{ { x, 1.0 }, { y, 0.0 } }), std::invalid_argument);
}

TEST(RationalFunctionTest, StreamOutput) {
    std::stringstream ss;

    RationalFunction<double> const rf1{ Polynomial<double>(x), Polynomial<double>(y) };
    ss << rf1;
    EXPECT_EQ(ss.str(), "(1*x)/(1*y)");

    // (1+x)/(-2+y)
    ss.str("");
    Polynomial<double> const num = Polynomial<double>(Monomial<double>(1.0)) + Polynomial<double>(x);
    Polynomial<double> const den = Polynomial<double>(Monomial<double>(-2.0)) + Polynomial<double>(y);
    RationalFunction<double> const rf2(num, den);
    ss << rf2;
    EXPECT_EQ(ss.str(), "(1 + 1*x)/(-2 + 1*y)");

    // Constant function (5/1)
    ss.str("");
    RationalFunction<double> const rf_const(5.0);
    ss << rf_const;
    EXPECT_EQ(ss.str(), "(5)");

    // Zero function (0/1)
    ss.str("");
    RationalFunction<double> const rf_zero;
    ss << rf_zero;
    EXPECT_EQ(ss.str(), "(0)");
}

TEST(RationalFunctionTest, ComplexArithmetic) {
    RationalFunction<double> const rx(x);
    RationalFunction<double> const ry(y);
    RationalFunction<double> const r_one(1.0);
    RationalFunction<double> const r_two(2.0);

    // (x + y) / (1 + 2) = (x+y)/3
    RationalFunction<double> const res1 = (rx + ry) / (r_one + r_two);
    RationalFunction<double> const exp1(Polynomial<double>(x) + Polynomial<double>(y),
                                        Polynomial<double>(Monomial<double>(3.0)));
    EXPECT_RF_EQ(res1, exp1);

    // (1 + 1/x) * (1 - 1/x) = (x^2 - 1) / x^2
    RationalFunction<double> const r_one_over_x(r_one / rx);
    RationalFunction<double> const res2 = (r_one + r_one_over_x) * (r_one - r_one_over_x);
    Polynomial<double> const Px2_minus_1 =
      Polynomial<double>(Monomial<double>(1.0, x, 2)) - Polynomial<double>(Monomial<double>(1.0));
    Polynomial<double> const Px2 = Polynomial<double>(Monomial<double>(1.0, x, 2));
    EXPECT_RF_EQ(res2, RationalFunction<double>(Px2_minus_1, Px2));
}
