#include "univariate_solver.hpp"
#include <cmath>
#include <complex>
#include <gtest/gtest.h>
#include <vector>

using namespace branch_eqs;

TEST(UnivariateSolverTest, ComplexRootsOfQuadratic) {
    // x^2 + 1
    std::vector<std::complex<double>> const roots = univariate_solver::find_roots({ 1.0, 0.0, 1.0 });
    ASSERT_EQ(roots.size(), 2);
    for (const auto &r : roots) {
        EXPECT_NEAR(r.real(), 0.0, 1e-12);
        EXPECT_NEAR(std::abs(r.imag()), 1.0, 1e-12);
    }
}

TEST(UnivariateSolverTest, DegenerateInputs) {
    EXPECT_TRUE(univariate_solver::find_roots({}).empty());
    EXPECT_TRUE(univariate_solver::find_roots({ 5.0 }).empty());
    EXPECT_TRUE(univariate_solver::find_roots({ 0.0, 0.0, 0.0 }).empty());

    // 2x - 6 is solved directly
    std::vector<std::complex<double>> const linear = univariate_solver::find_roots({ -6.0, 2.0 });
    ASSERT_EQ(linear.size(), 1);
    EXPECT_DOUBLE_EQ(linear[0].real(), 3.0);
    EXPECT_DOUBLE_EQ(linear[0].imag(), 0.0);
}

TEST(UnivariateSolverTest, RealRootsAreSortedAndPolished) {
    // (x-1)(x-2)(x-3) = x^3 - 6x^2 + 11x - 6
    std::vector<double> const roots = univariate_solver::find_real_roots({ -6.0, 11.0, -6.0, 1.0 });
    ASSERT_EQ(roots.size(), 3);
    EXPECT_NEAR(roots[0], 1.0, 1e-12);
    EXPECT_NEAR(roots[1], 2.0, 1e-12);
    EXPECT_NEAR(roots[2], 3.0, 1e-12);
}

TEST(UnivariateSolverTest, ComplexRootsAreDropped) {
    // x^2 + 1 has no real roots
    EXPECT_TRUE(univariate_solver::find_real_roots({ 1.0, 0.0, 1.0 }).empty());

    // (x^2 + 1)(x - 4) = x^3 - 4x^2 + x - 4
    std::vector<double> const roots = univariate_solver::find_real_roots({ -4.0, 1.0, -4.0, 1.0 });
    ASSERT_EQ(roots.size(), 1);
    EXPECT_NEAR(roots[0], 4.0, 1e-12);
}

TEST(UnivariateSolverTest, NegligibleLeadingCoefficientsAreTrimmed) {
    // 1e-20 x^3 + x^2 - 4 behaves like x^2 - 4
    std::vector<double> const roots = univariate_solver::find_real_roots({ -4.0, 0.0, 1.0, 1e-20 });
    ASSERT_EQ(roots.size(), 2);
    EXPECT_NEAR(roots[0], -2.0, 1e-12);
    EXPECT_NEAR(roots[1], 2.0, 1e-12);
}

TEST(UnivariateSolverTest, DoubleRootIsKept) {
    // (x - 1)^2: the companion matrix may split the root slightly, but it stays real
    std::vector<double> const roots = univariate_solver::find_real_roots({ 1.0, -2.0, 1.0 });
    ASSERT_FALSE(roots.empty());
    ASSERT_LE(roots.size(), 2);
    for (double r : roots) { EXPECT_NEAR(r, 1.0, 1e-6); }
}

TEST(UnivariateSolverTest, NearbyRootsAreMerged) {
    OracleOptions options;
    options.root_merge_tolerance = 1e-3;
    // (x - 1)(x - 1.0001)
    std::vector<double> const roots = univariate_solver::find_real_roots({ 1.0001, -2.0001, 1.0 }, options);
    ASSERT_EQ(roots.size(), 1);
    EXPECT_NEAR(roots[0], 1.0, 1e-9);
}

TEST(UnivariateSolverTest, RootAtZero) {
    // x^2 - 3x = x(x - 3)
    std::vector<double> const roots = univariate_solver::find_real_roots({ 0.0, -3.0, 1.0 });
    ASSERT_EQ(roots.size(), 2);
    EXPECT_DOUBLE_EQ(roots[0], 0.0);
    EXPECT_NEAR(roots[1], 3.0, 1e-12);
}
