#ifndef UNIVARIATE_SOLVER_HPP
#define UNIVARIATE_SOLVER_HPP

#include "solver_options.hpp"

#include <complex>
#include <vector>

namespace branch_eqs {
namespace univariate_solver {

/**
 * @brief Finds the complex roots of a univariate polynomial with Eigen's companion matrix solver.
 *
 * The polynomial is defined by its coefficients c_0, c_1, ..., c_n,
 * representing P(t) = c_0 + c_1*t + c_2*t^2 + ... + c_n*t^n.
 * Leading coefficients below zero_tolerance relative to the largest one are dropped.
 *
 * @return The n roots of the (trimmed) polynomial. Empty for constant or zero polynomials.
 */
std::vector<std::complex<double>>
find_roots(const std::vector<double> &coeffs, double zero_tolerance = 1e-12);

/**
 * @brief Real roots of the polynomial, Newton-polished, merged and sorted ascending.
 *
 * A root is kept when its imaginary part is within options.real_tolerance (relative).
 */
std::vector<double>
find_real_roots(const std::vector<double> &coeffs, const OracleOptions &options = OracleOptions());

} // namespace univariate_solver
} // namespace branch_eqs

#endif // UNIVARIATE_SOLVER_HPP
