#include "univariate_solver.hpp"

#include <Eigen/Dense>
#include <unsupported/Eigen/Polynomials>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>

namespace branch_eqs {
namespace univariate_solver {

namespace {

// Drops negligible leading coefficients so the companion matrix is well defined
std::vector<double>
trim_leading(const std::vector<double> &coeffs, double zero_tolerance) {
    double largest = 0.0;
    for (double c : coeffs) { largest = std::max(largest, std::abs(c)); }
    if (largest == 0.0) { return {}; }

    size_t degree = coeffs.size() - 1;
    while (degree > 0 && std::abs(coeffs[degree]) <= zero_tolerance * largest) { --degree; }
    return std::vector<double>(coeffs.begin(), coeffs.begin() + static_cast<std::ptrdiff_t>(degree) + 1);
}

void
evaluate_with_derivative(const std::vector<double> &coeffs, double x, double &value, double &derivative) {
    value = 0.0;
    derivative = 0.0;
    for (auto it = coeffs.rbegin(); it != coeffs.rend(); ++it) {
        derivative = derivative * x + value;
        value = value * x + *it;
    }
}

double
polish_root(const std::vector<double> &coeffs, double x, int max_iterations) {
    double best_x = x;
    double value = 0.0;
    double derivative = 0.0;
    evaluate_with_derivative(coeffs, x, value, derivative);
    double best_residual = std::abs(value);

    for (int iter = 0; iter < max_iterations && best_residual > 0.0; ++iter) {
        if (derivative == 0.0) { break; }
        const double step = value / derivative;
        x -= step;
        evaluate_with_derivative(coeffs, x, value, derivative);
        if (!std::isfinite(value)) { break; }
        if (std::abs(value) < best_residual) {
            best_residual = std::abs(value);
            best_x = x;
        }
        if (std::abs(step) <= std::numeric_limits<double>::epsilon() * std::max(1.0, std::abs(x))) { break; }
    }
    return best_x;
}

} // namespace

std::vector<std::complex<double>>
find_roots(const std::vector<double> &coeffs, double zero_tolerance) {
    const std::vector<double> trimmed = trim_leading(coeffs, zero_tolerance);
    if (trimmed.size() < 2) { return {}; }
    if (trimmed.size() == 2) { return { std::complex<double>(-trimmed[0] / trimmed[1], 0.0) }; }

    Eigen::VectorXd eigen_coeffs(static_cast<Eigen::Index>(trimmed.size()));
    for (size_t i = 0; i < trimmed.size(); ++i) { eigen_coeffs[static_cast<Eigen::Index>(i)] = trimmed[i]; }

    Eigen::PolynomialSolver<double, Eigen::Dynamic> psolver;
    psolver.compute(eigen_coeffs);
    const auto &eigen_roots = psolver.roots();

    std::vector<std::complex<double>> roots;
    roots.reserve(static_cast<size_t>(eigen_roots.size()));
    for (Eigen::Index i = 0; i < eigen_roots.size(); ++i) { roots.push_back(eigen_roots[i]); }
    return roots;
}

std::vector<double>
find_real_roots(const std::vector<double> &coeffs, const OracleOptions &options) {
    const std::vector<double> trimmed = trim_leading(coeffs, options.zero_tolerance);

    std::vector<double> real_roots;
    for (const auto &root : find_roots(trimmed, options.zero_tolerance)) {
        if (std::abs(root.imag()) > options.real_tolerance * std::max(1.0, std::abs(root))) { continue; }
        real_roots.push_back(polish_root(trimmed, root.real(), options.polish_iterations));
    }
    std::sort(real_roots.begin(), real_roots.end());

    std::vector<double> merged;
    for (double r : real_roots) {
        if (std::abs(r) < options.zero_tolerance) { r = 0.0; }
        if (!merged.empty() && std::abs(r - merged.back()) <= options.root_merge_tolerance * std::max(1.0, std::abs(r))) {
            continue;
        }
        merged.push_back(r);
    }
    return merged;
}

} // namespace univariate_solver
} // namespace branch_eqs
