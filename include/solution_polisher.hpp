#ifndef SOLUTION_POLISHER_HPP
#define SOLUTION_POLISHER_HPP

#include "algebraic_system.hpp" // For AlgebraicSystem
#include "polynomial.hpp"       // For Variable, Polynomial
#include <Eigen/Dense>          // For Eigen matrices and vectors
#include <map>
#include <vector>

namespace branch_eqs {

using PolynomialSolutionMapReal = std::map<Variable, double>;

/**
 * @brief Damped Newton refinement of a real candidate solution.
 *
 * Uses a column-pivoting QR factorisation of the Jacobian, so overdetermined
 * systems are refined in the least-squares sense.
 */
class SolutionPolisher {
  public:
    explicit SolutionPolisher(const AlgebraicSystem &system_to_polish_against, bool verbose = false);

    // Polishes a single solution map in place.
    // Returns true if converged, false otherwise.
    // Stores final residuals of each polynomial in the output vector.
    bool polish(PolynomialSolutionMapReal &solution_candidate,
                std::vector<double> &final_residuals,
                int max_iterations = 20,
                double tolerance = 1e-9,
                double step_damping_factor = 1.0);

  private:
    const AlgebraicSystem &original_system_;
    std::vector<Variable> ordered_unknowns_;
    std::vector<std::vector<Polynomial<double>>> jacobian_; // d(P_i)/d(unknown_j), built once
    bool verbose_;

    Eigen::MatrixXd evaluate_jacobian(const PolynomialSolutionMapReal &current_values) const;
    Eigen::VectorXd evaluate_residuals(const PolynomialSolutionMapReal &current_values) const;
};

} // namespace branch_eqs
#endif // SOLUTION_POLISHER_HPP
