#include "solution_polisher.hpp"
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>

namespace branch_eqs {

SolutionPolisher::SolutionPolisher(const AlgebraicSystem &system_to_polish_against, bool verbose)
  : original_system_(system_to_polish_against)
  , ordered_unknowns_(system_to_polish_against.unknowns)
  , verbose_(verbose) {
    jacobian_.reserve(original_system_.polynomials.size());
    for (const auto &poly : original_system_.polynomials) {
        std::vector<Polynomial<double>> row;
        row.reserve(ordered_unknowns_.size());
        for (const auto &var : ordered_unknowns_) { row.push_back(poly.partial_derivative(var)); }
        jacobian_.push_back(std::move(row));
    }
}

Eigen::VectorXd
SolutionPolisher::evaluate_residuals(const PolynomialSolutionMapReal &current_values) const {
    const size_t num_polynomials = original_system_.polynomials.size();
    Eigen::VectorXd F(num_polynomials);
    F.setZero();

    for (size_t i = 0; i < num_polynomials; ++i) {
        try {
            F(i) = original_system_.polynomials[i].evaluate(current_values);
        } catch (const std::exception &e) {
            throw std::runtime_error("[SolutionPolisher] Error evaluating residual for P" + std::to_string(i) + ": " +
                                     e.what());
        }
    }
    return F;
}

Eigen::MatrixXd
SolutionPolisher::evaluate_jacobian(const PolynomialSolutionMapReal &current_values) const {
    const size_t num_polynomials = jacobian_.size();
    const size_t num_unknowns = ordered_unknowns_.size();
    Eigen::MatrixXd J(num_polynomials, num_unknowns);
    J.setZero();

    for (size_t i = 0; i < num_polynomials; ++i) {
        for (size_t j = 0; j < num_unknowns; ++j) {
            try {
                J(i, j) = jacobian_[i][j].evaluate(current_values);
            } catch (const std::exception &e) {
                throw std::runtime_error("[SolutionPolisher] Error evaluating Jacobian entry J(" + std::to_string(i) +
                                         "," + ordered_unknowns_[j].name + "): " + e.what());
            }
        }
    }
    return J;
}

bool
SolutionPolisher::polish(PolynomialSolutionMapReal &solution_candidate,
                         std::vector<double> &final_residuals,
                         int max_iterations,
                         double tolerance,
                         double step_damping_factor) {
    final_residuals.clear();
    if (ordered_unknowns_.empty()) {
        if (original_system_.polynomials.empty()) { return true; }
        Eigen::VectorXd F_constant;
        try {
            F_constant = evaluate_residuals(solution_candidate);
        } catch (const std::exception &e) {
            std::cerr << "[SolutionPolisher] Error evaluating residuals (no unknowns): " << e.what() << std::endl;
            return false;
        }
        final_residuals.assign(F_constant.data(), F_constant.data() + F_constant.size());
        return F_constant.norm() < tolerance;
    }

    Eigen::VectorXd F_eigen;
    Eigen::MatrixXd J_eigen;

    for (int iter = 0; iter < max_iterations; ++iter) {
        try {
            F_eigen = evaluate_residuals(solution_candidate);
        } catch (const std::exception &e) {
            std::cerr << "[SolutionPolisher Iter " << iter << "] Error evaluating residuals: " << e.what() << std::endl;
            return false;
        }

        final_residuals.assign(F_eigen.data(), F_eigen.data() + F_eigen.size());
        const double current_norm = F_eigen.norm();
        if (!std::isfinite(current_norm)) {
            if (verbose_) { std::cout << "  [SolutionPolisher] Residual diverged at iteration " << iter << std::endl; }
            return false;
        }
        if (verbose_) { std::cout << "  [Polisher Iter " << iter << "] Residual norm: " << current_norm << std::endl; }

        if (current_norm < tolerance) {
            if (verbose_) { std::cout << "  [Polisher] Converged in " << iter + 1 << " iterations." << std::endl; }
            return true;
        }

        try {
            J_eigen = evaluate_jacobian(solution_candidate);
        } catch (const std::exception &e) {
            std::cerr << "[SolutionPolisher Iter " << iter << "] Error evaluating Jacobian: " << e.what() << std::endl;
            return false;
        }

        Eigen::ColPivHouseholderQR<Eigen::MatrixXd> dec(J_eigen);
        if (dec.rank() < static_cast<Eigen::Index>(ordered_unknowns_.size())) {
            if (verbose_) {
                std::cout << "  [SolutionPolisher Iter " << iter
                          << "] Jacobian is rank-deficient. Rank: " << dec.rank() << std::endl;
            }
            return false;
        }
        Eigen::VectorXd delta = dec.solve(-F_eigen);

        for (size_t i = 0; i < ordered_unknowns_.size(); ++i) {
            auto it = solution_candidate.find(ordered_unknowns_[i]);
            if (it == solution_candidate.end()) {
                std::cerr << "[SolutionPolisher Iter " << iter << "] Error: Unknown variable '" << ordered_unknowns_[i]
                          << "' not found in solution_candidate map during update." << std::endl;
                return false;
            }
            it->second += step_damping_factor * delta(static_cast<Eigen::Index>(i));
        }
    }

    try {
        F_eigen = evaluate_residuals(solution_candidate);
        final_residuals.assign(F_eigen.data(), F_eigen.data() + F_eigen.size());
    } catch (const std::exception &e) {
        std::cerr << "[SolutionPolisher] Error evaluating final residuals: " << e.what() << std::endl;
        return false;
    }
    if (F_eigen.norm() < tolerance) { return true; }
    if (verbose_) {
        std::cout << "  [SolutionPolisher] Did not converge after " << max_iterations << " iterations." << std::endl;
    }
    return false;
}

} // namespace branch_eqs
