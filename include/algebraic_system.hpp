#ifndef ALGEBRAIC_SYSTEM_HPP
#define ALGEBRAIC_SYSTEM_HPP

#include "polynomial.hpp" // Needs Polynomial and Variable
#include <vector>

namespace branch_eqs {

/**
 * @brief A purely numeric polynomial system P_i(unknowns) = 0.
 *
 * Built by the oracle once units and symbolic coefficients have been
 * eliminated, for the numeric Newton stages.
 */
struct AlgebraicSystem {
    /**
     * @brief An ordered list of variables to be solved for.
     * The order determines the column order of the Jacobian.
     */
    std::vector<Variable> unknowns;

    /**
     * @brief The list of polynomial equations to be solved (P_i(unknowns) = 0).
     */
    std::vector<Polynomial<double>> polynomials;
};

} // namespace branch_eqs

#endif // ALGEBRAIC_SYSTEM_HPP
