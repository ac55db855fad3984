#ifndef EXAMPLE_SYSTEMS_HPP
#define EXAMPLE_SYSTEMS_HPP

#include "equation_system.hpp"

#include <memory>

namespace branch_eqs {
namespace examples {

/**
 * @brief Three linear relations with a unique solution.
 *
 * Equations:
 *   x = y + z
 *   5x + z = -y
 *   x + y = z/4 + 10
 * Solution: x = 0, y = 8, z = -8
 */
std::unique_ptr<EquationSystem>
define_linear_three_variable_system(SolverOptions options = SolverOptions());

/**
 * @brief Two independent sign ambiguities, four branches.
 *
 * Equations: x^2 = 4, y^2 = 16
 */
std::unique_ptr<EquationSystem>
define_two_quadratics_system(SolverOptions options = SolverOptions());

// x + y = 1 and x + y = 2: no solution
std::unique_ptr<EquationSystem>
define_parallel_lines_system(SolverOptions options = SolverOptions());

/**
 * @brief x^2 = 4 with a procedure that deletes every branch where x < 0,
 *        and a procedure computing the derived value y = 3x.
 */
std::unique_ptr<EquationSystem>
define_negative_root_filter_system(SolverOptions options = SolverOptions());

/**
 * @brief Quantities with units.
 *
 * Equations:
 *   x = 5
 *   y = 10 cm * x
 *   t = y / (2 m/s)
 * Solution: y = 50 cm, t = 0.25 s
 */
std::unique_ptr<EquationSystem>
define_mixed_units_system(SolverOptions options = SolverOptions());

/**
 * @brief Free fall from rest, solved for the fall time and impact speed.
 *
 * Equations:
 *   h = 20 m
 *   h = g0 * t^2 / 2
 *   v = g0 * t
 * The negative time root is discarded by a procedure.
 */
std::unique_ptr<EquationSystem>
define_free_fall_system(SolverOptions options = SolverOptions());

} // namespace examples
} // namespace branch_eqs

#endif // EXAMPLE_SYSTEMS_HPP
