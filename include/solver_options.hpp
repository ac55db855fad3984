#ifndef SOLVER_OPTIONS_HPP
#define SOLVER_OPTIONS_HPP

#include <cstddef>

namespace branch_eqs {

// Relative tolerance used to decide that two constants are equal
inline constexpr double kDefaultEpsilon = 1e-10;

// Half width of the interval around 1.0 from which unit substitution factors are drawn
inline constexpr double kDefaultRandRange = 0.2;

/**
 * @brief Options controlling an EquationSystem solve.
 */
struct SolverOptions {
    double epsilon = kDefaultEpsilon;
    double rand_range = kDefaultRandRange;

    // Seed for the unit substitution tables. 0 draws a seed from std::random_device.
    unsigned int random_seed = 0;

    // Largest relation subset handed to the oracle in one call. 0 means no limit.
    std::size_t max_subset_size = 0;

    // Throw as soon as one relation subset has no solution instead of waiting
    // for the end of the pass.
    bool raise_on_unsolvable_subset = false;

    bool verbose = false;
};

/**
 * @brief Tolerances of the default algebra oracle.
 */
struct OracleOptions {
    // Coefficients below this magnitude are treated as zero when choosing pivots and leading terms
    double zero_tolerance = 1e-12;

    // A root is real when |Im| <= real_tolerance * max(1, |root|)
    double real_tolerance = 1e-7;

    // Roots closer than this (relative) are merged
    double root_merge_tolerance = 1e-8;

    // Relative residual accepted when verifying a candidate against the relations
    double residual_tolerance = 1e-8;

    int polish_iterations = 20;

    // Number of random starting points for the Newton fallback
    int newton_starts = 8;

    unsigned int random_seed = 42;

    bool verbose = false;
};

} // namespace branch_eqs

#endif // SOLVER_OPTIONS_HPP
