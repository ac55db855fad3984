#ifndef EQUATION_CLASSIFIER_HPP
#define EQUATION_CLASSIFIER_HPP

#include "algebra_oracle.hpp"
#include "solver_options.hpp"
#include "units.hpp"

#include <iostream>

namespace branch_eqs {

enum class Classification {
    Usable,       // Carries information about at least one unknown
    Redundant,    // Holds identically
    Contradiction // Two quantities that cannot be equal
};

std::ostream &
operator<<(std::ostream &os, Classification classification);

/**
 * @brief Smallest nonzero coefficient magnitude observed so far.
 *
 * Used as the absolute scale when one side of a relation is exactly zero.
 */
class MinFloatTracker {
  public:
    void observe(double value);

    // 1.0 until something nonzero has been observed
    [[nodiscard]] double value() const { return observed_ ? min_ : 1.0; }

  private:
    double min_ = 1.0;
    bool observed_ = false;
};

/**
 * @brief Decides whether a relation lhs = rhs is usable, redundant or contradictory.
 *
 * Relations with unknowns are compared structurally via the oracle. Constant relations
 * are compared numerically, with unit tags replaced by the factors of two independent
 * substitution tables; both tables must agree for the relation to be redundant.
 */
class EquationClassifier {
  public:
    EquationClassifier(const AlgebraOracle &oracle,
                       UnitSubstitution first_table,
                       UnitSubstitution second_table,
                       double epsilon = kDefaultEpsilon);

    Classification classify(const Expression &lhs, const Expression &rhs);

    [[nodiscard]] const MinFloatTracker &min_float() const { return min_float_; }
    [[nodiscard]] double epsilon() const { return epsilon_; }

  private:
    bool constants_equal(const Expression &lhs, const Expression &rhs, UnitSubstitution &table) const;
    void observe_coefficients(const Expression &expr);

    const AlgebraOracle &oracle_;
    UnitSubstitution first_table_;
    UnitSubstitution second_table_;
    double epsilon_;
    MinFloatTracker min_float_;
};

} // namespace branch_eqs

#endif // EQUATION_CLASSIFIER_HPP
