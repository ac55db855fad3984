#include "equation_classifier.hpp"

#include <cmath>
#include <stdexcept>
#include <utility>

namespace branch_eqs {

std::ostream &
operator<<(std::ostream &os, Classification classification) {
    switch (classification) {
        case Classification::Usable:
            return os << "Usable";
        case Classification::Redundant:
            return os << "Redundant";
        case Classification::Contradiction:
            return os << "Contradiction";
    }
    return os;
}

void
MinFloatTracker::observe(double value) {
    double const magnitude = std::abs(value);
    if (magnitude == 0.0 || !std::isfinite(magnitude)) { return; }
    if (!observed_ || magnitude < min_) {
        min_ = magnitude;
        observed_ = true;
    }
}

EquationClassifier::EquationClassifier(const AlgebraOracle &oracle,
                                       UnitSubstitution first_table,
                                       UnitSubstitution second_table,
                                       double epsilon)
  : oracle_(oracle)
  , first_table_(std::move(first_table))
  , second_table_(std::move(second_table))
  , epsilon_(epsilon) {}

Classification
EquationClassifier::classify(const Expression &lhs, const Expression &rhs) {
    bool const lhs_constant = oracle_.free_variables(lhs).empty();
    bool const rhs_constant = oracle_.free_variables(rhs).empty();

    if (!lhs_constant || !rhs_constant) {
        Expression const difference =
          lhs_constant ? oracle_.simplify(rhs - lhs) : oracle_.simplify(lhs - rhs);
        if (difference.is_zero()) { return Classification::Redundant; }
        observe_coefficients(lhs);
        observe_coefficients(rhs);
        return Classification::Usable;
    }

    if (constants_equal(lhs, rhs, first_table_) && constants_equal(lhs, rhs, second_table_)) {
        return Classification::Redundant;
    }
    return Classification::Contradiction;
}

bool
EquationClassifier::constants_equal(const Expression &lhs, const Expression &rhs, UnitSubstitution &table) const {
    double a = 0.0;
    double b = 0.0;
    try {
        a = table.evaluate(lhs);
        b = table.evaluate(rhs);
    } catch (const std::invalid_argument &) {
        // A quantity that cannot be evaluated (e.g. division by zero) equals nothing
        return false;
    }
    if (std::isnan(a) || std::isnan(b)) { return false; }

    if (lhs.is_zero()) { return std::abs(b) <= epsilon_ * min_float_.value(); }
    if (rhs.is_zero()) { return std::abs(a) <= epsilon_ * min_float_.value(); }
    return std::abs(a - b) <= epsilon_ * std::abs(a + b);
}

void
EquationClassifier::observe_coefficients(const Expression &expr) {
    // Denominators are normalised to a unit leading term and carry no scale information
    for (const auto &m : expr.numerator.monomials) { min_float_.observe(m.coeff); }
}

} // namespace branch_eqs
