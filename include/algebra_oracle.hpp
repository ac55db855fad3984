#ifndef ALGEBRA_ORACLE_HPP
#define ALGEBRA_ORACLE_HPP

#include "polynomial.hpp"
#include "rational_function_operators.hpp"

#include <iostream>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace branch_eqs {

/**
 * @brief One equality lhs = rhs produced by an equation method.
 *
 * Relations are recomputed on every solver pass and never stored in a branch.
 */
struct Relation {
    Expression lhs;
    Expression rhs;
    std::string source; // Name of the equation method that produced it

    // Duplicates are detected on the two sides only
    bool operator==(const Relation &other) const { return lhs == other.lhs && rhs == other.rhs; }
    bool operator!=(const Relation &other) const { return !(*this == other); }
};

inline std::ostream &
operator<<(std::ostream &os, const Relation &relation) {
    os << relation.lhs << " = " << relation.rhs;
    if (!relation.source.empty()) { os << "  [" << relation.source << "]"; }
    return os;
}

using SolutionMap = std::map<Variable, Expression>;

enum class SolutionKind {
    NoSolution,   // The relations are inconsistent
    Solved,       // One or more candidate mappings
    Indeterminate // The oracle cannot express a solution; says nothing about consistency
};

struct SolutionSet {
    SolutionKind kind = SolutionKind::Indeterminate;
    std::vector<SolutionMap> solutions;

    static SolutionSet none() { return SolutionSet{ SolutionKind::NoSolution, {} }; }
    static SolutionSet indeterminate() { return SolutionSet{ SolutionKind::Indeterminate, {} }; }
    static SolutionSet of(std::vector<SolutionMap> candidates) {
        if (candidates.empty()) { return none(); }
        return SolutionSet{ SolutionKind::Solved, std::move(candidates) };
    }
};

/**
 * @brief Abstract symbolic algebra service consumed by the solver.
 */
class AlgebraOracle {
  public:
    virtual ~AlgebraOracle() = default;

    /**
     * @brief Returns a canonical form of expr. Equal expressions must simplify to
     *        structurally equal results for lhs - rhs == 0 to detect redundancy.
     */
    virtual Expression simplify(const Expression &expr) const = 0;

    /**
     * @brief The unknowns occurring in expr. Unit tags are never reported.
     */
    virtual std::set<Variable> free_variables(const Expression &expr) const = 0;

    /**
     * @brief Solves the relations for the given unknowns.
     *
     * @return NoSolution when the relations are inconsistent, Solved with every
     *         candidate found (a candidate may still contain unknowns), or
     *         Indeterminate when no solution can be expressed.
     */
    virtual SolutionSet solve(const std::vector<Relation> &relations, const std::vector<Variable> &unknowns) = 0;

    virtual std::string name() const = 0;
};

} // namespace branch_eqs

#endif // ALGEBRA_ORACLE_HPP
