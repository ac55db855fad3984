#ifndef POLYNOMIAL_ORACLE_HPP
#define POLYNOMIAL_ORACLE_HPP

#include "algebra_oracle.hpp"
#include "solver_options.hpp"

#include <random>
#include <set>
#include <string>
#include <vector>

namespace branch_eqs {

/**
 * @brief Default algebra oracle over polynomial and rational relations.
 *
 * Strategy for solve():
 *  1. Every relation is reduced to the numerator of lhs - rhs.
 *  2. Systems linear in the unknowns are solved by symbolic Gauss-Jordan
 *     elimination. Unit tags and undeclared symbols are carried as coefficients,
 *     and rank-deficient systems give a parametric candidate.
 *  3. Anything else goes through recursive elimination. Univariate numeric
 *     polynomials are split on their real roots (Eigen companion matrix).
 *     Pure powers with unit coefficients are solved in closed form, and an
 *     unknown that appears linearly is substituted away. Square numeric
 *     remainders fall back to multi-start Newton.
 *  4. Every fully numeric candidate is checked against the original relations
 *     at SI scale before it is returned.
 */
class PolynomialOracle : public AlgebraOracle {
  public:
    explicit PolynomialOracle(OracleOptions options = OracleOptions());

    Expression simplify(const Expression &expr) const override;
    std::set<Variable> free_variables(const Expression &expr) const override;
    SolutionSet solve(const std::vector<Relation> &relations, const std::vector<Variable> &unknowns) override;
    std::string name() const override { return "PolynomialOracle"; }

    [[nodiscard]] const OracleOptions &options() const { return options_; }

  private:
    enum class Outcome { Solved, Inconsistent, Unknown };

    struct Elimination {
        Outcome outcome = Outcome::Unknown;
        std::vector<SolutionMap> solutions;
    };

    SolutionSet solve_linear(const std::vector<Polynomial<double>> &polys, const std::vector<Variable> &unknowns) const;

    Elimination eliminate(const std::vector<Polynomial<double>> &polys,
                          const std::vector<Variable> &unknowns,
                          int depth);

    Elimination branch_on_values(const std::vector<Polynomial<double>> &polys,
                                 size_t solved_index,
                                 const Variable &var,
                                 const std::vector<Expression> &values,
                                 const std::vector<Variable> &unknowns,
                                 int depth);

    Elimination substitute_linear(const std::vector<Polynomial<double>> &polys,
                                  size_t solved_index,
                                  const Variable &var,
                                  const Expression &value,
                                  const std::vector<Variable> &unknowns,
                                  int depth);

    Elimination newton_fallback(const std::vector<Polynomial<double>> &polys, const std::vector<Variable> &unknowns);

    // Candidate check at SI scale. Candidates that still contain unknowns are accepted.
    bool satisfies(const std::vector<Relation> &relations, const SolutionMap &candidate) const;

    OracleOptions options_;
    std::mt19937 rng_;
};

} // namespace branch_eqs

#endif // POLYNOMIAL_ORACLE_HPP
