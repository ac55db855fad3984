#include "polynomial_oracle.hpp"

#include "algebraic_system.hpp"
#include "solution_polisher.hpp"
#include "units.hpp"
#include "univariate_solver.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <optional>
#include <stdexcept>

namespace branch_eqs {

namespace {

constexpr int kMaxEliminationDepth = 32;

std::vector<Variable>
unknowns_in(const Polynomial<double> &p, const std::set<Variable> &unknown_set) {
    std::vector<Variable> result;
    for (const auto &v : p.variables()) {
        if (unknown_set.count(v) > 0) { result.push_back(v); }
    }
    return result;
}

bool
only_units(const Polynomial<double> &p) {
    for (const auto &v : p.variables()) {
        if (!v.is_unit) { return false; }
    }
    return true;
}

// Every monomial has total degree at most one in the unknowns
bool
is_linear(const std::vector<Polynomial<double>> &polys, const std::set<Variable> &unknown_set) {
    for (const auto &p : polys) {
        for (const auto &m : p.monomials) {
            int degree = 0;
            for (const auto &pair : m.vars) {
                if (unknown_set.count(pair.first) == 0) { continue; }
                if (pair.second < 0) { return false; }
                degree += pair.second;
            }
            if (degree > 1) { return false; }
        }
    }
    return true;
}

std::vector<Variable>
without(const std::vector<Variable> &unknowns, const Variable &var) {
    std::vector<Variable> result;
    for (const auto &v : unknowns) {
        if (v != var) { result.push_back(v); }
    }
    return result;
}

// Sum of |terms| of p at the numeric values in sub, used as the scale for residual snapping
double
absolute_scale(const Polynomial<double> &p, const SolutionMap &sub) {
    double total = 0.0;
    for (const auto &m : p.monomials) {
        double term = std::abs(m.coeff);
        for (const auto &pair : m.vars) {
            auto it = sub.find(pair.first);
            if (it == sub.end() || !it->second.is_constant()) { continue; }
            term *= std::pow(std::abs(it->second.constant_value()), pair.second);
        }
        total += term;
    }
    return total;
}

// Substitutes sub into p and returns the numerator. A leftover constant that is
// round-off relative to the substituted terms is snapped to zero.
Polynomial<double>
reduce(const Polynomial<double> &p, const SolutionMap &sub, double residual_tolerance) {
    Expression const substituted = Expression(p).substitute(sub);
    Polynomial<double> result = substituted.numerator;
    if (!result.is_zero() && substituted.is_constant()) {
        double const scale = absolute_scale(p, sub) / std::abs(substituted.denominator.constant_term());
        if (std::abs(result.constant_term()) <= residual_tolerance * scale) { return Polynomial<double>(); }
    }
    return result;
}

// Rewrites a product of unit tags over the base dimensions. Returns the scale factor.
double
to_base_units(std::map<Variable, int> &exponents) {
    double scale = 1.0;
    std::map<Variable, int> base;
    for (const auto &pair : exponents) {
        const UnitDefinition *def = find_unit(pair.first.name);
        if (def == nullptr) {
            base[pair.first] += pair.second;
            continue;
        }
        scale *= std::pow(def->scale, pair.second);
        for (const auto &dim : def->dimension) { base[Variable(dim.first, true)] += dim.second * pair.second; }
    }
    exponents.clear();
    for (const auto &pair : base) {
        if (pair.second != 0) { exponents.insert(pair); }
    }
    return scale;
}

// Closed form roots of a * var^n + b = 0 where a and b are single terms in unit tags.
// Returns nullopt when p does not have that shape or the unit part has no n-th root.
std::optional<std::vector<Expression>>
binomial_roots(const Polynomial<double> &p, const Variable &var) {
    std::vector<Polynomial<double>> const coeffs = p.coefficients_in(var);
    size_t const n = coeffs.size() - 1;
    if (n == 0) { return std::nullopt; }
    for (size_t k = 1; k < n; ++k) {
        if (!coeffs[k].is_zero()) { return std::nullopt; }
    }
    if (coeffs[n].monomials.size() != 1 || coeffs[0].monomials.size() > 1) { return std::nullopt; }
    if (!only_units(coeffs[n]) || !only_units(coeffs[0])) { return std::nullopt; }
    if (coeffs[0].is_zero()) { return std::vector<Expression>{ Expression(0.0) }; }

    const Monomial<double> &a = coeffs[n].monomials.front();
    const Monomial<double> &b = coeffs[0].monomials.front();
    double ratio = -b.coeff / a.coeff;

    std::map<Variable, int> exponents = b.vars;
    for (const auto &pair : a.vars) {
        exponents[pair.first] -= pair.second;
        if (exponents[pair.first] == 0) { exponents.erase(pair.first); }
    }

    int const degree = static_cast<int>(n);
    bool const divisible = std::all_of(exponents.begin(), exponents.end(), [degree](const auto &pair) {
        return pair.second % degree == 0;
    });
    if (!divisible) {
        // m / g0 has no square root as written, but s^2 / 9.80665 does
        ratio *= to_base_units(exponents);
    }

    Monomial<double> up(1.0);
    Monomial<double> down(1.0);
    for (const auto &pair : exponents) {
        if (pair.second % degree != 0) { return std::nullopt; }
        if (pair.second > 0) {
            up.vars[pair.first] = pair.second / degree;
        } else {
            down.vars[pair.first] = -pair.second / degree;
        }
    }
    Expression const unit_part{ Polynomial<double>(up), Polynomial<double>(down) };

    if (degree % 2 == 0) {
        if (ratio < 0.0) { return std::vector<Expression>{}; }
        double const root = std::pow(ratio, 1.0 / degree);
        return std::vector<Expression>{ Expression(-root) * unit_part, Expression(root) * unit_part };
    }
    double const root = std::copysign(std::pow(std::abs(ratio), 1.0 / degree), ratio);
    return std::vector<Expression>{ Expression(root) * unit_part };
}

} // namespace

PolynomialOracle::PolynomialOracle(OracleOptions options)
  : options_(options)
  , rng_(options.random_seed) {}

Expression
PolynomialOracle::simplify(const Expression &expr) const {
    return Expression(expr.numerator, expr.denominator);
}

std::set<Variable>
PolynomialOracle::free_variables(const Expression &expr) const {
    std::set<Variable> result;
    for (const auto &v : expr.variables()) {
        if (!v.is_unit) { result.insert(v); }
    }
    return result;
}

SolutionSet
PolynomialOracle::solve(const std::vector<Relation> &relations, const std::vector<Variable> &unknowns) {
    if (unknowns.empty()) { return SolutionSet::indeterminate(); }

    std::vector<Polynomial<double>> polys;
    for (const auto &relation : relations) {
        Expression const difference = simplify(relation.lhs - relation.rhs);
        if (!difference.is_zero()) { polys.push_back(difference.numerator); }
    }
    if (polys.empty()) { return SolutionSet::indeterminate(); }

    std::set<Variable> const unknown_set(unknowns.begin(), unknowns.end());
    SolutionSet result;
    if (is_linear(polys, unknown_set)) {
        result = solve_linear(polys, unknowns);
    } else {
        Elimination const elimination = eliminate(polys, unknowns, 0);
        switch (elimination.outcome) {
            case Outcome::Inconsistent:
                result = SolutionSet::none();
                break;
            case Outcome::Unknown:
                result = SolutionSet::indeterminate();
                break;
            case Outcome::Solved:
                result = SolutionSet::of(elimination.solutions);
                break;
        }
    }

    if (result.kind != SolutionKind::Solved) {
        if (options_.verbose) {
            std::cout << "  [PolynomialOracle] "
                      << (result.kind == SolutionKind::NoSolution ? "No solution" : "Indeterminate") << " for "
                      << relations.size() << " relation(s)." << std::endl;
        }
        return result;
    }

    std::vector<SolutionMap> verified;
    for (const auto &candidate : result.solutions) {
        if (!satisfies(relations, candidate)) {
            if (options_.verbose) { std::cout << "  [PolynomialOracle] Rejected a candidate that fails verification." << std::endl; }
            continue;
        }
        if (std::find(verified.begin(), verified.end(), candidate) == verified.end()) { verified.push_back(candidate); }
    }
    if (options_.verbose) {
        std::cout << "  [PolynomialOracle] " << verified.size() << " candidate(s) for " << relations.size()
                  << " relation(s)." << std::endl;
    }
    return SolutionSet::of(std::move(verified));
}

SolutionSet
PolynomialOracle::solve_linear(const std::vector<Polynomial<double>> &polys,
                               const std::vector<Variable> &unknowns) const {
    const size_t rows = polys.size();
    const size_t cols = unknowns.size();

    // A * unknowns = b
    std::vector<std::vector<Expression>> A(rows, std::vector<Expression>(cols));
    std::vector<Expression> b(rows);
    for (size_t i = 0; i < rows; ++i) {
        for (const auto &m : polys[i].monomials) {
            Monomial<double> rest = m;
            bool placed = false;
            for (size_t j = 0; j < cols; ++j) {
                if (m.degree_in(unknowns[j]) != 1) { continue; }
                rest.vars.erase(unknowns[j]);
                A[i][j] += Expression(rest);
                placed = true;
                break;
            }
            if (!placed) { b[i] -= Expression(rest); }
        }
    }

    double a_scale = 0.0;
    double b_scale = 1.0;
    for (size_t i = 0; i < rows; ++i) {
        for (size_t j = 0; j < cols; ++j) {
            if (A[i][j].is_constant()) { a_scale = std::max(a_scale, std::abs(A[i][j].constant_value())); }
        }
        if (b[i].is_constant()) { b_scale = std::max(b_scale, std::abs(b[i].constant_value())); }
    }

    std::vector<std::pair<size_t, size_t>> pivots; // (row, column)
    size_t row = 0;
    for (size_t col = 0; col < cols && row < rows; ++col) {
        // Prefer the largest numeric pivot; fall back to the first symbolic one
        std::optional<size_t> pivot;
        double best = 0.0;
        for (size_t r = row; r < rows; ++r) {
            if (A[r][col].is_zero()) { continue; }
            if (A[r][col].is_constant()) {
                double const magnitude = std::abs(A[r][col].constant_value());
                if (magnitude <= options_.zero_tolerance * a_scale) {
                    A[r][col] = Expression();
                    continue;
                }
                if (magnitude > best) {
                    best = magnitude;
                    pivot = r;
                }
            } else if (!pivot.has_value()) {
                pivot = r;
            }
        }
        if (!pivot.has_value()) { continue; }

        std::swap(A[row], A[*pivot]);
        std::swap(b[row], b[*pivot]);

        Expression const p = A[row][col];
        for (size_t j = 0; j < cols; ++j) { A[row][j] = simplify(A[row][j] / p); }
        b[row] = simplify(b[row] / p);

        for (size_t r = 0; r < rows; ++r) {
            if (r == row || A[r][col].is_zero()) { continue; }
            Expression const factor = A[r][col];
            for (size_t j = 0; j < cols; ++j) { A[r][j] = simplify(A[r][j] - factor * A[row][j]); }
            A[r][col] = Expression();
            b[r] = simplify(b[r] - factor * b[row]);
        }
        pivots.emplace_back(row, col);
        ++row;
    }

    for (size_t r = row; r < rows; ++r) {
        if (b[r].is_zero()) { continue; }
        if (b[r].is_constant() && std::abs(b[r].constant_value()) <= options_.zero_tolerance * b_scale) { continue; }
        if (!is_quantity(b[r])) { return SolutionSet::indeterminate(); }
        if (options_.verbose) { std::cout << "  [PolynomialOracle] Inconsistent linear system: 0 = " << b[r] << std::endl; }
        return SolutionSet::none();
    }
    if (pivots.empty()) { return SolutionSet::indeterminate(); }

    SolutionMap solution;
    for (const auto &entry : pivots) {
        Expression value = b[entry.first];
        for (size_t j = 0; j < cols; ++j) {
            if (j == entry.second || A[entry.first][j].is_zero()) { continue; }
            value -= A[entry.first][j] * Expression(unknowns[j]);
        }
        solution[unknowns[entry.second]] = simplify(value);
    }
    return SolutionSet::of({ solution });
}

PolynomialOracle::Elimination
PolynomialOracle::eliminate(const std::vector<Polynomial<double>> &polys,
                            const std::vector<Variable> &unknowns,
                            int depth) {
    std::set<Variable> const unknown_set(unknowns.begin(), unknowns.end());

    std::vector<Polynomial<double>> active;
    bool has_parameters = false;
    for (const auto &p : polys) {
        if (p.is_zero()) { continue; }
        if (unknowns_in(p, unknown_set).empty()) {
            // A nonzero quantity equal to zero
            if (only_units(p)) { return Elimination{ Outcome::Inconsistent, {} }; }
            has_parameters = true;
            continue;
        }
        active.push_back(p);
    }
    if (active.empty()) {
        if (has_parameters) { return Elimination{ Outcome::Unknown, {} }; }
        return Elimination{ Outcome::Solved, { SolutionMap{} } };
    }
    if (depth > kMaxEliminationDepth) { return Elimination{ Outcome::Unknown, {} }; }

    // Pure powers with unit coefficients, solved in closed form
    for (size_t i = 0; i < active.size(); ++i) {
        std::vector<Variable> const vars = unknowns_in(active[i], unknown_set);
        if (vars.size() != 1) { continue; }
        std::optional<std::vector<Expression>> values = binomial_roots(active[i], vars.front());
        if (!values.has_value()) { continue; }
        if (values->empty()) { return Elimination{ Outcome::Inconsistent, {} }; }
        return branch_on_values(active, i, vars.front(), *values, unknowns, depth);
    }

    // Univariate numeric polynomials
    for (size_t i = 0; i < active.size(); ++i) {
        std::set<Variable> const all_vars = active[i].variables();
        if (all_vars.size() != 1 || unknown_set.count(*all_vars.begin()) == 0) { continue; }
        const Variable &var = *all_vars.begin();

        std::vector<double> coeffs;
        for (const auto &c : active[i].coefficients_in(var)) { coeffs.push_back(c.constant_term()); }
        std::vector<double> const roots = univariate_solver::find_real_roots(coeffs, options_);
        if (options_.verbose) {
            std::cout << "  [PolynomialOracle] " << roots.size() << " real root(s) for " << var << " from "
                      << active[i] << std::endl;
        }
        if (roots.empty()) { return Elimination{ Outcome::Inconsistent, {} }; }
        std::vector<Expression> const values(roots.begin(), roots.end());
        return branch_on_values(active, i, var, values, unknowns, depth);
    }

    // An unknown that appears linearly, numeric coefficient first
    for (int pass = 0; pass < 2; ++pass) {
        for (size_t i = 0; i < active.size(); ++i) {
            for (const auto &var : unknowns_in(active[i], unknown_set)) {
                if (active[i].degree_in(var) != 1) { continue; }
                std::vector<Polynomial<double>> const coeffs = active[i].coefficients_in(var);
                const Polynomial<double> &slope = coeffs[1];
                if (pass == 0 && !slope.is_constant()) { continue; }

                Expression const value = Expression(-coeffs[0]) / Expression(slope);
                Elimination solved = substitute_linear(active, i, var, value, unknowns, depth);
                if (slope.is_constant() || only_units(slope)) { return solved; }

                // The slope itself may vanish: slope = 0 and offset = 0
                std::vector<Polynomial<double>> degenerate;
                for (size_t j = 0; j < active.size(); ++j) {
                    if (j != i) { degenerate.push_back(active[j]); }
                }
                degenerate.push_back(slope);
                degenerate.push_back(coeffs[0]);
                Elimination const vanishing = eliminate(degenerate, unknowns, depth + 1);

                if (solved.outcome == Outcome::Unknown || vanishing.outcome == Outcome::Unknown) {
                    return Elimination{ Outcome::Unknown, {} };
                }
                if (vanishing.outcome == Outcome::Solved) {
                    solved.outcome = Outcome::Solved;
                    solved.solutions.insert(solved.solutions.end(), vanishing.solutions.begin(), vanishing.solutions.end());
                }
                return solved;
            }
        }
    }

    return newton_fallback(active, unknowns);
}

PolynomialOracle::Elimination
PolynomialOracle::branch_on_values(const std::vector<Polynomial<double>> &polys,
                                   size_t solved_index,
                                   const Variable &var,
                                   const std::vector<Expression> &values,
                                   const std::vector<Variable> &unknowns,
                                   int depth) {
    std::vector<Variable> const remaining = without(unknowns, var);
    Elimination result{ Outcome::Inconsistent, {} };
    for (const auto &value : values) {
        SolutionMap const sub{ { var, value } };
        std::vector<Polynomial<double>> reduced;
        try {
            for (size_t j = 0; j < polys.size(); ++j) {
                if (j != solved_index) { reduced.push_back(reduce(polys[j], sub, options_.residual_tolerance)); }
            }
        } catch (const std::invalid_argument &) {
            // value hits a pole of another relation
            continue;
        }

        Elimination inner = eliminate(reduced, remaining, depth + 1);
        if (inner.outcome == Outcome::Unknown) { return Elimination{ Outcome::Unknown, {} }; }
        if (inner.outcome == Outcome::Inconsistent) { continue; }
        for (auto &solution : inner.solutions) {
            solution[var] = value;
            result.solutions.push_back(std::move(solution));
        }
        result.outcome = Outcome::Solved;
    }
    return result;
}

PolynomialOracle::Elimination
PolynomialOracle::substitute_linear(const std::vector<Polynomial<double>> &polys,
                                    size_t solved_index,
                                    const Variable &var,
                                    const Expression &value,
                                    const std::vector<Variable> &unknowns,
                                    int depth) {
    SolutionMap const sub{ { var, value } };
    std::vector<Polynomial<double>> reduced;
    for (size_t j = 0; j < polys.size(); ++j) {
        if (j != solved_index) { reduced.push_back(reduce(polys[j], sub, options_.residual_tolerance)); }
    }

    Elimination inner = eliminate(reduced, without(unknowns, var), depth + 1);
    if (inner.outcome != Outcome::Solved) { return inner; }

    Elimination result{ Outcome::Inconsistent, {} };
    for (auto &solution : inner.solutions) {
        try {
            solution[var] = simplify(value.substitute(solution));
        } catch (const std::invalid_argument &) {
            // The slope vanishes on this candidate
            continue;
        }
        result.solutions.push_back(std::move(solution));
        result.outcome = Outcome::Solved;
    }
    return result;
}

PolynomialOracle::Elimination
PolynomialOracle::newton_fallback(const std::vector<Polynomial<double>> &polys, const std::vector<Variable> &unknowns) {
    std::set<Variable> present;
    for (const auto &p : polys) {
        for (const auto &v : p.variables()) {
            if (v.is_unit || std::find(unknowns.begin(), unknowns.end(), v) == unknowns.end()) {
                return Elimination{ Outcome::Unknown, {} };
            }
            present.insert(v);
        }
    }
    if (polys.size() < present.size()) { return Elimination{ Outcome::Unknown, {} }; }

    AlgebraicSystem system;
    system.unknowns.assign(present.begin(), present.end());
    system.polynomials = polys;
    SolutionPolisher polisher(system, options_.verbose);

    std::uniform_real_distribution<double> start(-10.0, 10.0);
    std::vector<PolynomialSolutionMapReal> found;
    for (int attempt = 0; attempt < options_.newton_starts; ++attempt) {
        PolynomialSolutionMapReal guess;
        for (const auto &v : system.unknowns) { guess[v] = start(rng_); }
        std::vector<double> residuals;
        if (!polisher.polish(guess, residuals, 50)) { continue; }

        bool duplicate = false;
        for (const auto &known : found) {
            bool same = true;
            for (const auto &v : system.unknowns) {
                double const a = known.at(v);
                double const b = guess.at(v);
                if (std::abs(a - b) > options_.root_merge_tolerance * std::max(1.0, std::abs(a))) {
                    same = false;
                    break;
                }
            }
            if (same) {
                duplicate = true;
                break;
            }
        }
        if (!duplicate) { found.push_back(guess); }
    }

    if (options_.verbose) {
        std::cout << "  [PolynomialOracle] Newton fallback found " << found.size() << " solution(s) from "
                  << options_.newton_starts << " starts." << std::endl;
    }
    if (found.empty()) { return Elimination{ Outcome::Unknown, {} }; }

    std::sort(found.begin(), found.end());
    Elimination result{ Outcome::Solved, {} };
    for (const auto &point : found) {
        SolutionMap solution;
        for (const auto &pair : point) { solution[pair.first] = Expression(pair.second); }
        result.solutions.push_back(solution);
    }
    return result;
}

bool
PolynomialOracle::satisfies(const std::vector<Relation> &relations, const SolutionMap &candidate) const {
    for (const auto &pair : candidate) {
        if (!free_variables(pair.second).empty()) { return true; }
    }

    for (const auto &relation : relations) {
        double lhs = 0.0;
        double rhs = 0.0;
        try {
            Expression const l = relation.lhs.substitute(candidate);
            Expression const r = relation.rhs.substitute(candidate);
            if (!is_quantity(l) || !is_quantity(r)) { continue; }
            lhs = to_si_value(l);
            rhs = to_si_value(r);
        } catch (const std::invalid_argument &) {
            return false;
        }
        if (std::isnan(lhs) || std::isnan(rhs)) { return false; }
        if (std::abs(lhs - rhs) > options_.residual_tolerance * std::max(1.0, std::abs(lhs) + std::abs(rhs))) {
            return false;
        }
    }
    return true;
}

} // namespace branch_eqs
