#ifndef POLYNOMIAL_HPP
#define POLYNOMIAL_HPP

#include <algorithm>   // For std::sort, std::min
#include <cmath>       // For std::abs, std::pow, std::isnan
#include <iostream>
#include <limits>      // For numeric limits in evaluate
#include <map>         // For simplifying monomials
#include <set>         // For variable sets
#include <sstream>     // For operator<< implementations
#include <stdexcept>   // For potential errors
#include <string>
#include <type_traits> // For is_floating_point_v
#include <utility>     // For std::pair
#include <vector>

namespace branch_eqs {

// Forward declarations
template<typename Coeff>
struct Monomial;
template<typename Coeff>
struct Polynomial;
template<typename Coeff>
struct RationalFunction;

//-----------------------------------------------------------------------------
// Variable Struct
//-----------------------------------------------------------------------------
// A symbol of the algebra. Either an unknown quantity of an equation system or,
// when is_unit is set, a physical unit tag such as "m" or "kg".
struct Variable {
    std::string name;
    bool is_unit = false;

    // Constructor
    Variable(std::string n = "", bool unit = false)
      : name(std::move(n))
      , is_unit(unit) {}

    // Comparison operators (needed for sorting/maps)
    bool operator==(const Variable &other) const { return name == other.name && is_unit == other.is_unit; }
    bool operator!=(const Variable &other) const { return !(*this == other); }

    // Order primarily by name, then unit status for consistent sorting
    bool operator<(const Variable &other) const {
        if (name != other.name) { return name < other.name; }
        return is_unit < other.is_unit;
    }
};

// Output stream operator for Variable
inline std::ostream &
operator<<(std::ostream &os, const Variable &var) {
    os << var.name;
    return os;
}

//-----------------------------------------------------------------------------
// Monomial Struct
//-----------------------------------------------------------------------------
// Using a map for variables ensures uniqueness and sorted order automatically
template<typename Coeff>
struct Monomial {
    std::map<Variable, int> vars; // Map Variable to its exponent
    Coeff coeff = Coeff{};        // Default initialize coefficient (e.g., 0 for int/double)

    // Default constructor
    Monomial() = default;

    // Constructor from coefficient and variable list (vector of pairs)
    Monomial(Coeff c, const std::vector<std::pair<Variable, int>> &var_list)
      : coeff(c) {
        for (const auto &p : var_list) {
            if (p.second == 0) { continue; }
            vars[p.first] += p.second;
            if (vars[p.first] == 0) { vars.erase(p.first); }
        }
    }

    // Constructor for a single variable raised to a power
    Monomial(Coeff c, const Variable &var, int exponent = 1)
      : coeff(c) {
        if (exponent != 0) { vars[var] = exponent; }
    }

    // Constructor for a constant term
    explicit Monomial(Coeff c)
      : coeff(c) {}

    // Evaluate the monomial given values for variables
    template<typename T>
    T evaluate(const std::map<Variable, T> &values) const {
        T result = T(coeff);
        for (const auto &var_pair : vars) {
            const Variable &v = var_pair.first;
            int const exponent = var_pair.second;

            auto it = values.find(v);
            if (it == values.end()) {
                std::stringstream ss;
                ss << "Variable '" << v << "' not found in values map during evaluation.";
                throw std::runtime_error(ss.str());
            }

            if (exponent < 0) {
                const T base_val = it->second;
                if (base_val == T(0)) {
                    throw std::runtime_error("Division by zero in Monomial::evaluate with negative exponent.");
                }
                result /= std::pow(base_val, -exponent);
            } else {
                result *= std::pow(it->second, exponent);
            }
        }
        return result;
    }

    // Check if two monomials have the same variable parts (ignoring coefficients)
    [[nodiscard]] bool hasSameVariables(const Monomial<Coeff> &other) const { return vars == other.vars; }

    // Exponent of var in this monomial, zero when absent
    [[nodiscard]] int degree_in(const Variable &var) const {
        auto it = vars.find(var);
        return it == vars.end() ? 0 : it->second;
    }

    [[nodiscard]] bool has_units() const {
        return std::any_of(vars.begin(), vars.end(), [](const auto &p) { return p.first.is_unit; });
    }

    // Multiplication operator
    Monomial<Coeff> operator*(const Monomial<Coeff> &other) const {
        Monomial<Coeff> result;
        result.coeff = coeff * other.coeff;
        result.vars = vars;
        for (const auto &pair : other.vars) {
            result.vars[pair.first] += pair.second;
            if (result.vars[pair.first] == 0) { result.vars.erase(pair.first); }
        }
        return result;
    }

    bool operator==(const Monomial<Coeff> &other) const { return coeff == other.coeff && vars == other.vars; }
    bool operator!=(const Monomial<Coeff> &other) const { return !(*this == other); }
};

// Output stream operator for Monomial
template<typename Coeff>
std::ostream &
operator<<(std::ostream &os, const Monomial<Coeff> &m) {
    if (m.coeff == Coeff{}) {
        os << "0";
        return os;
    }

    os << m.coeff;
    for (const auto &pair : m.vars) {
        os << "*" << pair.first;
        if (pair.second != 1) { os << "^" << pair.second; }
    }
    return os;
}

//-----------------------------------------------------------------------------
// Polynomial Struct
//-----------------------------------------------------------------------------
template<typename Coeff>
struct Polynomial {
    std::vector<Monomial<Coeff>> monomials;

    // Default constructor
    Polynomial() = default;

    // Constructor from a single monomial
    Polynomial(const Monomial<Coeff> &m) {
        if (m.coeff != Coeff{}) { // Don't add zero terms
            monomials.push_back(m);
        }
    }

    // Constructor from a single variable (assumes coefficient 1)
    Polynomial(const Variable &var) { monomials.push_back(Monomial<Coeff>(Coeff(1), var, 1)); }

    // Constructor from a vector of monomials
    explicit Polynomial(std::vector<Monomial<Coeff>> m_list)
      : monomials(std::move(m_list)) {
        simplify();
    }

    // Simplify the polynomial: combine like terms and remove zero terms.
    // For floating point coefficients a combined term that is only rounding
    // noise relative to the terms that produced it is dropped as well.
    void simplify() {
        if (monomials.empty()) { return; }

        struct Accumulator {
            Coeff sum = Coeff{};
            double magnitude = 0.0;
        };
        std::map<std::map<Variable, int>, Accumulator> term_map;

        for (const auto &m : monomials) {
            if (m.coeff == Coeff{}) { continue; }
            auto &acc = term_map[m.vars];
            acc.sum += m.coeff;
            if constexpr (std::is_floating_point_v<Coeff>) { acc.magnitude += std::abs(m.coeff); }
        }

        monomials.clear();
        for (const auto &pair : term_map) {
            if (pair.second.sum == Coeff{}) { continue; }
            if constexpr (std::is_floating_point_v<Coeff>) {
                constexpr double cancellation_tolerance = 64.0 * std::numeric_limits<double>::epsilon();
                if (std::abs(pair.second.sum) <= cancellation_tolerance * pair.second.magnitude) { continue; }
            }
            Monomial<Coeff> term;
            term.vars = pair.first;
            term.coeff = pair.second.sum;
            monomials.push_back(term);
        }

        // Sort final terms for consistent output based on variable map comparison
        std::sort(monomials.begin(), monomials.end(), [](const Monomial<Coeff> &a, const Monomial<Coeff> &b) {
            return a.vars < b.vars;
        });
    }

    [[nodiscard]] bool is_zero() const { return monomials.empty(); }

    // True when no monomial carries a variable (unit tags included)
    [[nodiscard]] bool is_constant() const {
        return std::all_of(monomials.begin(), monomials.end(), [](const Monomial<Coeff> &m) { return m.vars.empty(); });
    }

    // Coefficient of the variable-free term
    [[nodiscard]] Coeff constant_term() const {
        for (const auto &m : monomials) {
            if (m.vars.empty()) { return m.coeff; }
        }
        return Coeff{};
    }

    [[nodiscard]] std::set<Variable> variables() const {
        std::set<Variable> result;
        for (const auto &m : monomials) {
            for (const auto &pair : m.vars) { result.insert(pair.first); }
        }
        return result;
    }

    [[nodiscard]] int degree_in(const Variable &var) const {
        int degree = 0;
        for (const auto &m : monomials) { degree = std::max(degree, m.degree_in(var)); }
        return degree;
    }

    /**
     * @brief Splits the polynomial into powers of var.
     *
     * @return Element k is the polynomial multiplying var^k. The result has
     *         degree_in(var) + 1 entries.
     */
    [[nodiscard]] std::vector<Polynomial<Coeff>> coefficients_in(const Variable &var) const {
        std::vector<Polynomial<Coeff>> result(static_cast<size_t>(degree_in(var)) + 1);
        for (const auto &m : monomials) {
            int const exponent = m.degree_in(var);
            if (exponent < 0) {
                std::stringstream ss;
                ss << "Negative power of '" << var << "' cannot be split into coefficients.";
                throw std::invalid_argument(ss.str());
            }
            Monomial<Coeff> rest = m;
            rest.vars.erase(var);
            result[static_cast<size_t>(exponent)].monomials.push_back(rest);
        }
        for (auto &p : result) { p.simplify(); }
        return result;
    }

    // Addition operator
    Polynomial<Coeff> operator+(const Polynomial<Coeff> &other) const {
        Polynomial<Coeff> result = *this;
        result.monomials.insert(result.monomials.end(), other.monomials.begin(), other.monomials.end());
        result.simplify();
        return result;
    }
    Polynomial<Coeff> operator+(const Monomial<Coeff> &m) const {
        Polynomial<Coeff> result = *this;
        result.monomials.push_back(m);
        result.simplify();
        return result;
    }

    // Subtraction operator
    Polynomial<Coeff> operator-(const Polynomial<Coeff> &other) const {
        Polynomial<Coeff> result = *this;
        for (const auto &m : other.monomials) {
            Monomial<Coeff> negated_m = m;
            negated_m.coeff = -m.coeff;
            result.monomials.push_back(negated_m);
        }
        result.simplify();
        return result;
    }
    Polynomial<Coeff> operator-(const Monomial<Coeff> &m) const {
        Polynomial<Coeff> result = *this;
        Monomial<Coeff> negated_m = m;
        negated_m.coeff = -m.coeff;
        result.monomials.push_back(negated_m);
        result.simplify();
        return result;
    }

    // Unary negation
    Polynomial<Coeff> operator-() const {
        Polynomial<Coeff> result = *this;
        for (auto &m : result.monomials) { m.coeff = -m.coeff; }
        return result;
    }

    // Multiplication operator
    Polynomial<Coeff> operator*(const Polynomial<Coeff> &other) const {
        Polynomial<Coeff> result;
        if (monomials.empty() || other.monomials.empty()) { return result; }

        for (const auto &m1 : monomials) {
            for (const auto &m2 : other.monomials) { result.monomials.push_back(m1 * m2); }
        }
        result.simplify();
        return result;
    }
    Polynomial<Coeff> operator*(const Monomial<Coeff> &m) const {
        Polynomial<Coeff> result;
        if (monomials.empty() || m.coeff == Coeff{}) { return result; }
        for (const auto &m1 : monomials) { result.monomials.push_back(m1 * m); }
        result.simplify();
        return result;
    }
    Polynomial<Coeff> operator*(const Coeff &scalar) const {
        if (scalar == Coeff{}) { return Polynomial<Coeff>(); }
        Polynomial<Coeff> result = *this;
        for (auto &m : result.monomials) { m.coeff *= scalar; }
        return result;
    }

    // Structural equality; both sides are expected to be simplified
    bool operator==(const Polynomial<Coeff> &other) const { return monomials == other.monomials; }
    bool operator!=(const Polynomial<Coeff> &other) const { return !(*this == other); }

    // Evaluate the polynomial by summing the evaluation of its monomials
    template<typename T>
    [[nodiscard]] T evaluate(const std::map<Variable, T> &values) const {
        T total = T(0.0);
        for (const auto &m : monomials) { total += m.template evaluate<T>(values); }
        return total;
    }

    /**
     * @brief Substitutes variables in the polynomial with given rational function expressions.
     *
     * @param replacements A map where keys are variables to be replaced and values are their RationalFunction
     * replacements.
     * @return RationalFunction<Coeff> The resulting rational function after substitution.
     *         Note: Substitution might turn a polynomial into a rational function.
     */
    [[nodiscard]] RationalFunction<Coeff> substitute(
      const std::map<Variable, RationalFunction<Coeff>> &replacements) const {
        RationalFunction<Coeff> result_rf(Coeff(0));

        for (const auto &m : monomials) {
            Monomial<Coeff> kept(m.coeff);
            RationalFunction<Coeff> replaced(Coeff(1));

            for (const auto &var_pair : m.vars) {
                auto it = replacements.find(var_pair.first);
                if (it == replacements.end()) {
                    kept.vars[var_pair.first] = var_pair.second;
                    continue;
                }
                int const exponent = var_pair.second;
                RationalFunction<Coeff> rf_pow(Coeff(1));
                for (int i = 0; i < std::abs(exponent); ++i) { rf_pow = rf_pow * it->second; }
                replaced = exponent < 0 ? replaced / rf_pow : replaced * rf_pow;
            }
            result_rf = result_rf + replaced * RationalFunction<Coeff>(kept);
        }
        return result_rf;
    }

    /**
     * @brief Substitutes variables in the polynomial with given constant values.
     *
     * @param replacements A map where keys are variables to be replaced and values are their constant Coeff
     * replacements.
     * @return Polynomial<Coeff> The resulting polynomial after substitution.
     */
    [[nodiscard]] Polynomial<Coeff> substitute(const std::map<Variable, Coeff> &replacements) const {
        Polynomial<Coeff> result;
        for (const auto &m : monomials) {
            Monomial<Coeff> substituted_m;
            substituted_m.coeff = m.coeff;
            for (const auto &var_pair : m.vars) {
                auto it = replacements.find(var_pair.first);
                if (it == replacements.end()) {
                    substituted_m.vars[var_pair.first] = var_pair.second;
                    continue;
                }
                if (var_pair.second < 0 && it->second == Coeff{}) {
                    throw std::invalid_argument("Substituting zero into a negative power.");
                }
                substituted_m.coeff *= static_cast<Coeff>(std::pow(it->second, var_pair.second));
            }
            result.monomials.push_back(substituted_m);
        }
        result.simplify();
        return result;
    }

    // Method to compute the partial derivative with respect to a variable
    [[nodiscard]] Polynomial<Coeff> partial_derivative(const Variable &var_to_diff) const {
        Polynomial<Coeff> result;
        for (const auto &m : monomials) {
            auto it = m.vars.find(var_to_diff);
            if (it == m.vars.end()) { continue; }

            Monomial<Coeff> deriv_m;
            deriv_m.coeff = m.coeff * static_cast<Coeff>(it->second);
            deriv_m.vars = m.vars;
            deriv_m.vars[var_to_diff]--;
            if (deriv_m.vars[var_to_diff] == 0) { deriv_m.vars.erase(var_to_diff); }
            result.monomials.push_back(deriv_m);
        }
        result.simplify();
        return result;
    }
};

//-----------------------------------------------------------------------------
// Polynomial Free Operators
//-----------------------------------------------------------------------------

// Commutative scalar multiplication (scalar * Polynomial)
template<typename Coeff>
Polynomial<Coeff>
operator*(const Coeff &scalar, const Polynomial<Coeff> &p) {
    return p * scalar;
}

template<typename Coeff>
Polynomial<Coeff>
operator+(const Polynomial<Coeff> &p, const Coeff &c) {
    return p + Polynomial<Coeff>(Monomial<Coeff>(c));
}

template<typename Coeff>
Polynomial<Coeff>
operator+(const Coeff &c, const Polynomial<Coeff> &p) {
    return Polynomial<Coeff>(Monomial<Coeff>(c)) + p;
}

template<typename Coeff>
Polynomial<Coeff>
operator-(const Polynomial<Coeff> &p, const Coeff &c) {
    return p - Polynomial<Coeff>(Monomial<Coeff>(c));
}

template<typename Coeff>
Polynomial<Coeff>
operator-(const Coeff &c, const Polynomial<Coeff> &p) {
    return Polynomial<Coeff>(Monomial<Coeff>(c)) - p;
}

template<typename Coeff>
Polynomial<Coeff>
operator+(const Monomial<Coeff> &m, const Polynomial<Coeff> &p) {
    return p + m;
}

template<typename Coeff>
Polynomial<Coeff>
operator-(const Monomial<Coeff> &m, const Polynomial<Coeff> &p) {
    return Polynomial<Coeff>(m) - p;
}

template<typename Coeff>
Polynomial<Coeff>
operator*(const Monomial<Coeff> &m, const Polynomial<Coeff> &p) {
    return p * m;
}

// Monomial - Monomial -> Polynomial
template<typename Coeff>
inline Polynomial<Coeff>
operator-(const Monomial<Coeff> &lhs, const Monomial<Coeff> &rhs) {
    Monomial<Coeff> neg_rhs = rhs;
    neg_rhs.coeff = -rhs.coeff;
    return Polynomial<Coeff>({ lhs, neg_rhs });
}

// Monomial + Monomial -> Polynomial
template<typename Coeff>
inline Polynomial<Coeff>
operator+(const Monomial<Coeff> &lhs, const Monomial<Coeff> &rhs) {
    return Polynomial<Coeff>({ lhs, rhs });
}

// Monomial * Variable -> Monomial
template<typename Coeff>
inline Monomial<Coeff>
operator*(Monomial<Coeff> m, const Variable &var) {
    m.vars[var]++;
    if (m.vars[var] == 0) { m.vars.erase(var); }
    return m;
}

template<typename Coeff>
inline Monomial<Coeff>
operator*(const Variable &var, Monomial<Coeff> m) {
    return m * var;
}

// Polynomial * Variable -> Polynomial
template<typename Coeff>
inline Polynomial<Coeff>
operator*(const Polynomial<Coeff> &p, const Variable &var) {
    return p * Monomial<Coeff>(Coeff(1), var, 1);
}

template<typename Coeff>
inline Polynomial<Coeff>
operator*(const Variable &var, const Polynomial<Coeff> &p) {
    return p * var;
}

template<typename Coeff>
inline Polynomial<Coeff>
operator+(const Polynomial<Coeff> &p, const Variable &var) {
    return p + Monomial<Coeff>(Coeff(1), var, 1);
}

template<typename Coeff>
inline Polynomial<Coeff>
operator+(const Variable &var, const Polynomial<Coeff> &p) {
    return p + var;
}

template<typename Coeff>
inline Polynomial<Coeff>
operator-(const Polynomial<Coeff> &p, const Variable &var) {
    return p - Monomial<Coeff>(Coeff(1), var, 1);
}

template<typename Coeff>
inline Polynomial<Coeff>
operator-(const Variable &var, const Polynomial<Coeff> &p) {
    return Polynomial<Coeff>(var) - p;
}

// Output stream operator for Polynomial
template<typename Coeff>
std::ostream &
operator<<(std::ostream &os, const Polynomial<Coeff> &p) {
    if (p.monomials.empty()) {
        os << "0";
        return os;
    }

    bool first_term = true;
    for (const auto &m : p.monomials) {
        if (!first_term) { os << " + "; }
        os << m;
        first_term = false;
    }
    return os;
}

//-----------------------------------------------------------------------------
// RationalFunction Struct
//-----------------------------------------------------------------------------
template<typename Coeff>
struct RationalFunction {
    Polynomial<Coeff> numerator;
    Polynomial<Coeff> denominator;

  private:
    // Canonical form: monomial content shared by numerator and denominator is
    // cancelled (which also clears negative exponents) and the last denominator
    // term has coefficient one. Polynomial GCDs beyond monomials are not removed.
    void normalize() {
        numerator.simplify();
        denominator.simplify();
        if (denominator.monomials.empty()) {
            if (!numerator.monomials.empty()) {
                throw std::invalid_argument("RationalFunction denominator cannot be the zero polynomial.");
            }
            denominator = Polynomial<Coeff>(Monomial<Coeff>(Coeff(1)));
            return;
        }
        if (numerator.monomials.empty()) {
            denominator = Polynomial<Coeff>(Monomial<Coeff>(Coeff(1)));
            return;
        }

        std::map<Variable, int> shared;
        for (const Polynomial<Coeff> *p : { &numerator, &denominator }) {
            for (const auto &m : p->monomials) {
                for (const auto &pair : m.vars) { shared.emplace(pair.first, std::numeric_limits<int>::max()); }
            }
        }
        for (auto &entry : shared) {
            for (const Polynomial<Coeff> *p : { &numerator, &denominator }) {
                for (const auto &m : p->monomials) { entry.second = std::min(entry.second, m.degree_in(entry.first)); }
            }
        }
        for (const auto &entry : shared) {
            if (entry.second == 0) { continue; }
            for (Polynomial<Coeff> *p : { &numerator, &denominator }) {
                for (auto &m : p->monomials) {
                    m.vars[entry.first] -= entry.second;
                    if (m.vars[entry.first] == 0) { m.vars.erase(entry.first); }
                }
                p->simplify();
            }
        }

        const Coeff lead = denominator.monomials.back().coeff;
        if (lead != Coeff(1)) {
            for (auto &m : numerator.monomials) { m.coeff = m.coeff / lead; }
            for (auto &m : denominator.monomials) { m.coeff = m.coeff / lead; }
        }
    }

  public:
    // --- Constructors ---
    RationalFunction()
      : numerator()
      , denominator(Monomial<Coeff>(Coeff(1))) {}
    RationalFunction(Polynomial<Coeff> num, Polynomial<Coeff> den)
      : numerator(std::move(num))
      , denominator(std::move(den)) {
        normalize();
    }
    RationalFunction(const Polynomial<Coeff> &num)
      : numerator(num)
      , denominator(Monomial<Coeff>(Coeff(1))) {
        normalize();
    }
    RationalFunction(const Monomial<Coeff> &m)
      : numerator(m)
      , denominator(Monomial<Coeff>(Coeff(1))) {
        normalize();
    }
    RationalFunction(const Variable &v)
      : numerator(v)
      , denominator(Monomial<Coeff>(Coeff(1))) {}
    RationalFunction(const Coeff &c)
      : numerator(Monomial<Coeff>(c))
      , denominator(Monomial<Coeff>(Coeff(1))) {}

    [[nodiscard]] bool is_zero() const { return numerator.is_zero(); }

    // True when the expression carries no symbol at all, unit tags included
    [[nodiscard]] bool is_constant() const { return numerator.is_constant() && denominator.is_constant(); }

    // Value of a constant expression
    [[nodiscard]] Coeff constant_value() const {
        if (!is_constant()) { throw std::invalid_argument("RationalFunction is not a constant."); }
        return numerator.constant_term() / denominator.constant_term();
    }

    [[nodiscard]] std::set<Variable> variables() const {
        std::set<Variable> result = numerator.variables();
        std::set<Variable> const den_vars = denominator.variables();
        result.insert(den_vars.begin(), den_vars.end());
        return result;
    }

    // --- Evaluation ---
    template<typename T>
    [[nodiscard]] T evaluate(const std::map<Variable, T> &values) const {
        T num_val = numerator.template evaluate<T>(values);
        T den_val = denominator.template evaluate<T>(values);

        if (std::isnan(num_val) || std::isnan(den_val)) { return std::numeric_limits<T>::quiet_NaN(); }

        if (std::fabs(den_val) < std::numeric_limits<double>::epsilon()) {
            if (std::fabs(num_val) < std::numeric_limits<double>::epsilon()) {
                return std::numeric_limits<T>::quiet_NaN();
            }
            throw std::invalid_argument("Division by zero in RationalFunction::evaluate.");
        }
        return num_val / den_val;
    }

    // --- Operators ---
    RationalFunction<Coeff> operator+(const RationalFunction<Coeff> &other) const {
        Polynomial<Coeff> const new_num = numerator * other.denominator + other.numerator * denominator;
        Polynomial<Coeff> const new_den = denominator * other.denominator;
        return RationalFunction<Coeff>(new_num, new_den);
    }
    RationalFunction<Coeff> operator-(const RationalFunction<Coeff> &other) const {
        Polynomial<Coeff> const new_num = numerator * other.denominator - other.numerator * denominator;
        Polynomial<Coeff> const new_den = denominator * other.denominator;
        return RationalFunction<Coeff>(new_num, new_den);
    }
    RationalFunction<Coeff> operator*(const RationalFunction<Coeff> &other) const {
        Polynomial<Coeff> const new_num = numerator * other.numerator;
        Polynomial<Coeff> const new_den = denominator * other.denominator;
        return RationalFunction<Coeff>(new_num, new_den);
    }
    RationalFunction<Coeff> operator/(const RationalFunction<Coeff> &other) const {
        if (other.numerator.monomials.empty()) {
            throw std::invalid_argument("Division by zero RationalFunction (numerator is zero polynomial).");
        }
        Polynomial<Coeff> const new_num = numerator * other.denominator;
        Polynomial<Coeff> const new_den = denominator * other.numerator;
        return RationalFunction<Coeff>(new_num, new_den);
    }
    RationalFunction<Coeff> &operator+=(const RationalFunction<Coeff> &other) {
        *this = *this + other;
        return *this;
    }
    RationalFunction<Coeff> &operator-=(const RationalFunction<Coeff> &other) {
        *this = *this - other;
        return *this;
    }
    RationalFunction<Coeff> &operator*=(const RationalFunction<Coeff> &other) {
        *this = *this * other;
        return *this;
    }
    RationalFunction<Coeff> &operator/=(const RationalFunction<Coeff> &other) {
        *this = *this / other;
        return *this;
    }
    RationalFunction<Coeff> operator-() const { return RationalFunction<Coeff>(-numerator, denominator); }

    // Structural equality of the normalized forms
    bool operator==(const RationalFunction<Coeff> &other) const {
        return numerator == other.numerator && denominator == other.denominator;
    }
    bool operator!=(const RationalFunction<Coeff> &other) const { return !(*this == other); }

    /**
     * @brief Substitutes variables in the rational function with given rational function expressions.
     *
     * @param replacements A map where keys are variables to be replaced and values are their RationalFunction
     * replacements.
     * @return RationalFunction<Coeff> The resulting rational function after substitution.
     */
    [[nodiscard]] RationalFunction<Coeff> substitute(
      const std::map<Variable, RationalFunction<Coeff>> &replacements) const {
        RationalFunction<Coeff> subst_num_rf = numerator.substitute(replacements);
        RationalFunction<Coeff> subst_den_rf = denominator.substitute(replacements);
        return subst_num_rf / subst_den_rf;
    }

    /**
     * @brief Substitutes variables in the rational function with given constant values.
     *
     * @param replacements A map where keys are variables to be replaced and values are their constant Coeff
     * replacements.
     * @return RationalFunction<Coeff> The resulting rational function after substitution.
     */
    [[nodiscard]] RationalFunction<Coeff> substitute(const std::map<Variable, Coeff> &replacements) const {
        Polynomial<Coeff> new_num = numerator.substitute(replacements);
        Polynomial<Coeff> new_den = denominator.substitute(replacements);
        return RationalFunction<Coeff>(new_num, new_den);
    }
};

//-----------------------------------------------------------------------------
// Operator Overloads for Mixed Types (Promoting to RationalFunction)
//-----------------------------------------------------------------------------
// --- Addition ---
template<typename Coeff>
RationalFunction<Coeff>
operator+(const RationalFunction<Coeff> &rf, const Polynomial<Coeff> &poly) {
    Polynomial<Coeff> const new_num = rf.numerator + poly * rf.denominator;
    return RationalFunction<Coeff>(new_num, rf.denominator);
}
template<typename Coeff>
RationalFunction<Coeff>
operator+(const Polynomial<Coeff> &poly, const RationalFunction<Coeff> &rf) {
    return rf + poly;
}
template<typename Coeff>
RationalFunction<Coeff>
operator+(const RationalFunction<Coeff> &rf, const Monomial<Coeff> &m) {
    return rf + RationalFunction<Coeff>(m);
}
template<typename Coeff>
RationalFunction<Coeff>
operator+(const Monomial<Coeff> &m, const RationalFunction<Coeff> &rf) {
    return rf + m;
}
template<typename Coeff>
RationalFunction<Coeff>
operator+(const RationalFunction<Coeff> &rf, const Variable &v) {
    return rf + RationalFunction<Coeff>(v);
}
template<typename Coeff>
RationalFunction<Coeff>
operator+(const Variable &v, const RationalFunction<Coeff> &rf) {
    return rf + v;
}

// --- Subtraction ---
template<typename Coeff>
RationalFunction<Coeff>
operator-(const RationalFunction<Coeff> &rf, const Polynomial<Coeff> &poly) {
    Polynomial<Coeff> new_num = rf.numerator - poly * rf.denominator;
    return RationalFunction<Coeff>(new_num, rf.denominator);
}
template<typename Coeff>
RationalFunction<Coeff>
operator-(const Polynomial<Coeff> &poly, const RationalFunction<Coeff> &rf) {
    Polynomial<Coeff> new_num = poly * rf.denominator - rf.numerator;
    return RationalFunction<Coeff>(new_num, rf.denominator);
}
template<typename Coeff>
RationalFunction<Coeff>
operator-(const RationalFunction<Coeff> &rf, const Monomial<Coeff> &m) {
    return rf - RationalFunction<Coeff>(m);
}
template<typename Coeff>
RationalFunction<Coeff>
operator-(const Monomial<Coeff> &m, const RationalFunction<Coeff> &rf) {
    return RationalFunction<Coeff>(m) - rf;
}
template<typename Coeff>
RationalFunction<Coeff>
operator-(const RationalFunction<Coeff> &rf, const Variable &v) {
    return rf - RationalFunction<Coeff>(v);
}
template<typename Coeff>
RationalFunction<Coeff>
operator-(const Variable &v, const RationalFunction<Coeff> &rf) {
    return RationalFunction<Coeff>(v) - rf;
}

// --- Multiplication ---
template<typename Coeff>
RationalFunction<Coeff>
operator*(const RationalFunction<Coeff> &rf, const Polynomial<Coeff> &poly) {
    Polynomial<Coeff> const new_num = rf.numerator * poly;
    return RationalFunction<Coeff>(new_num, rf.denominator);
}
template<typename Coeff>
RationalFunction<Coeff>
operator*(const Polynomial<Coeff> &poly, const RationalFunction<Coeff> &rf) {
    return rf * poly;
}
template<typename Coeff>
RationalFunction<Coeff>
operator*(const RationalFunction<Coeff> &rf, const Monomial<Coeff> &m) {
    return rf * RationalFunction<Coeff>(m);
}
template<typename Coeff>
RationalFunction<Coeff>
operator*(const Monomial<Coeff> &m, const RationalFunction<Coeff> &rf) {
    return rf * m;
}
template<typename Coeff>
RationalFunction<Coeff>
operator*(const RationalFunction<Coeff> &rf, const Variable &v) {
    return rf * RationalFunction<Coeff>(v);
}
template<typename Coeff>
RationalFunction<Coeff>
operator*(const Variable &v, const RationalFunction<Coeff> &rf) {
    return rf * v;
}

// --- Division ---
template<typename Coeff>
RationalFunction<Coeff>
operator/(const RationalFunction<Coeff> &rf, const Polynomial<Coeff> &poly) {
    if (poly.is_zero()) { throw std::invalid_argument("Division by zero Polynomial in RationalFunction/Polynomial."); }
    return RationalFunction<Coeff>(rf.numerator, rf.denominator * poly);
}
template<typename Coeff>
RationalFunction<Coeff>
operator/(const Polynomial<Coeff> &poly, const RationalFunction<Coeff> &rf) {
    return RationalFunction<Coeff>(poly) / rf;
}
template<typename Coeff>
RationalFunction<Coeff>
operator/(const RationalFunction<Coeff> &rf, const Monomial<Coeff> &m) {
    return rf / RationalFunction<Coeff>(m);
}
template<typename Coeff>
RationalFunction<Coeff>
operator/(const Monomial<Coeff> &m, const RationalFunction<Coeff> &rf) {
    return RationalFunction<Coeff>(m) / rf;
}
template<typename Coeff>
RationalFunction<Coeff>
operator/(const RationalFunction<Coeff> &rf, const Variable &v) {
    return rf / RationalFunction<Coeff>(v);
}
template<typename Coeff>
RationalFunction<Coeff>
operator/(const Variable &v, const RationalFunction<Coeff> &rf) {
    return RationalFunction<Coeff>(v) / rf;
}
template<typename Coeff>
RationalFunction<Coeff>
operator/(const Polynomial<Coeff> &p, const Variable &v) {
    return RationalFunction<Coeff>(p) / RationalFunction<Coeff>(v);
}
template<typename Coeff>
RationalFunction<Coeff>
operator/(const Variable &v, const Polynomial<Coeff> &p) {
    if (p.is_zero()) { throw std::invalid_argument("Division by zero Polynomial in Var/Polynomial."); }
    return RationalFunction<Coeff>(Polynomial<Coeff>(v), p);
}
template<typename Coeff>
RationalFunction<Coeff>
operator/(const Polynomial<Coeff> &p, const Monomial<Coeff> &m) {
    if (m.coeff == Coeff{}) { throw std::invalid_argument("Division by zero Monomial in Polynomial/Monomial."); }
    return RationalFunction<Coeff>(p, Polynomial<Coeff>(m));
}

//-----------------------------------------------------------------------------
// Output Stream for RationalFunction
//-----------------------------------------------------------------------------
template<typename Coeff>
std::ostream &
operator<<(std::ostream &os, const RationalFunction<Coeff> &rf) {
    bool const den_is_one = (rf.denominator.monomials.size() == 1 && rf.denominator.monomials[0].vars.empty() &&
                             rf.denominator.monomials[0].coeff == Coeff(1));

    os << "(" << rf.numerator << ")";
    if (!den_is_one) { os << "/(" << rf.denominator << ")"; }
    return os;
}

} // namespace branch_eqs

#endif // POLYNOMIAL_HPP
