#ifndef RATIONAL_FUNCTION_OPERATORS_HPP
#define RATIONAL_FUNCTION_OPERATORS_HPP

#include "polynomial.hpp"
#include "variable_operators.hpp"

namespace branch_eqs {

// The value type every equation system works with. A binding, each side of a
// relation and every oracle result is an Expression.
using Expression = RationalFunction<double>;

// ====== RationalFunction Arithmetic Operators for natural equation syntax ======

// Helper conversion function from Variable to RationalFunction
inline RationalFunction<double>
to_rational(const Variable &var) {
    return RationalFunction<double>(var);
}

// Helper conversion function from Polynomial to RationalFunction
inline RationalFunction<double>
to_rational(const Polynomial<double> &poly) {
    return RationalFunction<double>(poly);
}

// --- Scalar operators ---
// Non-template so that integer literals convert, e.g. 2 * expr
inline RationalFunction<double>
operator+(const RationalFunction<double> &lhs, double rhs) {
    return lhs + RationalFunction<double>(rhs);
}

inline RationalFunction<double>
operator+(double lhs, const RationalFunction<double> &rhs) {
    return RationalFunction<double>(lhs) + rhs;
}

inline RationalFunction<double>
operator-(const RationalFunction<double> &lhs, double rhs) {
    return lhs - RationalFunction<double>(rhs);
}

inline RationalFunction<double>
operator-(double lhs, const RationalFunction<double> &rhs) {
    return RationalFunction<double>(lhs) - rhs;
}

inline RationalFunction<double>
operator*(const RationalFunction<double> &lhs, double rhs) {
    return lhs * RationalFunction<double>(rhs);
}

inline RationalFunction<double>
operator*(double lhs, const RationalFunction<double> &rhs) {
    return RationalFunction<double>(lhs) * rhs;
}

inline RationalFunction<double>
operator/(const RationalFunction<double> &lhs, double rhs) {
    if (rhs == 0.0) { throw std::invalid_argument("Division by zero scalar."); }
    return lhs / RationalFunction<double>(rhs);
}

inline RationalFunction<double>
operator/(double lhs, const RationalFunction<double> &rhs) {
    return RationalFunction<double>(lhs) / rhs;
}

// Direct Polynomial/Polynomial division operator
inline RationalFunction<double>
operator/(const Polynomial<double> &lhs, const Polynomial<double> &rhs) {
    if (rhs.is_zero()) { throw std::invalid_argument("Division by zero Polynomial."); }
    return RationalFunction<double>(lhs, rhs);
}

// Integer power; negative exponents produce the reciprocal
inline RationalFunction<double>
pow(const RationalFunction<double> &base, int exponent) {
    if (exponent < 0) { return RationalFunction<double>(1.0) / pow(base, -exponent); }
    RationalFunction<double> result(1.0);
    for (int i = 0; i < exponent; ++i) { result *= base; }
    return result;
}

inline RationalFunction<double>
pow(const Polynomial<double> &base, int exponent) {
    return pow(RationalFunction<double>(base), exponent);
}

} // namespace branch_eqs

#endif // RATIONAL_FUNCTION_OPERATORS_HPP
