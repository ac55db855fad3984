#ifndef VARIABLE_OPERATORS_HPP
#define VARIABLE_OPERATORS_HPP

#include "polynomial.hpp"

namespace branch_eqs {

// ====== Variable Arithmetic Operators for natural equation syntax ======

// Addition operators
inline Polynomial<double>
operator+(const Variable &lhs, const Variable &rhs) {
    return Polynomial<double>(lhs) + Polynomial<double>(rhs);
}

inline Polynomial<double>
operator+(const Variable &lhs, double rhs) {
    return Polynomial<double>(lhs) + Polynomial<double>(Monomial<double>(rhs));
}

inline Polynomial<double>
operator+(double lhs, const Variable &rhs) {
    return Polynomial<double>(Monomial<double>(lhs)) + Polynomial<double>(rhs);
}

// Subtraction operators
inline Polynomial<double>
operator-(const Variable &lhs, const Variable &rhs) {
    return Polynomial<double>(lhs) - Polynomial<double>(rhs);
}

inline Polynomial<double>
operator-(const Variable &lhs, double rhs) {
    return Polynomial<double>(lhs) - Polynomial<double>(Monomial<double>(rhs));
}

inline Polynomial<double>
operator-(double lhs, const Variable &rhs) {
    return Polynomial<double>(Monomial<double>(lhs)) - Polynomial<double>(rhs);
}

// Unary negation
inline Polynomial<double>
operator-(const Variable &var) {
    return Polynomial<double>(Monomial<double>(-1.0, var));
}

// Multiplication operators
inline Polynomial<double>
operator*(const Variable &lhs, const Variable &rhs) {
    return Polynomial<double>(Monomial<double>(1.0, { { lhs, 1 }, { rhs, 1 } }));
}

inline Polynomial<double>
operator*(const Variable &lhs, double rhs) {
    return Polynomial<double>(Monomial<double>(rhs, lhs));
}

inline Polynomial<double>
operator*(double lhs, const Variable &rhs) {
    return Polynomial<double>(Monomial<double>(lhs, rhs));
}

// Division operators (these produce RationalFunctions)
inline RationalFunction<double>
operator/(const Variable &lhs, const Variable &rhs) {
    return RationalFunction<double>(Polynomial<double>(lhs), Polynomial<double>(rhs));
}

inline RationalFunction<double>
operator/(const Variable &lhs, double rhs) {
    if (rhs == 0.0) { throw std::invalid_argument("Div by 0 in Var/double"); }
    return RationalFunction<double>(Polynomial<double>(Monomial<double>(1.0 / rhs, lhs)));
}

inline RationalFunction<double>
operator/(double lhs, const Variable &rhs) {
    return RationalFunction<double>(Polynomial<double>(Monomial<double>(lhs)), Polynomial<double>(rhs));
}

// Power operator (limited to integer powers)
inline RationalFunction<double>
pow(const Variable &var, int exponent) {
    if (exponent == 0) { return RationalFunction<double>(1.0); }
    if (exponent < 0) {
        return RationalFunction<double>(Polynomial<double>(Monomial<double>(1.0)),
                                        Polynomial<double>(Monomial<double>(1.0, var, -exponent)));
    }
    return RationalFunction<double>(Polynomial<double>(Monomial<double>(1.0, var, exponent)));
}

// Additional helper for constant terms
inline Polynomial<double>
constant(double value) {
    return Polynomial<double>(Monomial<double>(value));
}

} // namespace branch_eqs

#endif // VARIABLE_OPERATORS_HPP
