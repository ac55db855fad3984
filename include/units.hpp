#ifndef UNITS_HPP
#define UNITS_HPP

#include "polynomial.hpp"
#include "rational_function_operators.hpp"
#include "solver_options.hpp"

#include <map>
#include <random>
#include <string>
#include <vector>

namespace branch_eqs {

// Exponents over base dimensions, keyed by base unit symbol ("m", "kg", ...).
// A unit symbol that is not registered counts as a base dimension of its own.
using Dimension = std::map<std::string, int>;

struct UnitDefinition {
    double scale = 1.0; // Value in SI base units
    Dimension dimension;
};

// Returns the registered definition of symbol, or nullptr
const UnitDefinition *
find_unit(const std::string &symbol);

// All registered unit symbols, base units first
std::vector<std::string>
registered_units();

// Symbols of the base dimensions
const std::vector<std::string> &
base_units();

// Unit tag for symbol. Unregistered symbols are accepted and behave as new base dimensions.
inline Variable
unit(const std::string &symbol) {
    return Variable(symbol, true);
}

// True when any symbol of expr is a unit tag
bool
has_units(const Expression &expr);

// True when expr carries no unknowns (unit tags are allowed)
bool
is_quantity(const Expression &expr);

// Dimension of a quantity. Throws std::invalid_argument if the terms of expr
// have different dimensions or expr contains unknowns.
Dimension
dimension_of(const Expression &expr);

// Value of a quantity in SI base units. Unregistered unit tags count as 1.
// Throws std::invalid_argument if expr contains unknowns.
double
to_si_value(const Expression &expr);

// Magnitude of quantity expressed in target, e.g. magnitude_in(1 m, cm) == 100.
// Throws std::invalid_argument on a dimension mismatch.
double
magnitude_in(const Expression &quantity, const Expression &target);

/**
 * @brief A table of pseudo-random numeric stand-ins for unit tags.
 *
 * Every base dimension gets a factor drawn uniformly from [1 - rand_range, 1 + rand_range],
 * no two factors closer than epsilon. Derived units map to scale * product of base factors.
 * Substituting the table into two quantities of different dimension makes them compare
 * unequal with overwhelming probability, so dimensional consistency can be tested numerically.
 */
class UnitSubstitution {
  public:
    explicit UnitSubstitution(unsigned int seed,
                              double rand_range = kDefaultRandRange,
                              double epsilon = kDefaultEpsilon);

    // Numeric factor standing in for a unit tag. Unseen base dimensions get a fresh factor.
    double factor(const Variable &unit_tag);

    // Evaluates a quantity with every unit tag replaced by its factor.
    // Throws std::invalid_argument if expr contains unknowns.
    double evaluate(const Expression &expr);

    [[nodiscard]] const std::map<std::string, double> &base_factors() const { return base_factors_; }

  private:
    double draw();
    double base_factor(const std::string &base);

    std::mt19937 rng_;
    double rand_range_;
    double epsilon_;
    std::map<std::string, double> base_factors_;
};

namespace units {

// SI base units
inline const Variable m{ "m", true };
inline const Variable kg{ "kg", true };
inline const Variable s{ "s", true };
inline const Variable A{ "A", true };
inline const Variable K{ "K", true };
inline const Variable mol{ "mol", true };
inline const Variable cd{ "cd", true };
inline const Variable bit{ "bit", true };
inline const Variable rad{ "rad", true };

// Length
inline const Variable km{ "km", true };
inline const Variable dm{ "dm", true };
inline const Variable cm{ "cm", true };
inline const Variable mm{ "mm", true };
inline const Variable um{ "um", true };
inline const Variable nm{ "nm", true };
inline const Variable inch{ "inch", true };
inline const Variable ft{ "ft", true };
inline const Variable yd{ "yd", true };
inline const Variable mi{ "mi", true };
inline const Variable nmi{ "nmi", true };
inline const Variable au{ "au", true };
inline const Variable ly{ "ly", true };

// Mass
inline const Variable g{ "g", true };
inline const Variable mg{ "mg", true };
inline const Variable tonne{ "tonne", true };
inline const Variable lb{ "lb", true };

// Time
inline const Variable ms{ "ms", true };
inline const Variable us{ "us", true };
inline const Variable ns{ "ns", true };
inline const Variable minute{ "min", true };
inline const Variable hour{ "h", true };
inline const Variable day{ "day", true };
inline const Variable year{ "year", true };

// Area and volume
inline const Variable ha{ "ha", true };
inline const Variable L{ "L", true };
inline const Variable mL{ "mL", true };

// Mechanics
inline const Variable N{ "N", true };
inline const Variable J{ "J", true };
inline const Variable W{ "W", true };
inline const Variable Pa{ "Pa", true };
inline const Variable bar{ "bar", true };
inline const Variable atm{ "atm", true };
inline const Variable psi{ "psi", true };
inline const Variable Hz{ "Hz", true };
inline const Variable eV{ "eV", true };

// Electromagnetism
inline const Variable C{ "C", true };
inline const Variable V{ "V", true };
inline const Variable ohm{ "ohm", true };
inline const Variable F{ "F", true };
inline const Variable H{ "H", true };
inline const Variable T{ "T", true };
inline const Variable S{ "S", true };

// Angles, ratios and information
inline const Variable deg{ "deg", true };
inline const Variable percent{ "percent", true };
inline const Variable permille{ "permille", true };
inline const Variable byte{ "byte", true };

// Physical constants
inline const Variable speed_of_light{ "c", true };
inline const Variable standard_gravity{ "g0", true };
inline const Variable gravitational_constant{ "G", true };
inline const Variable boltzmann_constant{ "k_B", true };
inline const Variable avogadro_constant{ "N_A", true };
inline const Variable elementary_charge{ "e", true };
inline const Variable planck_reduced{ "hbar", true };
inline const Variable molar_gas_constant{ "R", true };

} // namespace units

} // namespace branch_eqs

#endif // UNITS_HPP
