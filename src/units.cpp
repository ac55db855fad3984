#include "units.hpp"

#include <cmath>
#include <sstream>
#include <stdexcept>

namespace branch_eqs {

namespace {

struct UnitEntry {
    const char *symbol;
    double scale;
    Dimension dimension;
};

constexpr double kSecondsPerDay = 86400.0;

const std::vector<UnitEntry> &
unit_table() {
    static const std::vector<UnitEntry> table = {
        // Base units
        { "m", 1.0, { { "m", 1 } } },
        { "kg", 1.0, { { "kg", 1 } } },
        { "s", 1.0, { { "s", 1 } } },
        { "A", 1.0, { { "A", 1 } } },
        { "K", 1.0, { { "K", 1 } } },
        { "mol", 1.0, { { "mol", 1 } } },
        { "cd", 1.0, { { "cd", 1 } } },
        { "bit", 1.0, { { "bit", 1 } } },
        { "rad", 1.0, { { "rad", 1 } } },

        // Length
        { "km", 1e3, { { "m", 1 } } },
        { "dm", 0.1, { { "m", 1 } } },
        { "cm", 0.01, { { "m", 1 } } },
        { "mm", 1e-3, { { "m", 1 } } },
        { "um", 1e-6, { { "m", 1 } } },
        { "nm", 1e-9, { { "m", 1 } } },
        { "pm", 1e-12, { { "m", 1 } } },
        { "inch", 0.0254, { { "m", 1 } } },
        { "ft", 0.3048, { { "m", 1 } } },
        { "yd", 0.9144, { { "m", 1 } } },
        { "mi", 1609.344, { { "m", 1 } } },
        { "nmi", 1852.0, { { "m", 1 } } },
        { "au", 149597870700.0, { { "m", 1 } } },
        { "ly", 9460730472580800.0, { { "m", 1 } } },
        { "dioptre", 1.0, { { "m", -1 } } },

        // Mass
        { "g", 1e-3, { { "kg", 1 } } },
        { "mg", 1e-6, { { "kg", 1 } } },
        { "ug", 1e-9, { { "kg", 1 } } },
        { "tonne", 1e3, { { "kg", 1 } } },
        { "lb", 0.45359237, { { "kg", 1 } } },
        { "u", 1.66053906660e-27, { { "kg", 1 } } },

        // Time
        { "ms", 1e-3, { { "s", 1 } } },
        { "us", 1e-6, { { "s", 1 } } },
        { "ns", 1e-9, { { "s", 1 } } },
        { "ps", 1e-12, { { "s", 1 } } },
        { "min", 60.0, { { "s", 1 } } },
        { "h", 3600.0, { { "s", 1 } } },
        { "day", kSecondsPerDay, { { "s", 1 } } },
        { "year", 365.25 * kSecondsPerDay, { { "s", 1 } } },
        { "common_year", 365.0 * kSecondsPerDay, { { "s", 1 } } },
        { "tropical_year", 365.24219 * kSecondsPerDay, { { "s", 1 } } },
        { "sidereal_year", 365.256363004 * kSecondsPerDay, { { "s", 1 } } },

        // Area and volume
        { "ha", 1e4, { { "m", 2 } } },
        { "L", 1e-3, { { "m", 3 } } },
        { "dL", 1e-4, { { "m", 3 } } },
        { "cL", 1e-5, { { "m", 3 } } },
        { "mL", 1e-6, { { "m", 3 } } },
        { "quart", 9.46352946e-4, { { "m", 3 } } },

        // Mechanics
        { "N", 1.0, { { "kg", 1 }, { "m", 1 }, { "s", -2 } } },
        { "J", 1.0, { { "kg", 1 }, { "m", 2 }, { "s", -2 } } },
        { "W", 1.0, { { "kg", 1 }, { "m", 2 }, { "s", -3 } } },
        { "Pa", 1.0, { { "kg", 1 }, { "m", -1 }, { "s", -2 } } },
        { "bar", 1e5, { { "kg", 1 }, { "m", -1 }, { "s", -2 } } },
        { "atm", 101325.0, { { "kg", 1 }, { "m", -1 }, { "s", -2 } } },
        { "psi", 6894.757293168361, { { "kg", 1 }, { "m", -1 }, { "s", -2 } } },
        { "mmHg", 133.322, { { "kg", 1 }, { "m", -1 }, { "s", -2 } } },
        { "Hz", 1.0, { { "s", -1 } } },
        { "Bq", 1.0, { { "s", -1 } } },
        { "Gy", 1.0, { { "m", 2 }, { "s", -2 } } },
        { "eV", 1.602176634e-19, { { "kg", 1 }, { "m", 2 }, { "s", -2 } } },
        { "kat", 1.0, { { "mol", 1 }, { "s", -1 } } },

        // Electromagnetism
        { "C", 1.0, { { "A", 1 }, { "s", 1 } } },
        { "V", 1.0, { { "kg", 1 }, { "m", 2 }, { "s", -3 }, { "A", -1 } } },
        { "ohm", 1.0, { { "kg", 1 }, { "m", 2 }, { "s", -3 }, { "A", -2 } } },
        { "F", 1.0, { { "kg", -1 }, { "m", -2 }, { "s", 4 }, { "A", 2 } } },
        { "H", 1.0, { { "kg", 1 }, { "m", 2 }, { "s", -2 }, { "A", -2 } } },
        { "T", 1.0, { { "kg", 1 }, { "s", -2 }, { "A", -1 } } },
        { "S", 1.0, { { "kg", -1 }, { "m", -2 }, { "s", 3 }, { "A", 2 } } },
        { "lux", 1.0, { { "cd", 1 }, { "m", -2 } } },

        // Angles, ratios and information
        { "deg", 0.0174532925199433, { { "rad", 1 } } },
        { "mil", 1e-3, { { "rad", 1 } } },
        { "sr", 1.0, { { "rad", 2 } } },
        { "percent", 0.01, {} },
        { "permille", 1e-3, {} },
        { "byte", 8.0, { { "bit", 1 } } },
        { "KiB", 8192.0, { { "bit", 1 } } },
        { "MiB", 8388608.0, { { "bit", 1 } } },
        { "GiB", 8589934592.0, { { "bit", 1 } } },
        { "TiB", 8796093022208.0, { { "bit", 1 } } },

        // Physical constants
        { "c", 299792458.0, { { "m", 1 }, { "s", -1 } } },
        { "g0", 9.80665, { { "m", 1 }, { "s", -2 } } },
        { "G", 6.67430e-11, { { "m", 3 }, { "kg", -1 }, { "s", -2 } } },
        { "k_B", 1.380649e-23, { { "m", 2 }, { "kg", 1 }, { "s", -2 }, { "K", -1 } } },
        { "N_A", 6.02214076e23, { { "mol", -1 } } },
        { "e", 1.602176634e-19, { { "A", 1 }, { "s", 1 } } },
        { "hbar", 1.054571817e-34, { { "m", 2 }, { "kg", 1 }, { "s", -1 } } },
        { "R", 8.31446261815324, { { "m", 2 }, { "kg", 1 }, { "s", -2 }, { "K", -1 }, { "mol", -1 } } },
        { "faraday_constant", 96485.33212, { { "A", 1 }, { "s", 1 }, { "mol", -1 } } },
        { "eps0", 8.8541878128e-12, { { "m", -3 }, { "kg", -1 }, { "s", 4 }, { "A", 2 } } },
        { "mu0", 1.25663706212e-6, { { "m", 1 }, { "kg", 1 }, { "s", -2 }, { "A", -2 } } },
        { "sigma_SB", 5.670374419e-8, { { "kg", 1 }, { "s", -3 }, { "K", -4 } } },
    };
    return table;
}

const std::map<std::string, UnitDefinition> &
unit_registry() {
    static const std::map<std::string, UnitDefinition> registry = [] {
        std::map<std::string, UnitDefinition> result;
        for (const auto &entry : unit_table()) {
            result.emplace(entry.symbol, UnitDefinition{ entry.scale, entry.dimension });
        }
        return result;
    }();
    return registry;
}

void
accumulate(Dimension &target, const Dimension &source, int power) {
    for (const auto &pair : source) {
        target[pair.first] += pair.second * power;
        if (target[pair.first] == 0) { target.erase(pair.first); }
    }
}

Dimension
monomial_dimension(const Monomial<double> &m) {
    Dimension result;
    for (const auto &pair : m.vars) {
        const Variable &v = pair.first;
        if (!v.is_unit) {
            std::stringstream ss;
            ss << "Quantity contains the unknown '" << v << "'.";
            throw std::invalid_argument(ss.str());
        }
        const UnitDefinition *def = find_unit(v.name);
        if (def != nullptr) {
            accumulate(result, def->dimension, pair.second);
        } else {
            accumulate(result, Dimension{ { v.name, 1 } }, pair.second);
        }
    }
    return result;
}

Dimension
polynomial_dimension(const Polynomial<double> &p) {
    Dimension result;
    bool first = true;
    for (const auto &m : p.monomials) {
        Dimension d = monomial_dimension(m);
        if (first) {
            result = d;
            first = false;
        } else if (d != result) {
            std::stringstream ss;
            ss << "Terms of '" << p << "' have different dimensions.";
            throw std::invalid_argument(ss.str());
        }
    }
    return result;
}

} // namespace

const UnitDefinition *
find_unit(const std::string &symbol) {
    const auto &registry = unit_registry();
    auto it = registry.find(symbol);
    return it == registry.end() ? nullptr : &it->second;
}

std::vector<std::string>
registered_units() {
    std::vector<std::string> result;
    result.reserve(unit_table().size());
    for (const auto &entry : unit_table()) { result.emplace_back(entry.symbol); }
    return result;
}

const std::vector<std::string> &
base_units() {
    static const std::vector<std::string> bases = { "m", "kg", "s", "A", "K", "mol", "cd", "bit", "rad" };
    return bases;
}

bool
has_units(const Expression &expr) {
    for (const auto &v : expr.variables()) {
        if (v.is_unit) { return true; }
    }
    return false;
}

bool
is_quantity(const Expression &expr) {
    for (const auto &v : expr.variables()) {
        if (!v.is_unit) { return false; }
    }
    return true;
}

Dimension
dimension_of(const Expression &expr) {
    if (expr.is_zero()) { return {}; }
    Dimension result = polynomial_dimension(expr.numerator);
    accumulate(result, polynomial_dimension(expr.denominator), -1);
    return result;
}

double
to_si_value(const Expression &expr) {
    std::map<Variable, double> scales;
    for (const auto &v : expr.variables()) {
        if (!v.is_unit) {
            std::stringstream ss;
            ss << "Cannot take the SI value of " << expr << ": it contains the unknown '" << v << "'.";
            throw std::invalid_argument(ss.str());
        }
        const UnitDefinition *def = find_unit(v.name);
        scales[v] = def != nullptr ? def->scale : 1.0;
    }
    return expr.evaluate(scales);
}

double
magnitude_in(const Expression &quantity, const Expression &target) {
    if (target.is_zero()) { throw std::invalid_argument("Cannot express a quantity in a zero unit."); }
    Dimension const from = dimension_of(quantity);
    Dimension const to = dimension_of(target);
    if (from != to) {
        std::stringstream ss;
        ss << "Cannot express " << quantity << " in " << target << ": dimensions differ.";
        throw std::invalid_argument(ss.str());
    }
    return to_si_value(quantity) / to_si_value(target);
}

UnitSubstitution::UnitSubstitution(unsigned int seed, double rand_range, double epsilon)
  : rng_(seed)
  , rand_range_(rand_range)
  , epsilon_(epsilon) {
    if (rand_range_ <= 0.0 || rand_range_ >= 1.0) {
        throw std::invalid_argument("UnitSubstitution: rand_range must lie in (0, 1).");
    }
    for (const auto &base : base_units()) { base_factors_[base] = draw(); }
}

double
UnitSubstitution::draw() {
    std::uniform_real_distribution<double> dist(1.0 - rand_range_, 1.0 + rand_range_);
    constexpr int max_attempts = 10000;
    for (int attempt = 0; attempt < max_attempts; ++attempt) {
        double const candidate = dist(rng_);
        bool clash = false;
        for (const auto &pair : base_factors_) {
            if (std::abs(candidate - pair.second) < epsilon_) {
                clash = true;
                break;
            }
        }
        if (!clash) { return candidate; }
    }
    throw std::runtime_error("UnitSubstitution: could not draw a distinct factor; epsilon is too large.");
}

double
UnitSubstitution::base_factor(const std::string &base) {
    auto it = base_factors_.find(base);
    if (it != base_factors_.end()) { return it->second; }
    double const value = draw();
    base_factors_.emplace(base, value);
    return value;
}

double
UnitSubstitution::factor(const Variable &unit_tag) {
    if (!unit_tag.is_unit) {
        std::stringstream ss;
        ss << "'" << unit_tag << "' is not a unit.";
        throw std::invalid_argument(ss.str());
    }
    const UnitDefinition *def = find_unit(unit_tag.name);
    if (def == nullptr) { return base_factor(unit_tag.name); }

    double value = def->scale;
    for (const auto &pair : def->dimension) { value *= std::pow(base_factor(pair.first), pair.second); }
    return value;
}

double
UnitSubstitution::evaluate(const Expression &expr) {
    std::map<Variable, double> values;
    for (const auto &v : expr.variables()) {
        if (!v.is_unit) {
            std::stringstream ss;
            ss << "Cannot substitute units into " << expr << ": it contains the unknown '" << v << "'.";
            throw std::invalid_argument(ss.str());
        }
        values[v] = factor(v);
    }
    return expr.evaluate(values);
}

} // namespace branch_eqs
