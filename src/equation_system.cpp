#include "equation_system.hpp"

#include "polynomial_oracle.hpp"
#include "units.hpp"

#include <algorithm>
#include <cctype>
#include <numeric>
#include <random>
#include <sstream>
#include <stdexcept>

namespace branch_eqs {

namespace {

std::unique_ptr<AlgebraOracle>
oracle_or_default(std::unique_ptr<AlgebraOracle> oracle, const SolverOptions &options) {
    if (oracle) { return oracle; }
    OracleOptions oracle_options;
    oracle_options.verbose = options.verbose;
    return std::make_unique<PolynomialOracle>(oracle_options);
}

EquationClassifier
make_classifier(const AlgebraOracle &oracle, const SolverOptions &options) {
    unsigned int seed = options.random_seed;
    if (seed == 0) {
        std::random_device device;
        seed = device();
    }
    std::mt19937 seeder(seed);
    UnitSubstitution first(static_cast<unsigned int>(seeder()), options.rand_range, options.epsilon);
    UnitSubstitution second(static_cast<unsigned int>(seeder()), options.rand_range, options.epsilon);
    return EquationClassifier(oracle, std::move(first), std::move(second), options.epsilon);
}

bool
is_identifier(const std::string &name) {
    if (name.empty()) { return false; }
    auto const first = static_cast<unsigned char>(name.front());
    if (!std::isalpha(first) && first != '_') { return false; }
    return std::all_of(name.begin(), name.end(), [](char c) {
        auto const u = static_cast<unsigned char>(c);
        return std::isalnum(u) || u == '_';
    });
}

// Sets a flag for the lifetime of the guard
class FlagGuard {
  public:
    explicit FlagGuard(bool &flag)
      : flag_(flag) {
        flag_ = true;
    }
    ~FlagGuard() { flag_ = false; }
    FlagGuard(const FlagGuard &) = delete;
    FlagGuard &operator=(const FlagGuard &) = delete;

  private:
    bool &flag_;
};

} // namespace

EquationSystem::EquationSystem(const std::vector<std::string> &variable_names,
                               SolverOptions options,
                               std::unique_ptr<AlgebraOracle> oracle)
  : EquationSystem(variable_names, {}, options, std::move(oracle)) {}

EquationSystem::EquationSystem(const std::vector<std::string> &variable_names,
                               const std::map<std::string, std::string> &descriptions,
                               SolverOptions options,
                               std::unique_ptr<AlgebraOracle> oracle)
  : options_(options)
  , oracle_(oracle_or_default(std::move(oracle), options))
  , classifier_(make_classifier(*oracle_, options)) {
    if (variable_names.empty()) { throw ConfigurationError("At least one variable must be declared."); }
    validate_names(variable_names);
    store_.add_variables(variable_names);

    for (const auto &pair : descriptions) {
        if (!store_.has_variable(pair.first)) {
            throw ConfigurationError("Description given for undeclared variable '" + pair.first + "'.");
        }
        descriptions_[pair.first] = pair.second;
    }
}

EquationSystem &
EquationSystem::add_equation(const std::string &name, EquationMethod method) {
    validate_method_name("equation", name);
    if (!method) { throw ConfigurationError("Equation '" + name + "' has no callable."); }
    equations_.emplace_back(name, std::move(method));
    return *this;
}

EquationSystem &
EquationSystem::add_procedure(const std::string &name, ProcedureMethod method) {
    validate_method_name("procedure", name);
    if (!method) { throw ConfigurationError("Procedure '" + name + "' has no callable."); }
    procedures_.emplace_back(name, std::move(method));
    return *this;
}

void
EquationSystem::solve() {
    if (solved_) { std::cerr << "Warning: solve() called on a system that is already solved. Solving again." << std::endl; }

    std::vector<Bindings> const before = store_.all_bindings();
    std::size_t const start_id = store_.id_at(store_.current_index());
    bad_solution_ = false;
    marked_.clear();

    // One pass: every branch once, forks included, in rotation order from the current branch
    std::set<std::size_t> visited;
    while (true) {
        std::optional<std::size_t> next;
        for (std::size_t offset = 0; offset < store_.count(); ++offset) {
            std::size_t const index = (store_.current_index() + offset) % store_.count();
            if (visited.count(store_.id_at(index)) == 0) {
                next = index;
                break;
            }
        }
        if (!next.has_value()) { break; }

        store_.set_current(*next);
        std::size_t const id = store_.id_at(*next);
        visited.insert(id);
        if (options_.verbose) { std::cout << "  [EquationSystem] Solving branch " << *next << " (id " << id << ")" << std::endl; }
        solve_branch(id);
    }

    prune(start_id);

    if (bad_solution_ && store_.all_bindings() == before) {
        throw UnsolvableSystemError("Given equations have no consistent solutions. Please check your equations and try again.");
    }
    solved_ = true;

    if (options_.verbose) { std::cout << "  [EquationSystem] Solve finished with " << store_.count() << " branch(es)." << std::endl; }
}

void
EquationSystem::solve_branch(std::size_t id) {
    if (!run_procedures(id)) { return; }

    std::vector<Relation> relations;
    if (!collect_relations(id, relations)) { return; }

    std::size_t const n = relations.size();
    std::size_t const largest = options_.max_subset_size == 0 ? n : std::min(n, options_.max_subset_size);

    // Subsets by increasing size, each size in lexicographic index order
    for (std::size_t k = 1; k <= largest; ++k) {
        std::vector<std::size_t> indices(k);
        std::iota(indices.begin(), indices.end(), 0);
        while (true) {
            std::vector<Relation> subset;
            subset.reserve(k);
            for (std::size_t i : indices) { subset.push_back(relations[i]); }

            if (solve_subset(id, subset)) {
                solve_branch(id);
                return;
            }

            std::size_t i = k;
            while (i > 0 && indices[i - 1] == n - k + (i - 1)) { --i; }
            if (i == 0) { break; }
            ++indices[i - 1];
            for (std::size_t j = i; j < k; ++j) { indices[j] = indices[j - 1] + 1; }
        }
    }

    run_procedures(id);
}

bool
EquationSystem::run_procedures(std::size_t id) {
    FlagGuard const guard(in_procedure_);
    for (const auto &procedure : procedures_) {
        try {
            procedure.second();
        } catch (const UnresolvedValueError &e) {
            if (options_.verbose) {
                std::cout << "  [EquationSystem] Procedure '" << procedure.first << "' skipped: " << e.what() << std::endl;
            }
        }
        if (!store_.index_of(id).has_value()) { return false; }
    }
    return true;
}

bool
EquationSystem::collect_relations(std::size_t id, std::vector<Relation> &relations) {
    for (const auto &equation : equations_) {
        std::vector<Expression> const sides = equation.second();
        if (sides.size() != 2) {
            std::stringstream ss;
            ss << "Equation '" << equation.first << "' returned " << sides.size()
               << " expression(s); an equation must return exactly two.";
            throw ConfigurationError(ss.str());
        }

        Relation relation{ oracle_->simplify(sides[0]), oracle_->simplify(sides[1]), equation.first };
        Classification const classification = classifier_.classify(relation.lhs, relation.rhs);
        if (classification == Classification::Redundant) { continue; }
        if (classification == Classification::Contradiction) {
            if (options_.verbose) {
                std::cout << "  [EquationSystem] Contradiction in branch id " << id << ": " << relation << std::endl;
            }
            relations.push_back(relation);
            marked_[id] = relations;
            return false;
        }
        if (std::find(relations.begin(), relations.end(), relation) == relations.end()) { relations.push_back(relation); }
    }
    return true;
}

bool
EquationSystem::solve_subset(std::size_t id, const std::vector<Relation> &subset) {
    std::set<Variable> free;
    for (const auto &relation : subset) {
        for (const auto &v : oracle_->free_variables(relation.lhs)) { free.insert(v); }
        for (const auto &v : oracle_->free_variables(relation.rhs)) { free.insert(v); }
    }
    std::vector<Variable> unknowns;
    for (const auto &v : free) {
        if (store_.has_variable(v.name)) { unknowns.push_back(v); }
    }
    if (unknowns.empty()) { return false; }

    SolutionSet const result = oracle_->solve(subset, unknowns);
    if (result.kind == SolutionKind::Indeterminate) { return false; }
    if (result.kind == SolutionKind::NoSolution) {
        if (options_.raise_on_unsolvable_subset) {
            std::stringstream ss;
            ss << "Equations have no consistent solution:";
            for (const auto &relation : subset) { ss << "\n  " << relation; }
            throw UnsolvableSystemError(ss.str(), { subset });
        }
        if (options_.verbose) { std::cout << "  [EquationSystem] Inconsistent subset of " << subset.size() << " relation(s)." << std::endl; }
        bad_solution_ = true;
        return false;
    }

    std::vector<SolutionMap> numeric;
    for (const auto &candidate : result.solutions) {
        if (candidate.empty()) { continue; }
        bool const resolved = std::all_of(candidate.begin(), candidate.end(), [](const auto &pair) {
            return is_quantity(pair.second);
        });
        if (resolved) { numeric.push_back(candidate); }
    }
    if (numeric.empty()) { return false; }

    std::size_t const index = *store_.index_of(id);
    for (std::size_t i = 1; i < numeric.size(); ++i) {
        std::size_t const fork = store_.create(index);
        apply(numeric[i], fork);
        if (options_.verbose) {
            std::cout << "  [EquationSystem] Forked branch id " << store_.id_at(fork) << " from id " << id << std::endl;
        }
    }
    apply(numeric.front(), index);
    return true;
}

void
EquationSystem::apply(const SolutionMap &solution, std::size_t index) {
    for (const auto &name : store_.variables()) {
        auto it = solution.find(Variable(name));
        Expression const value =
          it != solution.end() ? it->second : oracle_->simplify(store_.get(name, index).substitute(solution));
        store_.set(name, value, index);
        if (options_.verbose && it != solution.end()) {
            std::cout << "  [EquationSystem]   " << name << " = " << value << std::endl;
        }
    }
}

void
EquationSystem::prune(std::size_t start_id) {
    if (!marked_.empty()) {
        std::vector<std::vector<Relation>> contradictions;
        std::size_t live_marked = 0;
        for (const auto &pair : marked_) {
            contradictions.push_back(pair.second);
            if (store_.index_of(pair.first).has_value()) { ++live_marked; }
        }

        if (live_marked == store_.count()) {
            marked_.clear();
            std::stringstream ss;
            ss << "No branch is consistent with the equations. Contradictions found:";
            for (const auto &set : contradictions) {
                if (!set.empty()) { ss << "\n  " << set.back(); }
            }
            throw UnsolvableSystemError(ss.str(), contradictions);
        }

        for (const auto &pair : marked_) {
            std::optional<std::size_t> const index = store_.index_of(pair.first);
            if (!index.has_value()) { continue; }
            if (options_.verbose) {
                std::cout << "  [EquationSystem] Removing contradictory branch id " << pair.first << " (fingerprint "
                          << std::hex << store_.fingerprint(*index) << std::dec << ")" << std::endl;
            }
            store_.remove(*index);
        }
        marked_.clear();
    }

    std::optional<std::size_t> const start = store_.index_of(start_id);
    if (start.has_value()) { store_.set_current(*start); }
}

Expression
EquationSystem::get(const std::string &name) const {
    return store_.get(name);
}

void
EquationSystem::set(const std::string &name, const Expression &value) {
    if (in_procedure_) {
        // Before the first fork the current branch is the only one
        store_.set(name, value);
        return;
    }
    if (solved_) {
        std::cerr << "Warning: setting '" << name << "' after solve(); the value is not checked against the solution."
                  << std::endl;
    }
    store_.set_all_branches(name, value);
}

bool
EquationSystem::is_resolved(const std::string &name) const {
    return oracle_->free_variables(store_.get(name)).empty();
}

void
EquationSystem::add_variables(const std::vector<std::string> &names) {
    if (store_.locked()) { throw ConfigurationError("Variables cannot be added after the system has branched."); }
    validate_names(names);
    store_.add_variables(names);
}

void
EquationSystem::clear_variable(const std::string &name) {
    store_.set_all_branches(name, Expression(Variable(name)));
    solved_ = false;
}

std::map<std::string, Expression>
EquationSystem::solved_variables() const {
    std::map<std::string, Expression> result;
    for (const auto &pair : store_.bindings()) {
        if (oracle_->free_variables(pair.second).empty()) { result.insert(pair); }
    }
    return result;
}

void
EquationSystem::delete_current_branch() {
    if (store_.count() == 1) {
        throw UnsolvableSystemError("Cannot delete the last remaining branch: the system would have no solution.");
    }
    if (options_.verbose) {
        std::cout << "  [EquationSystem] Deleting branch id " << store_.id_at(store_.current_index()) << std::endl;
    }
    store_.remove(store_.current_index());
}

void
EquationSystem::switch_branch(std::size_t index) {
    store_.set_current(index);
}

void
EquationSystem::rotate_branch() {
    store_.rotate();
}

std::vector<Expression>
EquationSystem::values_across_branches(const std::string &name) const {
    std::vector<Expression> result;
    for (std::size_t i = 0; i < store_.count(); ++i) {
        const Expression &value = store_.get(name, i);
        if (std::find(result.begin(), result.end(), value) == result.end()) { result.push_back(value); }
    }
    return result;
}

std::vector<double>
EquationSystem::numeric_values_across_branches(const std::string &name) const {
    std::vector<double> result;
    for (const auto &value : values_across_branches(name)) { result.push_back(to_double(value)); }
    std::sort(result.begin(), result.end());
    result.erase(std::unique(result.begin(), result.end()), result.end());
    return result;
}

std::string
EquationSystem::description(const std::string &name) const {
    if (!store_.has_variable(name)) { throw std::invalid_argument("Unknown variable '" + name + "'."); }
    auto it = descriptions_.find(name);
    return it == descriptions_.end() ? std::string() : it->second;
}

void
EquationSystem::print_branches(std::ostream &os) const {
    for (std::size_t i = 0; i < store_.count(); ++i) {
        os << "Branch " << i << " (id " << store_.id_at(i) << ")";
        if (i == store_.current_index()) { os << " [current]"; }
        os << "\n";
        for (const auto &name : store_.variables()) {
            os << "  " << name << " = " << store_.get(name, i);
            auto it = descriptions_.find(name);
            if (it != descriptions_.end() && !it->second.empty()) { os << "    # " << it->second; }
            os << "\n";
        }
    }
}

void
EquationSystem::validate_names(const std::vector<std::string> &names) const {
    std::set<std::string> seen;
    for (const auto &name : names) {
        if (!is_identifier(name)) { throw ConfigurationError("'" + name + "' is not a valid variable name."); }
        if (!seen.insert(name).second || store_.has_variable(name)) {
            throw ConfigurationError("Variable '" + name + "' is declared more than once.");
        }
    }
}

void
EquationSystem::validate_method_name(const std::string &kind, const std::string &name) const {
    if (name.empty()) { throw ConfigurationError("A " + kind + " needs a name."); }
    auto const same_name = [&name](const auto &entry) { return entry.first == name; };
    if (std::any_of(equations_.begin(), equations_.end(), same_name) ||
        std::any_of(procedures_.begin(), procedures_.end(), same_name)) {
        throw ConfigurationError("A method named '" + name + "' is already registered.");
    }
}

double
to_double(const Expression &expr) {
    for (const auto &v : expr.variables()) {
        if (!v.is_unit) {
            std::stringstream ss;
            ss << "Value " << expr << " depends on the unresolved variable '" << v << "'.";
            throw UnresolvedValueError(ss.str());
        }
    }
    if (has_units(expr)) {
        std::stringstream ss;
        ss << "Value " << expr << " carries units; convert it with magnitude_in first.";
        throw std::invalid_argument(ss.str());
    }
    return expr.constant_value();
}

bool
is_resolved(const Expression &expr) {
    return is_quantity(expr);
}

bool
solved(std::initializer_list<Expression> exprs) {
    return std::all_of(exprs.begin(), exprs.end(), [](const Expression &e) { return is_resolved(e); });
}

} // namespace branch_eqs
