#ifndef EQUATION_SYSTEM_HPP
#define EQUATION_SYSTEM_HPP

#include "algebra_oracle.hpp"
#include "branch_store.hpp"
#include "equation_classifier.hpp"
#include "errors.hpp"
#include "solver_options.hpp"

#include <functional>
#include <initializer_list>
#include <iostream>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace branch_eqs {

/**
 * @brief A declarative system of equations solved across mutually exclusive branches.
 *
 * Variables are declared by name. Equation methods return the two sides of one
 * relation, built from get(); procedure methods run arbitrary code between passes
 * (computing derived values, or deleting branches that violate a condition).
 * solve() repeatedly hands solvable subsets of the current relations to the
 * algebra oracle, forking a branch for every additional numeric solution.
 *
 * Example:
 *   EquationSystem sys({ "x" });
 *   sys.add_equation("square", [&sys] { return std::vector<Expression>{ pow(sys.get("x"), 2), 4.0 }; });
 *   sys.solve(); // two branches, x = -2 and x = 2
 */
class EquationSystem {
  public:
    // Returns the two sides of a relation
    using EquationMethod = std::function<std::vector<Expression>()>;
    using ProcedureMethod = std::function<void()>;

    explicit EquationSystem(const std::vector<std::string> &variable_names,
                            SolverOptions options = SolverOptions(),
                            std::unique_ptr<AlgebraOracle> oracle = nullptr);

    // Variables with human-readable descriptions. Every described name must be declared.
    EquationSystem(const std::vector<std::string> &variable_names,
                   const std::map<std::string, std::string> &descriptions,
                   SolverOptions options = SolverOptions(),
                   std::unique_ptr<AlgebraOracle> oracle = nullptr);

    EquationSystem(const EquationSystem &) = delete;
    EquationSystem &operator=(const EquationSystem &) = delete;

    // Registration, in evaluation order
    EquationSystem &add_equation(const std::string &name, EquationMethod method);
    EquationSystem &add_procedure(const std::string &name, ProcedureMethod method);

    /**
     * @brief Solves every branch until no further progress is possible.
     *
     * Variables without enough information stay unresolved; that is not an error.
     * @throws UnsolvableSystemError when every branch is contradictory, or when an
     *         inconsistent subset was found and nothing could be solved.
     */
    void solve();

    // --- Variable access (current branch) ---
    [[nodiscard]] Expression get(const std::string &name) const;

    // Outside a procedure the value goes to every branch. Inside a procedure it goes to
    // the current branch only.
    void set(const std::string &name, const Expression &value);

    [[nodiscard]] bool is_resolved(const std::string &name) const;
    void add_variables(const std::vector<std::string> &names);
    void clear_variable(const std::string &name);
    [[nodiscard]] std::map<std::string, Expression> solved_variables() const;

    // --- Branch control ---
    // Removes the current branch immediately. Refuses to remove the last one.
    void delete_current_branch();
    [[nodiscard]] std::size_t branch_count() const { return store_.count(); }
    [[nodiscard]] std::size_t current_branch() const { return store_.current_index(); }
    void switch_branch(std::size_t index);
    void rotate_branch();

    // --- Branch queries ---
    [[nodiscard]] std::vector<Bindings> all_branch_bindings() const { return store_.all_bindings(); }

    // Distinct values of name across branches, in branch order
    [[nodiscard]] std::vector<Expression> values_across_branches(const std::string &name) const;

    // Distinct numeric values of name across branches, ascending.
    // Throws UnresolvedValueError if any branch leaves name unresolved.
    [[nodiscard]] std::vector<double> numeric_values_across_branches(const std::string &name) const;

    // --- Descriptions ---
    [[nodiscard]] std::string description(const std::string &name) const;
    [[nodiscard]] const std::map<std::string, std::string> &descriptions() const { return descriptions_; }

    // --- State ---
    [[nodiscard]] bool locked() const { return store_.locked(); }
    [[nodiscard]] bool is_solved() const { return solved_; }
    [[nodiscard]] const std::vector<std::string> &variables() const { return store_.variables(); }
    [[nodiscard]] const SolverOptions &options() const { return options_; }
    [[nodiscard]] const AlgebraOracle &oracle() const { return *oracle_; }
    [[nodiscard]] const BranchStore &store() const { return store_; }

    void print_branches(std::ostream &os = std::cout) const;

  private:
    void solve_branch(std::size_t id);
    bool run_procedures(std::size_t id);
    bool collect_relations(std::size_t id, std::vector<Relation> &relations);
    bool solve_subset(std::size_t id, const std::vector<Relation> &subset);
    void apply(const SolutionMap &solution, std::size_t index);
    void prune(std::size_t start_id);

    void validate_names(const std::vector<std::string> &names) const;
    void validate_method_name(const std::string &kind, const std::string &name) const;

    SolverOptions options_;
    std::unique_ptr<AlgebraOracle> oracle_;
    EquationClassifier classifier_;
    BranchStore store_;
    std::map<std::string, std::string> descriptions_;

    std::vector<std::pair<std::string, EquationMethod>> equations_;
    std::vector<std::pair<std::string, ProcedureMethod>> procedures_;

    std::map<std::size_t, std::vector<Relation>> marked_; // Contradictory branches by id
    bool bad_solution_ = false;
    bool in_procedure_ = false;
    bool solved_ = false;
};

// Numeric value of a resolved, unitless expression.
// Throws UnresolvedValueError if expr has unknowns, std::invalid_argument if it carries units.
double
to_double(const Expression &expr);

// True when expr contains no unknowns (unit tags allowed)
bool
is_resolved(const Expression &expr);

// True when every expression is resolved
bool
solved(std::initializer_list<Expression> exprs);

} // namespace branch_eqs

#endif // EQUATION_SYSTEM_HPP
