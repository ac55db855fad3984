#ifndef BRANCH_STORE_HPP
#define BRANCH_STORE_HPP

#include "polynomial.hpp"
#include "rational_function_operators.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace branch_eqs {

using Bindings = std::map<std::string, Expression>;

// One hypothesis about the values of every declared variable
struct Branch {
    std::size_t id = 0; // Stable, never reused within a store
    Bindings bindings;
};

/**
 * @brief Ordered collection of branches plus the current-branch cursor.
 *
 * Every branch holds a binding for every declared variable; an unresolved
 * variable is bound to its own symbol. The store never becomes empty.
 */
class BranchStore {
  public:
    explicit BranchStore(const std::vector<std::string> &variable_names = {});

    // Appends a deep copy of branch `from` (default: current) and locks the variable set.
    // Returns the index of the new branch.
    std::size_t create(std::optional<std::size_t> from = std::nullopt);

    // Deletes a branch and clamps the cursor. Refuses to delete the last branch.
    void remove(std::size_t index);

    void rotate();
    void set_current(std::size_t index);
    [[nodiscard]] std::size_t current_index() const { return current_; }

    [[nodiscard]] const Expression &get(const std::string &name, std::optional<std::size_t> index = std::nullopt) const;
    void set(const std::string &name, const Expression &value, std::optional<std::size_t> index = std::nullopt);
    void set_all_branches(const std::string &name, const Expression &value);

    // Declares more variables, bound to themselves in every branch. Only valid before the first fork.
    void add_variables(const std::vector<std::string> &names);
    [[nodiscard]] bool has_variable(const std::string &name) const;
    [[nodiscard]] const std::vector<std::string> &variables() const { return order_; }

    [[nodiscard]] std::size_t count() const { return branches_.size(); }
    [[nodiscard]] std::size_t id_at(std::size_t index) const;
    [[nodiscard]] std::optional<std::size_t> index_of(std::size_t id) const;

    [[nodiscard]] const Bindings &bindings(std::optional<std::size_t> index = std::nullopt) const;
    [[nodiscard]] std::vector<Bindings> all_bindings() const;

    // True when name is bound to the same expression in every branch
    [[nodiscard]] bool is_uniform(const std::string &name) const;

    // Content hash of a branch's bindings, for diagnostics. Branches are identified by id_at(), not by content.
    [[nodiscard]] std::size_t fingerprint(std::size_t index) const;

    [[nodiscard]] bool locked() const { return locked_; }

  private:
    std::size_t checked(std::optional<std::size_t> index) const;
    void check_name(const std::string &name) const;

    std::vector<Branch> branches_;
    std::vector<std::string> order_;
    std::size_t current_ = 0;
    std::size_t next_id_ = 0;
    bool locked_ = false;
};

} // namespace branch_eqs

#endif // BRANCH_STORE_HPP
