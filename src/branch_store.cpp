#include "branch_store.hpp"

#include <functional>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace branch_eqs {

BranchStore::BranchStore(const std::vector<std::string> &variable_names) {
    branches_.push_back(Branch{ next_id_++, {} });
    add_variables(variable_names);
}

std::size_t
BranchStore::create(std::optional<std::size_t> from) {
    std::size_t const source = checked(from);
    Branch copy{ next_id_++, branches_[source].bindings };
    branches_.push_back(std::move(copy));
    locked_ = true;
    return branches_.size() - 1;
}

void
BranchStore::remove(std::size_t index) {
    checked(index);
    if (branches_.size() == 1) { throw std::logic_error("BranchStore: cannot remove the last remaining branch."); }
    branches_.erase(branches_.begin() + static_cast<std::ptrdiff_t>(index));
    if (index < current_) { --current_; }
    if (current_ >= branches_.size()) { current_ = branches_.size() - 1; }
}

void
BranchStore::rotate() {
    current_ = (current_ + 1) % branches_.size();
}

void
BranchStore::set_current(std::size_t index) {
    current_ = checked(index);
}

const Expression &
BranchStore::get(const std::string &name, std::optional<std::size_t> index) const {
    check_name(name);
    return branches_[checked(index)].bindings.at(name);
}

void
BranchStore::set(const std::string &name, const Expression &value, std::optional<std::size_t> index) {
    check_name(name);
    branches_[checked(index)].bindings[name] = value;
}

void
BranchStore::set_all_branches(const std::string &name, const Expression &value) {
    check_name(name);
    for (auto &branch : branches_) { branch.bindings[name] = value; }
}

void
BranchStore::add_variables(const std::vector<std::string> &names) {
    if (locked_) {
        throw std::logic_error("BranchStore: variables cannot be added after the first fork.");
    }
    for (const auto &name : names) {
        if (has_variable(name)) {
            std::stringstream ss;
            ss << "BranchStore: variable '" << name << "' is already declared.";
            throw std::invalid_argument(ss.str());
        }
        order_.push_back(name);
        for (auto &branch : branches_) { branch.bindings.emplace(name, Expression(Variable(name))); }
    }
}

bool
BranchStore::has_variable(const std::string &name) const {
    return branches_.front().bindings.count(name) > 0;
}

std::size_t
BranchStore::id_at(std::size_t index) const {
    return branches_[checked(index)].id;
}

std::optional<std::size_t>
BranchStore::index_of(std::size_t id) const {
    for (std::size_t i = 0; i < branches_.size(); ++i) {
        if (branches_[i].id == id) { return i; }
    }
    return std::nullopt;
}

const Bindings &
BranchStore::bindings(std::optional<std::size_t> index) const {
    return branches_[checked(index)].bindings;
}

std::vector<Bindings>
BranchStore::all_bindings() const {
    std::vector<Bindings> result;
    result.reserve(branches_.size());
    for (const auto &branch : branches_) { result.push_back(branch.bindings); }
    return result;
}

bool
BranchStore::is_uniform(const std::string &name) const {
    check_name(name);
    const Expression &first = branches_.front().bindings.at(name);
    for (const auto &branch : branches_) {
        if (branch.bindings.at(name) != first) { return false; }
    }
    return true;
}

std::size_t
BranchStore::fingerprint(std::size_t index) const {
    std::stringstream ss;
    ss.precision(17);
    for (const auto &pair : branches_[checked(index)].bindings) { ss << pair.first << '=' << pair.second << ';'; }
    return std::hash<std::string>{}(ss.str());
}

std::size_t
BranchStore::checked(std::optional<std::size_t> index) const {
    std::size_t const resolved = index.value_or(current_);
    if (resolved >= branches_.size()) {
        std::stringstream ss;
        ss << "BranchStore: branch index " << resolved << " out of range (" << branches_.size() << " branches).";
        throw std::out_of_range(ss.str());
    }
    return resolved;
}

void
BranchStore::check_name(const std::string &name) const {
    if (!has_variable(name)) {
        std::stringstream ss;
        ss << "BranchStore: unknown variable '" << name << "'.";
        throw std::invalid_argument(ss.str());
    }
}

} // namespace branch_eqs
