#ifndef ERRORS_HPP
#define ERRORS_HPP

#include "algebra_oracle.hpp"

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace branch_eqs {

// Invalid variable declarations or equation methods returning something other than pairs
class ConfigurationError : public std::invalid_argument {
  public:
    explicit ConfigurationError(const std::string &what)
      : std::invalid_argument(what) {}
};

/**
 * @brief Raised when no branch survives a solve, or when the equations contradict each other.
 *
 * contradictions() holds the relation set that was current when each branch was marked.
 */
class UnsolvableSystemError : public std::runtime_error {
  public:
    explicit UnsolvableSystemError(const std::string &what, std::vector<std::vector<Relation>> contradictions = {})
      : std::runtime_error(what)
      , contradictions_(std::move(contradictions)) {}

    [[nodiscard]] const std::vector<std::vector<Relation>> &contradictions() const { return contradictions_; }

  private:
    std::vector<std::vector<Relation>> contradictions_;
};

// A numeric value was requested from an expression that still contains unknowns
class UnresolvedValueError : public std::runtime_error {
  public:
    explicit UnresolvedValueError(const std::string &what)
      : std::runtime_error(what) {}
};

} // namespace branch_eqs

#endif // ERRORS_HPP
