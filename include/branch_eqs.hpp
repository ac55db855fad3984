#ifndef BRANCH_EQS_HPP
#define BRANCH_EQS_HPP

// Include all library headers here
#include "algebra_oracle.hpp"
#include "branch_store.hpp"
#include "equation_classifier.hpp"
#include "equation_system.hpp"
#include "errors.hpp"
#include "polynomial.hpp"
#include "polynomial_oracle.hpp"
#include "rational_function_operators.hpp"
#include "solver_options.hpp"
#include "units.hpp"
#include "variable_operators.hpp"

// This is the main header file for the branch_eqs library
// Include this single header to access all functionality

#endif // BRANCH_EQS_HPP
