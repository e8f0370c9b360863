#pragma once

#include <memory>
#include <string>
#include "../solver/Problem.hpp"

namespace continua::problems {

// u_i + u_i^3 = lambda * (i + 1) / n, solved with a finite-difference Jacobian
std::unique_ptr<solver::Problem> make_cubic(int n);

// Problem by CLI name ("bratu" or "cubic") with n unknowns
// Throws std::invalid_argument for an unknown name or a size the problem
// cannot be built with
std::unique_ptr<solver::Problem> make_problem(const std::string& name, int n);

} // namespace continua::problems
