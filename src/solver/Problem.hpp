#pragma once

#include <Eigen/Dense>

namespace continua::solver {

// Parameterized nonlinear system F(u, lambda) = 0
//
// Implementations must be pure functions of (u, lambda): the continuation
// driver may evaluate them at trial points it later discards.
class Problem {
public:
    virtual ~Problem() = default;

    // F(u, lambda)
    virtual Eigen::VectorXd residual(const Eigen::VectorXd& u, double lambda) const = 0;

    // Solve J(u, lambda) x = rhs where J = dF/du
    virtual Eigen::VectorXd jacobian_solve(
        const Eigen::VectorXd& u, double lambda, const Eigen::VectorXd& rhs) const = 0;

    // dF/dlambda at (u, lambda), only needed by the first-order predictor
    virtual Eigen::VectorXd df_dlambda(const Eigen::VectorXd& u, double lambda) const = 0;

    // Convergence measure for residuals
    virtual double norm(const Eigen::VectorXd& r) const { return r.norm(); }
};

} // namespace continua::solver
