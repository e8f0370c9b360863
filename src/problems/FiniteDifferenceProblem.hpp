#pragma once

#include <Eigen/Dense>
#include <functional>
#include "../solver/Problem.hpp"

namespace continua::problems {

// Residual F(u, lambda)
using ResidualFunction = std::function<Eigen::VectorXd(const Eigen::VectorXd&, double)>;

// Problem built from a residual alone
//
// dF/du and dF/dlambda are approximated by central differences and the
// dense Jacobian is factorized with full-pivoting LU on every solve. Meant
// for small systems where writing the Jacobian by hand is not worth it.
class FiniteDifferenceProblem : public solver::Problem {
public:
    explicit FiniteDifferenceProblem(ResidualFunction F, double fd_step = 1e-7);

    Eigen::VectorXd residual(const Eigen::VectorXd& u, double lambda) const override;

    // Returns NaN entries when the Jacobian is singular
    Eigen::VectorXd jacobian_solve(
        const Eigen::VectorXd& u, double lambda, const Eigen::VectorXd& rhs) const override;

    Eigen::VectorXd df_dlambda(const Eigen::VectorXd& u, double lambda) const override;

    Eigen::MatrixXd jacobian(const Eigen::VectorXd& u, double lambda) const;

private:
    ResidualFunction F_;
    double fd_step_;
};

} // namespace continua::problems
