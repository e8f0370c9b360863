#include "FiniteDifferenceProblem.hpp"
#include "../solver/FiniteDiff.hpp"
#include <limits>
#include <stdexcept>

namespace continua::problems {

FiniteDifferenceProblem::FiniteDifferenceProblem(ResidualFunction F, double fd_step)
    : F_(std::move(F)), fd_step_(fd_step)
{
    if (!F_) {
        throw std::invalid_argument("FiniteDifferenceProblem requires a residual function");
    }
}

Eigen::VectorXd FiniteDifferenceProblem::residual(const Eigen::VectorXd& u, double lambda) const {
    return F_(u, lambda);
}

Eigen::MatrixXd FiniteDifferenceProblem::jacobian(const Eigen::VectorXd& u, double lambda) const {
    return solver::compute_jacobian(F_, u, lambda, fd_step_, true);
}

Eigen::VectorXd FiniteDifferenceProblem::jacobian_solve(
    const Eigen::VectorXd& u, double lambda, const Eigen::VectorXd& rhs) const
{
    Eigen::FullPivLU<Eigen::MatrixXd> lu(jacobian(u, lambda));
    if (!lu.isInvertible()) {
        return Eigen::VectorXd::Constant(rhs.size(), std::numeric_limits<double>::quiet_NaN());
    }
    return lu.solve(rhs);
}

Eigen::VectorXd FiniteDifferenceProblem::df_dlambda(const Eigen::VectorXd& u, double lambda) const {
    return solver::compute_lambda_derivative(F_, u, lambda, fd_step_);
}

} // namespace continua::problems
