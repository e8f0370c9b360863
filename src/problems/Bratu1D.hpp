#pragma once

#include <Eigen/Dense>
#include <Eigen/Sparse>
#include "../solver/Problem.hpp"

namespace continua::problems {

// One-dimensional Bratu problem
//
//   -u''(x) = lambda * exp(u(x))  on (0, 1),  u(0) = u(1) = 0
//
// discretized with second-order central differences on n equispaced nodes
// (boundary nodes included). The lower solution branch starts at u = 0 for
// lambda = 0 and folds back at lambda* ~= 3.5138, which natural continuation
// cannot pass.
class Bratu1D : public solver::Problem {
public:
    explicit Bratu1D(int n = 51);

    // Interior rows: (A u)_i - lambda * exp(u_i); boundary rows: u_i
    Eigen::VectorXd residual(const Eigen::VectorXd& u, double lambda) const override;

    // Sparse LU of the tridiagonal Jacobian; NaN entries if factorization fails
    Eigen::VectorXd jacobian_solve(
        const Eigen::VectorXd& u, double lambda, const Eigen::VectorXd& rhs) const override;

    Eigen::VectorXd df_dlambda(const Eigen::VectorXd& u, double lambda) const override;

    // Discrete L2 norm, sqrt(h) * ||r||
    double norm(const Eigen::VectorXd& r) const override;

    Eigen::SparseMatrix<double> jacobian(const Eigen::VectorXd& u, double lambda) const;

    int size() const { return n_; }
    double h() const { return h_; }

    // Node coordinates
    Eigen::VectorXd grid() const;

private:
    // Throws std::invalid_argument unless u has one entry per node
    void check_size(const Eigen::VectorXd& u) const;

    int n_;
    double h_;
};

} // namespace continua::problems
