#pragma once

#include <Eigen/Dense>
#include <cmath>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace continua::solver {

// Threads available to the finite-difference column loop
inline int fd_threads() {
#ifdef _OPENMP
    return omp_get_max_threads();
#else
    return 1;
#endif
}

// Adaptive step size for finite differences based on x magnitude
inline double adaptive_fd_step(double x_j, double base_h = 1e-7) {
    const double abs_x = std::abs(x_j);
    if (abs_x > 1.0) {
        return base_h * abs_x;
    }
    return base_h;
}

// Compute Jacobian dF/du of F(u, lambda) using finite differences
// F: R^n x R -> R^m
// J_ij = dF_i/du_j
//
// Columns are independent and computed in parallel when OpenMP is
// available, so F must be safe to call concurrently.
template<typename Func>
Eigen::MatrixXd compute_jacobian(
    const Func& F,
    const Eigen::VectorXd& u,
    double lambda,
    double h = 1e-7,
    bool central = true
) {
    const int n = static_cast<int>(u.size());
    const Eigen::VectorXd f0 = F(u, lambda);
    const int m = static_cast<int>(f0.size());

    Eigen::MatrixXd J(m, n);

    if (central) {
        // Central difference: (F(u+h) - F(u-h)) / (2h), O(h^2) error
        #pragma omp parallel for
        for (int j = 0; j < n; ++j) {
            const double hj = adaptive_fd_step(u(j), h);
            Eigen::VectorXd u_plus = u;
            Eigen::VectorXd u_minus = u;
            u_plus(j) += hj;
            u_minus(j) -= hj;

            J.col(j) = (F(u_plus, lambda) - F(u_minus, lambda)) / (2.0 * hj);
        }
    } else {
        // Forward difference: (F(u+h) - F(u)) / h
        #pragma omp parallel for
        for (int j = 0; j < n; ++j) {
            const double hj = adaptive_fd_step(u(j), h);
            Eigen::VectorXd u_plus = u;
            u_plus(j) += hj;

            J.col(j) = (F(u_plus, lambda) - f0) / hj;
        }
    }

    return J;
}

// Central difference of F(u, lambda) in lambda
template<typename Func>
Eigen::VectorXd compute_lambda_derivative(
    const Func& F,
    const Eigen::VectorXd& u,
    double lambda,
    double h = 1e-7
) {
    const double hl = adaptive_fd_step(lambda, h);
    return (F(u, lambda + hl) - F(u, lambda - hl)) / (2.0 * hl);
}

} // namespace continua::solver
