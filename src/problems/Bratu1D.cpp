#include "Bratu1D.hpp"
#include <Eigen/SparseLU>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace continua::problems {

Bratu1D::Bratu1D(int n)
    : n_(n), h_(0.0)
{
    if (n < 3) {
        throw std::invalid_argument(
            "Bratu1D needs at least 3 nodes, got " + std::to_string(n));
    }
    h_ = 1.0 / (n - 1);
}

Eigen::VectorXd Bratu1D::grid() const {
    return Eigen::VectorXd::LinSpaced(n_, 0.0, 1.0);
}

void Bratu1D::check_size(const Eigen::VectorXd& u) const {
    if (u.size() != n_) {
        throw std::invalid_argument(
            "Bratu1D: expected " + std::to_string(n_) + " unknowns, got " +
            std::to_string(u.size()));
    }
}

Eigen::VectorXd Bratu1D::residual(const Eigen::VectorXd& u, double lambda) const {
    check_size(u);

    const double inv_h2 = 1.0 / (h_ * h_);
    Eigen::VectorXd r(n_);

    r(0) = u(0);
    r(n_ - 1) = u(n_ - 1);
    for (int i = 1; i < n_ - 1; ++i) {
        r(i) = (-u(i - 1) + 2.0 * u(i) - u(i + 1)) * inv_h2 - lambda * std::exp(u(i));
    }

    return r;
}

Eigen::SparseMatrix<double> Bratu1D::jacobian(const Eigen::VectorXd& u, double lambda) const {
    check_size(u);
    const double inv_h2 = 1.0 / (h_ * h_);

    std::vector<Eigen::Triplet<double>> entries;
    entries.reserve(3 * n_);

    entries.emplace_back(0, 0, 1.0);
    entries.emplace_back(n_ - 1, n_ - 1, 1.0);
    for (int i = 1; i < n_ - 1; ++i) {
        entries.emplace_back(i, i - 1, -inv_h2);
        entries.emplace_back(i, i, 2.0 * inv_h2 - lambda * std::exp(u(i)));
        entries.emplace_back(i, i + 1, -inv_h2);
    }

    Eigen::SparseMatrix<double> J(n_, n_);
    J.setFromTriplets(entries.begin(), entries.end());
    return J;
}

Eigen::VectorXd Bratu1D::jacobian_solve(
    const Eigen::VectorXd& u, double lambda, const Eigen::VectorXd& rhs) const
{
    check_size(rhs);
    Eigen::SparseMatrix<double> J = jacobian(u, lambda);
    J.makeCompressed();

    Eigen::SparseLU<Eigen::SparseMatrix<double>> lu;
    lu.analyzePattern(J);
    lu.factorize(J);
    if (lu.info() != Eigen::Success) {
        return Eigen::VectorXd::Constant(rhs.size(), std::numeric_limits<double>::quiet_NaN());
    }

    Eigen::VectorXd x = lu.solve(rhs);
    if (lu.info() != Eigen::Success) {
        return Eigen::VectorXd::Constant(rhs.size(), std::numeric_limits<double>::quiet_NaN());
    }
    return x;
}

Eigen::VectorXd Bratu1D::df_dlambda(const Eigen::VectorXd& u, double /*lambda*/) const {
    check_size(u);
    Eigen::VectorXd d = -u.array().exp().matrix();
    d(0) = 0.0;
    d(n_ - 1) = 0.0;
    return d;
}

double Bratu1D::norm(const Eigen::VectorXd& r) const {
    return std::sqrt(h_) * r.norm();
}

} // namespace continua::problems
