#pragma once

#include <Eigen/Dense>
#include <cmath>
#include <cstdio>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include "Diagnostics.hpp"

namespace continua::solver {

// Configuration for Newton solver
struct NewtonConfig {
    double tol = 1e-10;           // Convergence tolerance on residual norm
    int max_iters = 20;           // Maximum corrections
    bool verbose = false;         // Print iteration info
};

// Result of Newton solve
//
// converged == false is an ordinary outcome, not an error: iterations then
// holds the count reached when the solve gave up.
struct NewtonResult {
    Eigen::VectorXd x;            // Solution (last iterate on failure)
    NewtonTrace trace;            // One record per residual evaluation
    bool converged = false;
    int iterations = 0;           // Corrections actually applied
    double final_residual = 0.0;
};

// Newton solver for F(x) = 0
//
// The Jacobian never appears explicitly: the caller supplies an oracle that
// solves J(x) dx = rhs for the current iterate, which may be a direct
// factorization or an approximate iterative solve. Corrections are applied
// undamped, x <- x + dx.
class NewtonSolver {
public:
    explicit NewtonSolver(NewtonConfig config = {});

    // Set callback to receive iteration updates (for telemetry)
    void set_callback(IterationCallback callback);

    // Solve F(x) = 0 starting from x0
    //   F(x) -> r                       residual, same dimension as x
    //   linear_solve(x, rhs) -> dx      solves J(x) dx = rhs
    //   norm(r) -> double               convergence measure
    template<typename Func, typename LinearSolve, typename Norm>
    NewtonResult solve(Func&& F, LinearSolve&& linear_solve, Norm&& norm,
                       Eigen::VectorXd x0) const;

    // Same as above with the Euclidean norm
    template<typename Func, typename LinearSolve>
    NewtonResult solve(Func&& F, LinearSolve&& linear_solve, Eigen::VectorXd x0) const;

    // Get current configuration
    const NewtonConfig& config() const { return config_; }

    // Modify configuration
    NewtonConfig& config() { return config_; }

private:
    NewtonConfig config_;
    std::optional<IterationCallback> callback_;

    void report(NewtonResult& result, const IterationStats& stats) const;
};

// Implementation

inline NewtonSolver::NewtonSolver(NewtonConfig config)
    : config_(std::move(config)) {}

inline void NewtonSolver::set_callback(IterationCallback callback) {
    callback_ = std::move(callback);
}

inline void NewtonSolver::report(NewtonResult& result, const IterationStats& stats) const {
    result.trace.iterations.push_back(stats);
    if (callback_) (*callback_)(stats, result.x);
}

template<typename Func, typename LinearSolve, typename Norm>
NewtonResult NewtonSolver::solve(Func&& F, LinearSolve&& linear_solve, Norm&& norm,
                                 Eigen::VectorXd x0) const {
    NewtonResult result;
    result.x = std::move(x0);

    const Eigen::Index n = result.x.size();

    // Initial residual
    Eigen::VectorXd r = F(result.x);
    if (r.size() != n) {
        throw std::invalid_argument(
            "Newton solver requires square system: F: R^n -> R^n. "
            "Got input dim " + std::to_string(n) +
            ", output dim " + std::to_string(r.size()));
    }

    double residual_norm = norm(r);
    double step_norm = 0.0;

    if (config_.verbose) {
        std::printf("||F(u)|| = %e\n", residual_norm);
    }

    auto finish = [&](IterationStats& stats, IterationOutcome outcome) {
        stats.outcome = outcome;
        report(result, stats);

        result.converged = outcome == IterationOutcome::Converged;
        result.iterations = stats.iteration;
        result.final_residual = residual_norm;
    };

    // Convergence is checked before every correction, so a converged x0
    // returns with zero iterations regardless of the budget.
    for (int iter = 0;; ++iter) {
        IterationStats stats;
        stats.iteration = iter;
        stats.residual_norm = residual_norm;
        stats.step_norm = step_norm;

        if (!std::isfinite(residual_norm)) {
            finish(stats, IterationOutcome::ResidualNotFinite);
            return result;
        }

        if (residual_norm < config_.tol) {
            finish(stats, IterationOutcome::Converged);
            return result;
        }

        if (iter >= config_.max_iters) {
            finish(stats, IterationOutcome::BudgetExhausted);
            return result;
        }

        Eigen::VectorXd rhs = -r;
        Eigen::VectorXd dx = linear_solve(result.x, rhs);
        if (dx.size() != n || !dx.allFinite()) {
            finish(stats, IterationOutcome::InvalidCorrection);
            return result;
        }

        report(result, stats);

        result.x += dx;
        r = F(result.x);
        residual_norm = norm(r);
        step_norm = dx.norm();

        if (config_.verbose) {
            std::printf("||F(u)|| = %e\n", residual_norm);
        }
    }
}

template<typename Func, typename LinearSolve>
NewtonResult NewtonSolver::solve(Func&& F, LinearSolve&& linear_solve,
                                 Eigen::VectorXd x0) const {
    return solve(std::forward<Func>(F), std::forward<LinearSolve>(linear_solve),
                 [](const Eigen::VectorXd& r) { return r.norm(); }, std::move(x0));
}

} // namespace continua::solver
