#include "Continuation.hpp"
#include <algorithm>
#include <cstdio>

namespace continua::solver {

const char* status_to_string(ContinuationStatus status) {
    switch (status) {
        case ContinuationStatus::MaxStepsReached: return "max_steps_reached";
        case ContinuationStatus::MilestonesReached: return "milestones_reached";
    }
    return "unknown";
}

NaturalContinuation::NaturalContinuation(ContinuationConfig config)
    : config_(std::move(config)) {}

void NaturalContinuation::set_iteration_callback(IterationCallback callback) {
    iteration_callback_ = std::move(callback);
}

void NaturalContinuation::set_trial_callback(TrialCallback callback) {
    trial_callback_ = std::move(callback);
}

double NaturalContinuation::grow_step(double step, int newton_steps,
                                      const ContinuationConfig& config) {
    const int budget = config.max_newton_steps;

    // With a budget of one correction the slack fraction has no denominator:
    // a step that needed no correction counts as full slack, anything else as none.
    double slack;
    if (budget <= 1) {
        slack = (newton_steps == 0) ? 1.0 : 0.0;
    } else {
        slack = static_cast<double>(budget - newton_steps) / (budget - 1);
    }

    step *= 1.0 + config.aggressiveness * slack * slack;
    return std::min(step, config.max_step);
}

Eigen::VectorXd NaturalContinuation::predict(const Problem& problem, const Eigen::VectorXd& u,
                                             double lambda, double lambda_new) const {
    if (config_.predictor == PredictorOrder::ZeroOrder) {
        return u;
    }

    // Tangent of the branch at the accepted point: J du/dlambda = -dF/dlambda
    Eigen::VectorXd rhs = -problem.df_dlambda(u, lambda);
    Eigen::VectorXd du_dlambda = problem.jacobian_solve(u, lambda, rhs);
    if (du_dlambda.size() != u.size()) {
        throw std::invalid_argument(
            "jacobian_solve returned dim " + std::to_string(du_dlambda.size()) +
            ", expected " + std::to_string(u.size()));
    }

    // Singular Jacobian: no usable tangent, fall back to the previous solution
    if (!du_dlambda.allFinite()) {
        if (config_.verbose) {
            std::printf("Tangent not finite at lambda=%e, using zero-order prediction.\n", lambda);
        }
        return u;
    }

    return u + (lambda_new - lambda) * du_dlambda;
}

NewtonResult NaturalContinuation::correct(const Problem& problem, Eigen::VectorXd guess,
                                          double lambda) const {
    NewtonConfig newton_config;
    newton_config.tol = config_.newton_tol;
    newton_config.max_iters = config_.max_newton_steps;
    newton_config.verbose = config_.verbose;

    NewtonSolver newton(newton_config);
    if (iteration_callback_) {
        const IterationCallback& forward = *iteration_callback_;
        newton.set_callback([&forward, lambda](const IterationStats& stats, const Eigen::VectorXd& x) {
            IterationStats tagged = stats;
            tagged.lambda = lambda;
            forward(tagged, x);
        });
    }

    return newton.solve(
        [&problem, lambda](const Eigen::VectorXd& x) { return problem.residual(x, lambda); },
        [&problem, lambda](const Eigen::VectorXd& x, const Eigen::VectorXd& rhs) {
            return problem.jacobian_solve(x, lambda, rhs);
        },
        [&problem](const Eigen::VectorXd& r) { return problem.norm(r); },
        std::move(guess));
}

ContinuationResult NaturalContinuation::run(const Problem& problem, Eigen::VectorXd u0,
                                            double lambda0, const StepCallback& callback) const {
    config_.validate(lambda0);
    if (u0.size() == 0) {
        throw std::invalid_argument("Initial guess must have at least one unknown");
    }

    ContinuationResult result;
    MilestoneCursor milestones(config_.milestones);

    double lambda = lambda0;
    double step = std::min(config_.initial_step, config_.max_step);
    int k = 0;

    NewtonResult initial = correct(problem, std::move(u0), lambda);
    if (!initial.converged) {
        if (config_.verbose) {
            std::printf("No convergence for initial step.\n");
        }
        throw NewtonConvergenceError(
            "No convergence for initial step at lambda=" + std::to_string(lambda) +
            " (" + describe(initial.trace.outcome()) + ")",
            lambda, initial.iterations);
    }

    Eigen::VectorXd u = std::move(initial.x);

    StepStats first;
    first.lambda_from = lambda;
    first.lambda_to = lambda;
    first.newton_steps = initial.iterations;
    first.residual_norm = initial.final_residual;
    first.accepted = true;
    result.trace.add_trial(first);
    if (trial_callback_) (*trial_callback_)(first);

    if (callback) callback(k, lambda, u);

    while (true) {
        if (k >= config_.max_steps) {
            result.status = ContinuationStatus::MaxStepsReached;
            break;
        }

        // Predictor: never step over the next milestone
        double lambda_new = lambda + step;
        bool at_milestone = false;
        if (milestones.pending() && lambda_new >= milestones.current()) {
            lambda_new = milestones.current();
            at_milestone = true;
        }

        if (config_.verbose) {
            std::printf("Step %d: lambda  %.3e + %.3e  ->  %.3e\n",
                k + 1, lambda, lambda_new - lambda, lambda_new);
        }

        Eigen::VectorXd guess = predict(problem, u, lambda, lambda_new);

        // Corrector
        NewtonResult corrected = correct(problem, std::move(guess), lambda_new);

        StepStats stats;
        stats.step = k + 1;
        stats.lambda_from = lambda;
        stats.lambda_to = lambda_new;
        stats.step_size = step;
        stats.newton_steps = corrected.iterations;
        stats.residual_norm = corrected.final_residual;
        stats.accepted = corrected.converged;
        stats.milestone = at_milestone;
        result.trace.add_trial(stats);
        if (trial_callback_) (*trial_callback_)(stats);

        if (!corrected.converged) {
            if (config_.verbose) {
                std::printf("No convergence for lambda=%e.\n", lambda_new);
            }
            // Halve the increment actually tried, which the clamp may have shortened
            if (at_milestone) {
                step = lambda_new - lambda;
            }
            step /= 2.0;
            if (step < config_.min_step) {
                throw NewtonConvergenceError(
                    "Step size fell below " + std::to_string(config_.min_step) +
                    " after no convergence for lambda=" + std::to_string(lambda_new),
                    lambda_new, corrected.iterations);
            }
            continue;
        }

        lambda = lambda_new;
        u = std::move(corrected.x);
        ++k;

        if (callback) callback(k, lambda, u);

        if (at_milestone) {
            milestones.advance();
            if (milestones.exhausted()) {
                result.status = ContinuationStatus::MilestonesReached;
                break;
            }
        } else {
            step = grow_step(step, corrected.iterations, config_);
        }
    }

    result.u = std::move(u);
    result.lambda = lambda;
    result.step_size = step;
    result.steps = k;
    return result;
}

} // namespace continua::solver
