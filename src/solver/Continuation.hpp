#pragma once

#include <Eigen/Dense>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "ContinuationConfig.hpp"
#include "Diagnostics.hpp"
#include "NewtonSolver.hpp"
#include "Problem.hpp"

namespace continua::solver {

// Raised when the corrector cannot be recovered: at the initial point, or
// once backoff has shrunk the step below ContinuationConfig::min_step
class NewtonConvergenceError : public std::runtime_error {
public:
    NewtonConvergenceError(const std::string& what, double lambda, int iterations)
        : std::runtime_error(what), lambda_(lambda), iterations_(iterations) {}

    // Parameter value at which the corrector failed
    double lambda() const { return lambda_; }

    // Corrector iterations reached before giving up
    int iterations() const { return iterations_; }

private:
    double lambda_;
    int iterations_;
};

// Invoked once per accepted point, step 0 being the initial solve
using StepCallback = std::function<void(int step, double lambda, const Eigen::VectorXd& u)>;

// Invoked for every corrector trial, accepted or not, before the step callback
using TrialCallback = std::function<void(const StepStats&)>;

enum class ContinuationStatus {
    MaxStepsReached,
    MilestonesReached
};

const char* status_to_string(ContinuationStatus status);

struct ContinuationResult {
    Eigen::VectorXd u;            // Last accepted solution
    double lambda = 0.0;          // Last accepted parameter
    double step_size = 0.0;       // Step size the next prediction would have used
    int steps = 0;                // Index of the last accepted step
    ContinuationStatus status = ContinuationStatus::MaxStepsReached;
    ContinuationTrace trace;
};

// Position in the milestone sequence
class MilestoneCursor {
public:
    explicit MilestoneCursor(const std::vector<double>& milestones)
        : milestones_(milestones) {}

    bool configured() const { return !milestones_.empty(); }
    bool pending() const { return next_ < milestones_.size(); }
    bool exhausted() const { return configured() && !pending(); }

    // Next milestone; only valid while pending()
    double current() const { return milestones_[next_]; }

    void advance() { ++next_; }

private:
    const std::vector<double>& milestones_;
    size_t next_ = 0;
};

// Natural parameter continuation
//
// Solves F(u, lambda0) = 0, then repeatedly increases lambda and corrects
// with Newton from a predicted initial guess. A failed corrector halves the
// step and retries from the last accepted point; a successful one grows the
// step according to how much of the corrector budget was left unused.
// Cannot pass turning points of the solution curve.
class NaturalContinuation {
public:
    explicit NaturalContinuation(ContinuationConfig config = {});

    // Forward every corrector iteration (lambda filled in) to a callback
    void set_iteration_callback(IterationCallback callback);

    void set_trial_callback(TrialCallback callback);

    // Trace the branch through (u0, lambda0)
    // Throws NewtonConvergenceError if the initial point does not converge
    // or the backoff floor is crossed, std::invalid_argument for an invalid
    // configuration or an empty u0; exceptions from the callback propagate.
    ContinuationResult run(const Problem& problem, Eigen::VectorXd u0, double lambda0,
                           const StepCallback& callback) const;

    const ContinuationConfig& config() const { return config_; }

    // Step size after an accepted step that used newton_steps corrections
    static double grow_step(double step, int newton_steps, const ContinuationConfig& config);

private:
    ContinuationConfig config_;
    std::optional<IterationCallback> iteration_callback_;
    std::optional<TrialCallback> trial_callback_;

    Eigen::VectorXd predict(const Problem& problem, const Eigen::VectorXd& u,
                            double lambda, double lambda_new) const;

    NewtonResult correct(const Problem& problem, Eigen::VectorXd guess, double lambda) const;
};

} // namespace continua::solver
