// Tests for natural parameter continuation
//
// Linear problems make the corrector exact in a single iteration, so step
// sizes and parameter sequences can be checked value by value.

#include <catch2/catch.hpp>
#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "solver/Continuation.hpp"
#include "problems/Bratu1D.hpp"

using namespace continua;
using namespace continua::solver;
using Catch::Matchers::WithinAbs;

namespace {

// F(u, lambda) = u - lambda * c
class LinearProblem : public Problem {
public:
    explicit LinearProblem(Eigen::VectorXd c) : c_(std::move(c)) {}

    Eigen::VectorXd residual(const Eigen::VectorXd& u, double lambda) const override {
        return u - lambda * c_;
    }

    Eigen::VectorXd jacobian_solve(
        const Eigen::VectorXd&, double, const Eigen::VectorXd& rhs) const override {
        return rhs;
    }

    Eigen::VectorXd df_dlambda(const Eigen::VectorXd&, double) const override {
        return -c_;
    }

private:
    Eigen::VectorXd c_;
};

// Linear problem whose Jacobian solve makes no progress for lambda in (lo, hi)
class StallingProblem : public LinearProblem {
public:
    StallingProblem(double lo, double hi)
        : LinearProblem(Eigen::VectorXd::Ones(1)), lo_(lo), hi_(hi) {}

    Eigen::VectorXd jacobian_solve(
        const Eigen::VectorXd& u, double lambda, const Eigen::VectorXd& rhs) const override {
        if (lambda > lo_ && lambda < hi_) {
            return Eigen::VectorXd::Zero(rhs.size());
        }
        return LinearProblem::jacobian_solve(u, lambda, rhs);
    }

private:
    double lo_;
    double hi_;
};

// Linear problem whose Jacobian solve makes no progress when the iterate is
// more than `reach` away from the solution
class ShortReachProblem : public LinearProblem {
public:
    explicit ShortReachProblem(double reach)
        : LinearProblem(Eigen::VectorXd::Ones(1)), reach_(reach) {}

    Eigen::VectorXd jacobian_solve(
        const Eigen::VectorXd& u, double lambda, const Eigen::VectorXd& rhs) const override {
        if (rhs.norm() > reach_) {
            return Eigen::VectorXd::Zero(rhs.size());
        }
        return LinearProblem::jacobian_solve(u, lambda, rhs);
    }

private:
    double reach_;
};

// F(u, lambda) = u - lambda^2 / 2, recording where the tangent is evaluated
class QuadraticProblem : public Problem {
public:
    Eigen::VectorXd residual(const Eigen::VectorXd& u, double lambda) const override {
        return u - Eigen::VectorXd::Constant(u.size(), 0.5 * lambda * lambda);
    }

    Eigen::VectorXd jacobian_solve(
        const Eigen::VectorXd&, double, const Eigen::VectorXd& rhs) const override {
        return rhs;
    }

    Eigen::VectorXd df_dlambda(const Eigen::VectorXd& u, double lambda) const override {
        tangent_lambdas.push_back(lambda);
        return Eigen::VectorXd::Constant(u.size(), -lambda);
    }

    mutable std::vector<double> tangent_lambdas;
};

struct Recorded {
    int step;
    double lambda;
    Eigen::VectorXd u;
};

struct Recorder {
    std::vector<Recorded> calls;

    StepCallback callback() {
        return [this](int step, double lambda, const Eigen::VectorXd& u) {
            calls.push_back({step, lambda, u});
        };
    }

    std::vector<double> lambdas() const {
        std::vector<double> out;
        for (const auto& c : calls) out.push_back(c.lambda);
        return out;
    }
};

} // namespace

TEST_CASE("Continuation follows u = lambda with bounded steps", "[continuation]") {
    LinearProblem problem(Eigen::VectorXd::Ones(1));

    ContinuationConfig config;
    config.initial_step = 0.1;
    config.max_step = 0.4;
    config.predictor = PredictorOrder::ZeroOrder;
    config.max_steps = 20;

    NaturalContinuation continuation(config);
    Recorder rec;
    auto result = continuation.run(problem, Eigen::VectorXd::Zero(1), 0.0, rec.callback());

    REQUIRE(result.status == ContinuationStatus::MaxStepsReached);
    REQUIRE(result.steps == 20);
    REQUIRE(rec.calls.size() == 21);

    for (size_t i = 0; i < rec.calls.size(); ++i) {
        REQUIRE(rec.calls[i].step == static_cast<int>(i));
        REQUIRE_THAT(rec.calls[i].u(0), WithinAbs(rec.calls[i].lambda, 1e-12));
        if (i > 0) {
            const double delta = rec.calls[i].lambda - rec.calls[i - 1].lambda;
            REQUIRE(delta > 0.0);
            REQUIRE(delta <= config.max_step + 1e-15);
        }
    }

    for (const auto& trial : result.trace.trials) {
        REQUIRE(trial.step_size <= config.max_step);
    }
    REQUIRE(result.step_size <= config.max_step);

    // One correction out of five leaves full slack: the step triples until clamped
    REQUIRE_THAT(rec.calls[1].lambda, WithinAbs(0.1, 1e-15));
    REQUIRE_THAT(rec.calls[2].lambda, WithinAbs(0.4, 1e-15));
    REQUIRE_THAT(rec.calls[3].lambda, WithinAbs(0.8, 1e-15));
}

TEST_CASE("Continuation stops exactly on milestones", "[continuation][milestones]") {
    LinearProblem problem(Eigen::VectorXd::Ones(2));

    for (auto predictor : {PredictorOrder::ZeroOrder, PredictorOrder::FirstOrder}) {
        ContinuationConfig config;
        config.initial_step = 0.3;
        config.milestones = {0.5, 1.0};
        config.predictor = predictor;

        NaturalContinuation continuation(config);
        Recorder rec;
        auto result = continuation.run(problem, Eigen::VectorXd::Zero(2), 0.0, rec.callback());

        auto lambdas = rec.lambdas();
        auto hit = std::find(lambdas.begin(), lambdas.end(), 0.5);
        REQUIRE(hit != lambdas.end());
        for (auto it = lambdas.begin(); it != hit; ++it) {
            REQUIRE(*it < 0.5);
        }

        REQUIRE(lambdas.back() == 1.0);
        REQUIRE(std::count_if(lambdas.begin(), lambdas.end(),
                              [](double l) { return l > 1.0; }) == 0);
        REQUIRE(result.status == ContinuationStatus::MilestonesReached);
        REQUIRE(result.lambda == 1.0);
        REQUIRE_THAT(result.u(1), WithinAbs(1.0, 1e-12));
    }
}

TEST_CASE("Failed corrector halves the step and retries", "[continuation][backoff]") {
    // Trials at 0.1 and 0.2 pass, 0.3 stalls, 0.25 passes
    StallingProblem problem(0.26, 0.35);

    ContinuationConfig config;
    config.initial_step = 0.1;
    config.aggressiveness = 0.0;
    config.predictor = PredictorOrder::ZeroOrder;
    config.max_steps = 3;

    NaturalContinuation continuation(config);
    Recorder rec;
    auto result = continuation.run(problem, Eigen::VectorXd::Zero(1), 0.0, rec.callback());

    const auto& trials = result.trace.trials;
    REQUIRE(trials.size() == 5);
    REQUIRE(result.trace.rejected_steps == 1);

    const StepStats& failed = trials[3];
    const StepStats& retry = trials[4];
    REQUIRE(!failed.accepted);
    REQUIRE(failed.newton_steps == config.max_newton_steps);
    REQUIRE_THAT(failed.lambda_to, WithinAbs(0.3, 1e-12));
    REQUIRE(retry.accepted);
    REQUIRE(retry.lambda_to < failed.lambda_to);
    REQUIRE(retry.lambda_from == failed.lambda_from);
    REQUIRE(retry.step_size == failed.step_size / 2.0);
    REQUIRE(retry.step == failed.step);

    // No callback for the failed trial, indices stay consecutive
    REQUIRE(rec.calls.size() == 4);
    for (size_t i = 0; i < rec.calls.size(); ++i) {
        REQUIRE(rec.calls[i].step == static_cast<int>(i));
        REQUIRE(!(rec.calls[i].lambda > 0.26 && rec.calls[i].lambda < 0.35));
    }
    REQUIRE_THAT(rec.calls[3].lambda, WithinAbs(0.25, 1e-12));
}

TEST_CASE("Repeated runs produce identical paths", "[continuation]") {
    problems::Bratu1D problem(21);

    ContinuationConfig config;
    config.newton_tol = 1e-10;
    config.max_step = 0.5;
    config.milestones = {1.0, 2.5};

    NaturalContinuation continuation(config);
    Recorder first;
    Recorder second;
    continuation.run(problem, Eigen::VectorXd::Zero(21), 0.0, first.callback());
    continuation.run(problem, Eigen::VectorXd::Zero(21), 0.0, second.callback());

    REQUIRE(first.calls.size() == second.calls.size());
    for (size_t i = 0; i < first.calls.size(); ++i) {
        REQUIRE(first.calls[i].step == second.calls[i].step);
        REQUIRE(first.calls[i].lambda == second.calls[i].lambda);
        REQUIRE(first.calls[i].u == second.calls[i].u);
    }
}

TEST_CASE("Initial point failure is fatal", "[continuation]") {
    StallingProblem problem(-1.0, 1.0);

    ContinuationConfig config;
    config.max_newton_steps = 4;

    NaturalContinuation continuation(config);
    Recorder rec;

    Eigen::VectorXd u0 = Eigen::VectorXd::Constant(1, 0.5);
    try {
        continuation.run(problem, u0, 0.0, rec.callback());
        FAIL("Expected NewtonConvergenceError");
    } catch (const NewtonConvergenceError& e) {
        REQUIRE(e.iterations() == 4);
        REQUIRE(e.lambda() == 0.0);
    }
    REQUIRE(rec.calls.empty());
}

TEST_CASE("Backoff below the step floor is fatal", "[continuation][backoff]") {
    // Every trial past lambda = 0.1 stalls
    StallingProblem problem(0.1, 10.0);

    ContinuationConfig config;
    config.initial_step = 0.1;
    config.predictor = PredictorOrder::ZeroOrder;
    config.min_step = 1e-3;

    NaturalContinuation continuation(config);
    Recorder rec;

    REQUIRE_THROWS_AS(
        continuation.run(problem, Eigen::VectorXd::Zero(1), 0.0, rec.callback()),
        NewtonConvergenceError);
    REQUIRE(rec.calls.size() == 2);
    REQUIRE(rec.calls.back().lambda == 0.1);
}

TEST_CASE("Max steps bounds the number of accepted points", "[continuation]") {
    LinearProblem problem(Eigen::VectorXd::Ones(1));

    for (int max_steps : {0, 1, 5}) {
        ContinuationConfig config;
        config.max_steps = max_steps;

        NaturalContinuation continuation(config);
        Recorder rec;
        auto result = continuation.run(problem, Eigen::VectorXd::Zero(1), 0.0, rec.callback());

        REQUIRE(rec.calls.size() == static_cast<size_t>(max_steps + 1));
        REQUIRE(result.steps == max_steps);
        REQUIRE(result.status == ContinuationStatus::MaxStepsReached);
    }
}

TEST_CASE("Step growth follows the unused corrector budget", "[continuation][stepsize]") {
    ContinuationConfig config;
    config.max_newton_steps = 5;
    config.aggressiveness = 2.0;

    // slack = (5 - used) / 4, growth = 1 + 2 * slack^2
    REQUIRE_THAT(NaturalContinuation::grow_step(0.1, 5, config), WithinAbs(0.1, 1e-15));
    REQUIRE_THAT(NaturalContinuation::grow_step(0.1, 3, config), WithinAbs(0.15, 1e-15));
    REQUIRE_THAT(NaturalContinuation::grow_step(0.1, 1, config), WithinAbs(0.3, 1e-15));

    config.max_step = 0.2;
    REQUIRE(NaturalContinuation::grow_step(0.1, 1, config) == 0.2);

    SECTION("single correction budget") {
        config.max_step = 1.0;
        config.max_newton_steps = 1;
        REQUIRE_THAT(NaturalContinuation::grow_step(0.1, 0, config), WithinAbs(0.3, 1e-15));
        REQUIRE(NaturalContinuation::grow_step(0.1, 1, config) == 0.1);
    }
}

TEST_CASE("Single correction budget runs without growth", "[continuation][stepsize]") {
    LinearProblem problem(Eigen::VectorXd::Ones(1));

    ContinuationConfig config;
    config.max_newton_steps = 1;
    config.predictor = PredictorOrder::ZeroOrder;
    config.max_steps = 4;

    NaturalContinuation continuation(config);
    Recorder rec;
    auto result = continuation.run(problem, Eigen::VectorXd::Zero(1), 0.0, rec.callback());

    REQUIRE(std::isfinite(result.step_size));
    REQUIRE(result.step_size == config.initial_step);
    REQUIRE_THAT(result.lambda, WithinAbs(0.4, 1e-12));
}

TEST_CASE("First-order prediction saves corrector iterations", "[continuation][predictor]") {
    problems::Bratu1D problem(31);

    auto total_newton = [&problem](PredictorOrder predictor) {
        ContinuationConfig config;
        config.initial_step = 0.25;
        config.aggressiveness = 0.0;
        config.max_newton_steps = 10;
        config.newton_tol = 1e-10;
        config.milestones = {2.0};
        config.predictor = predictor;

        NaturalContinuation continuation(config);
        auto result = continuation.run(problem, Eigen::VectorXd::Zero(31), 0.0, nullptr);
        REQUIRE(result.trace.rejected_steps == 0);
        REQUIRE(result.lambda == 2.0);
        return result.trace.total_newton_steps;
    };

    REQUIRE(total_newton(PredictorOrder::FirstOrder) < total_newton(PredictorOrder::ZeroOrder));
}

TEST_CASE("Corrector iterations are forwarded with their parameter", "[continuation]") {
    LinearProblem problem(Eigen::VectorXd::Ones(1));

    ContinuationConfig config;
    config.predictor = PredictorOrder::ZeroOrder;
    config.max_steps = 3;

    NaturalContinuation continuation(config);
    std::vector<double> iteration_lambdas;
    continuation.set_iteration_callback(
        [&iteration_lambdas](const IterationStats& stats, const Eigen::VectorXd&) {
            iteration_lambdas.push_back(stats.lambda);
        });

    Recorder rec;
    auto result = continuation.run(problem, Eigen::VectorXd::Zero(1), 0.0, rec.callback());

    REQUIRE(!iteration_lambdas.empty());
    REQUIRE(iteration_lambdas.front() == 0.0);
    REQUIRE(iteration_lambdas.back() == result.lambda);
}

TEST_CASE("Exceptions from the step callback propagate", "[continuation]") {
    LinearProblem problem(Eigen::VectorXd::Ones(1));
    NaturalContinuation continuation;

    int calls = 0;
    auto stop_at_two = [&calls](int step, double, const Eigen::VectorXd&) {
        calls++;
        if (step == 2) throw std::runtime_error("cancelled");
    };

    REQUIRE_THROWS_AS(
        continuation.run(problem, Eigen::VectorXd::Zero(1), 0.0, stop_at_two),
        std::runtime_error);
    REQUIRE(calls == 3);
}

TEST_CASE("Invalid milestones are rejected", "[continuation][milestones]") {
    LinearProblem problem(Eigen::VectorXd::Ones(1));

    ContinuationConfig decreasing;
    decreasing.milestones = {1.0, 0.5};
    REQUIRE_THROWS_AS(
        NaturalContinuation(decreasing).run(problem, Eigen::VectorXd::Zero(1), 0.0, nullptr),
        std::invalid_argument);

    ContinuationConfig behind_start;
    behind_start.milestones = {0.5};
    REQUIRE_THROWS_AS(
        NaturalContinuation(behind_start).run(problem, Eigen::VectorXd::Zero(1), 1.0, nullptr),
        std::invalid_argument);
}

TEST_CASE("Backoff after a clamped trial halves the increment tried", "[continuation][backoff]") {
    // The corrector only converges from within 0.3 of the solution, so the
    // first trial, clamped from 8 down to the milestone 0.5, fails
    ShortReachProblem problem(0.3);

    ContinuationConfig config;
    config.initial_step = 8.0;
    config.milestones = {0.5, 1.0};
    config.predictor = PredictorOrder::ZeroOrder;

    NaturalContinuation continuation(config);
    Recorder rec;
    auto result = continuation.run(problem, Eigen::VectorXd::Zero(1), 0.0, rec.callback());

    REQUIRE(result.status == ContinuationStatus::MilestonesReached);
    REQUIRE(result.lambda == 1.0);

    const auto& trials = result.trace.trials;
    REQUIRE(trials.size() == 7);
    REQUIRE(result.trace.rejected_steps == 2);

    REQUIRE(!trials[1].accepted);
    REQUIRE(trials[1].milestone);
    REQUIRE(trials[1].lambda_to == 0.5);
    REQUIRE(trials[2].accepted);
    REQUIRE_THAT(trials[2].lambda_to, WithinAbs(0.25, 1e-15));
    REQUIRE_THAT(trials[2].step_size, WithinAbs(0.25, 1e-15));

    // Every rejection is followed by a strictly shorter trial
    for (size_t i = 0; i + 1 < trials.size(); ++i) {
        if (!trials[i].accepted) {
            REQUIRE(trials[i + 1].lambda_from == trials[i].lambda_from);
            REQUIRE(trials[i + 1].lambda_to < trials[i].lambda_to);
        }
    }

    REQUIRE(rec.lambdas() == std::vector<double>{0.0, 0.25, 0.5, 0.75, 1.0});
}

TEST_CASE("First-order prediction onto a milestone uses the accepted tangent",
          "[continuation][predictor][milestones]") {
    QuadraticProblem problem;

    ContinuationConfig config;
    config.initial_step = 0.3;
    config.milestones = {0.5};
    config.predictor = PredictorOrder::FirstOrder;

    NaturalContinuation continuation(config);

    // Initial iterate of each corrector run, by parameter
    std::vector<std::pair<double, double>> guesses;
    continuation.set_iteration_callback(
        [&guesses](const IterationStats& stats, const Eigen::VectorXd& x) {
            if (stats.iteration == 0) guesses.emplace_back(stats.lambda, x(0));
        });

    auto result = continuation.run(problem, Eigen::VectorXd::Zero(1), 0.0, nullptr);

    REQUIRE(result.lambda == 0.5);
    REQUIRE(result.trace.trials.back().milestone);
    REQUIRE(result.trace.trials.back().step_size > 0.2);

    // Tangents are taken at the accepted points 0 and 0.3, never at the trial
    REQUIRE(problem.tangent_lambdas.size() == 2);
    REQUIRE(problem.tangent_lambdas[0] == 0.0);
    REQUIRE_THAT(problem.tangent_lambdas[1], WithinAbs(0.3, 1e-15));

    // u(0.3) + (0.5 - 0.3) * du/dlambda(0.3) = 0.045 + 0.2 * 0.3
    REQUIRE(guesses.size() == 3);
    REQUIRE(guesses[2].first == 0.5);
    REQUIRE_THAT(guesses[2].second, WithinAbs(0.105, 1e-12));
}

TEST_CASE("Every trial is reported before its accepted point", "[continuation]") {
    StallingProblem problem(0.26, 0.35);

    ContinuationConfig config;
    config.initial_step = 0.1;
    config.aggressiveness = 0.0;
    config.predictor = PredictorOrder::ZeroOrder;
    config.max_steps = 3;

    NaturalContinuation continuation(config);
    std::vector<std::string> events;
    continuation.set_trial_callback([&events](const StepStats& trial) {
        events.push_back(trial.accepted ? "accepted" : "rejected");
    });

    auto result = continuation.run(problem, Eigen::VectorXd::Zero(1), 0.0,
        [&events](int, double, const Eigen::VectorXd&) { events.push_back("step"); });

    REQUIRE(result.trace.trials.size() == 5);
    REQUIRE(events == std::vector<std::string>{
        "accepted", "step", "accepted", "step", "accepted", "step",
        "rejected", "accepted", "step"});
}

TEST_CASE("Empty initial guess is rejected", "[continuation]") {
    LinearProblem problem(Eigen::VectorXd::Ones(1));
    NaturalContinuation continuation;

    int calls = 0;
    REQUIRE_THROWS_AS(
        continuation.run(problem, Eigen::VectorXd(0), 0.0,
                         [&calls](int, double, const Eigen::VectorXd&) { calls++; }),
        std::invalid_argument);
    REQUIRE(calls == 0);
}
