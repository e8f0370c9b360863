#pragma once

#include <vector>
#include <string>
#include <functional>
#include <Eigen/Dense>
#include <nlohmann/json.hpp>

namespace continua::solver {

// Why a Newton iteration record was written
enum class IterationOutcome {
    Corrected,            // Correction applied, solve continues
    Converged,            // Residual below tolerance
    ResidualNotFinite,
    InvalidCorrection,    // Linear solve returned a wrong size or non-finite entries
    BudgetExhausted
};

NLOHMANN_JSON_SERIALIZE_ENUM(IterationOutcome, {
    {IterationOutcome::Corrected, "corrected"},
    {IterationOutcome::Converged, "converged"},
    {IterationOutcome::ResidualNotFinite, "residual_not_finite"},
    {IterationOutcome::InvalidCorrection, "invalid_correction"},
    {IterationOutcome::BudgetExhausted, "budget_exhausted"},
})

inline const char* describe(IterationOutcome outcome) {
    switch (outcome) {
        case IterationOutcome::Corrected: return "correction applied";
        case IterationOutcome::Converged: return "residual below tolerance";
        case IterationOutcome::ResidualNotFinite: return "residual not finite";
        case IterationOutcome::InvalidCorrection: return "linear solve returned an invalid correction";
        case IterationOutcome::BudgetExhausted: return "correction budget exhausted";
    }
    return "unknown";
}

// One residual evaluation of a Newton solve
struct IterationStats {
    int iteration = 0;            // Corrections applied before this evaluation
    double residual_norm = 0.0;
    double step_norm = 0.0;       // Norm of the correction that produced this iterate
    double lambda = 0.0;          // Parameter the residual is evaluated at, set by the driver
    IterationOutcome outcome = IterationOutcome::Corrected;

    nlohmann::json to_json() const {
        return {
            {"iteration", iteration},
            {"residual_norm", residual_norm},
            {"step_norm", step_norm},
            {"lambda", lambda},
            {"outcome", outcome}
        };
    }
};

// Records of one Newton solve; the last one carries the final outcome
struct NewtonTrace {
    std::vector<IterationStats> iterations;

    IterationOutcome outcome() const {
        return iterations.empty() ? IterationOutcome::Corrected : iterations.back().outcome;
    }

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["outcome"] = outcome();
        j["iterations"] = nlohmann::json::array();
        for (const auto& it : iterations) {
            j["iterations"].push_back(it.to_json());
        }
        return j;
    }
};

// One continuation trial, accepted or rejected
struct StepStats {
    int step = 0;                 // Index of the accepted step this trial tried to produce
    double lambda_from = 0.0;     // Last accepted parameter
    double lambda_to = 0.0;       // Trial parameter (after milestone clamping)
    double step_size = 0.0;       // Step size used for the prediction
    int newton_steps = 0;         // Corrector iterations used (or reached, on failure)
    double residual_norm = 0.0;   // Final corrector residual
    bool accepted = false;
    bool milestone = false;       // Trial landed on a milestone

    nlohmann::json to_json() const {
        return {
            {"step", step},
            {"lambda_from", lambda_from},
            {"lambda_to", lambda_to},
            {"step_size", step_size},
            {"newton_steps", newton_steps},
            {"residual_norm", residual_norm},
            {"accepted", accepted},
            {"milestone", milestone}
        };
    }
};

// Trace of a continuation run
struct ContinuationTrace {
    std::vector<StepStats> trials;
    int accepted_steps = 0;
    int rejected_steps = 0;
    int total_newton_steps = 0;

    void add_trial(const StepStats& stats) {
        trials.push_back(stats);
        if (stats.accepted) {
            accepted_steps++;
        } else {
            rejected_steps++;
        }
        total_newton_steps += stats.newton_steps;
    }

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["accepted_steps"] = accepted_steps;
        j["rejected_steps"] = rejected_steps;
        j["total_newton_steps"] = total_newton_steps;
        j["trials"] = nlohmann::json::array();
        for (const auto& t : trials) {
            j["trials"].push_back(t.to_json());
        }
        return j;
    }
};

// Receives each iteration record and the iterate it was evaluated at
using IterationCallback = std::function<void(const IterationStats&, const Eigen::VectorXd&)>;

} // namespace continua::solver
