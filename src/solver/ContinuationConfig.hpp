#pragma once

#include <limits>
#include <vector>
#include <nlohmann/json.hpp>

namespace continua::solver {

// Initial guess used for the corrector at a new parameter value
enum class PredictorOrder {
    ZeroOrder,   // Reuse the previous solution
    FirstOrder   // Extrapolate along the tangent du/dlambda = -J^{-1} dF/dlambda
};

NLOHMANN_JSON_SERIALIZE_ENUM(PredictorOrder, {
    {PredictorOrder::ZeroOrder, "zero_order"},
    {PredictorOrder::FirstOrder, "first_order"},
})

// Options for natural parameter continuation
//
// The step size is adapted after each accepted step so that roughly
// max_newton_steps corrections are spent per step: the fewer corrections a
// step took, the more the next step grows, scaled by aggressiveness.
struct ContinuationConfig {
    double initial_step = 1e-1;                                    // Initial lambda step
    double max_step = std::numeric_limits<double>::infinity();     // Upper bound on lambda step
    double aggressiveness = 2.0;                                   // Step growth coefficient
    int max_newton_steps = 5;                                      // Corrector budget per step
    double newton_tol = 1e-12;                                     // Corrector tolerance
    int max_steps = std::numeric_limits<int>::max();               // Accepted steps after the initial point
    PredictorOrder predictor = PredictorOrder::FirstOrder;
    std::vector<double> milestones;                                // Lambda values not to step over
    bool verbose = false;                                          // Print step transitions and residuals
    double min_step = 1e-12;                                       // Backoff floor, 0 disables

    // Throws std::invalid_argument when an option is out of range or the
    // milestones are not strictly increasing past lambda0
    void validate(double lambda0) const;
};

// Missing keys keep their defaults; an infinite max_step is stored as null
void to_json(nlohmann::json& j, const ContinuationConfig& config);
void from_json(const nlohmann::json& j, ContinuationConfig& config);

} // namespace continua::solver
