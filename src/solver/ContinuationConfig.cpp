#include "ContinuationConfig.hpp"
#include <cmath>
#include <stdexcept>
#include <string>

namespace continua::solver {

void ContinuationConfig::validate(double lambda0) const {
    if (!(initial_step > 0.0)) {
        throw std::invalid_argument("initial_step must be positive, got " +
                                    std::to_string(initial_step));
    }
    if (!(max_step > 0.0)) {
        throw std::invalid_argument("max_step must be positive, got " +
                                    std::to_string(max_step));
    }
    if (!(aggressiveness >= 0.0)) {
        throw std::invalid_argument("aggressiveness must be non-negative");
    }
    if (max_newton_steps < 0) {
        throw std::invalid_argument("max_newton_steps must be non-negative");
    }
    if (!(newton_tol > 0.0)) {
        throw std::invalid_argument("newton_tol must be positive");
    }
    if (max_steps < 0) {
        throw std::invalid_argument("max_steps must be non-negative");
    }
    if (!(min_step >= 0.0)) {
        throw std::invalid_argument("min_step must be non-negative");
    }
    if (!std::isfinite(lambda0)) {
        throw std::invalid_argument("lambda0 must be finite");
    }

    double previous = lambda0;
    for (size_t i = 0; i < milestones.size(); ++i) {
        if (!(milestones[i] > previous)) {
            throw std::invalid_argument(
                "milestones must be strictly increasing and greater than lambda0; "
                "milestone " + std::to_string(i) + " = " + std::to_string(milestones[i]));
        }
        previous = milestones[i];
    }
}

void to_json(nlohmann::json& j, const ContinuationConfig& config) {
    j = nlohmann::json{
        {"initial_step", config.initial_step},
        {"aggressiveness", config.aggressiveness},
        {"max_newton_steps", config.max_newton_steps},
        {"newton_tol", config.newton_tol},
        {"max_steps", config.max_steps},
        {"predictor", config.predictor},
        {"milestones", config.milestones},
        {"verbose", config.verbose},
        {"min_step", config.min_step}
    };
    if (std::isfinite(config.max_step)) {
        j["max_step"] = config.max_step;
    } else {
        j["max_step"] = nullptr;
    }
}

void from_json(const nlohmann::json& j, ContinuationConfig& config) {
    config.initial_step = j.value("initial_step", config.initial_step);
    config.aggressiveness = j.value("aggressiveness", config.aggressiveness);
    config.max_newton_steps = j.value("max_newton_steps", config.max_newton_steps);
    config.newton_tol = j.value("newton_tol", config.newton_tol);
    config.max_steps = j.value("max_steps", config.max_steps);
    config.verbose = j.value("verbose", config.verbose);
    config.min_step = j.value("min_step", config.min_step);

    if (j.contains("max_step")) {
        const auto& m = j.at("max_step");
        config.max_step = m.is_null() ? std::numeric_limits<double>::infinity()
                                      : m.get<double>();
    }
    if (j.contains("predictor")) {
        config.predictor = j.at("predictor").get<PredictorOrder>();
    }
    if (j.contains("milestones")) {
        config.milestones = j.at("milestones").get<std::vector<double>>();
    }
}

} // namespace continua::solver
