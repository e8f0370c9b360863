#pragma once

#include <Eigen/Dense>
#include <fstream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "../solver/Continuation.hpp"
#include "../solver/Diagnostics.hpp"

namespace continua::telemetry {

// One accepted point of the branch
struct StepSnapshot {
    int step = 0;
    double lambda = 0.0;
    double step_size = 0.0;       // Step the prediction used; 0 for the initial point
    int newton_steps = 0;         // Corrections the accepted trial needed
    double norm_u = 0.0;
    std::vector<double> u;        // Empty when the writer does not store solutions

    nlohmann::json to_json() const {
        return {
            {"type", "step"},
            {"step", step},
            {"lambda", lambda},
            {"step_size", step_size},
            {"newton_steps", newton_steps},
            {"norm_u", norm_u},
            {"u", u}
        };
    }

    // Combine an accepted point with the trial that produced it
    static StepSnapshot from_solution(const solver::StepStats& trial, double lambda,
                                      const Eigen::VectorXd& u, bool store_u = true);
};

// Streams a continuation run to a JSON Lines file
//
// Each trial, accepted point and the final result is appended as one JSON
// object per line and flushed, so a reader can follow the file while the
// run is in progress. Records carry a "type" of "trial", "step" or
// "complete". Rejected trials appear as "trial" records with accepted false.
class TraceWriter {
public:
    // Truncates the file; throws std::runtime_error if it cannot be opened
    explicit TraceWriter(const std::string& path, bool store_u = true);

    // Wire both callbacks of a continuation to this writer.
    // The returned step callback forwards to on_step, if given, after writing.
    solver::StepCallback attach(solver::NaturalContinuation& continuation,
                                solver::StepCallback on_step = nullptr);

    void record_trial(const solver::StepStats& trial);

    // Uses the step size and corrections of the last accepted trial
    void record_step(int step, double lambda, const Eigen::VectorXd& u);

    void finish(const solver::ContinuationResult& result);

    const std::string& path() const { return path_; }
    size_t trial_count() const { return trial_count_; }
    size_t step_count() const { return step_count_; }

private:
    void write(const nlohmann::json& record);

    std::string path_;
    std::ofstream out_;
    bool store_u_;
    solver::StepStats last_accepted_;
    size_t trial_count_ = 0;
    size_t step_count_ = 0;
};

} // namespace continua::telemetry
