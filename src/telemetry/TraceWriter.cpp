#include "TraceWriter.hpp"
#include <stdexcept>
#include <utility>

namespace continua::telemetry {

StepSnapshot StepSnapshot::from_solution(const solver::StepStats& trial, double lambda,
                                         const Eigen::VectorXd& u, bool store_u) {
    StepSnapshot snap;
    snap.step = trial.step;
    snap.lambda = lambda;
    snap.step_size = trial.step_size;
    snap.newton_steps = trial.newton_steps;
    snap.norm_u = u.norm();
    if (store_u) {
        snap.u.assign(u.data(), u.data() + u.size());
    }
    return snap;
}

TraceWriter::TraceWriter(const std::string& path, bool store_u)
    : path_(path), out_(path, std::ios::out | std::ios::trunc), store_u_(store_u)
{
    if (!out_.is_open()) {
        throw std::runtime_error("Cannot open telemetry file: " + path_);
    }
}

solver::StepCallback TraceWriter::attach(solver::NaturalContinuation& continuation,
                                         solver::StepCallback on_step) {
    continuation.set_trial_callback([this](const solver::StepStats& trial) {
        record_trial(trial);
    });
    return [this, on_step = std::move(on_step)](int step, double lambda,
                                                 const Eigen::VectorXd& u) {
        record_step(step, lambda, u);
        if (on_step) on_step(step, lambda, u);
    };
}

void TraceWriter::record_trial(const solver::StepStats& trial) {
    nlohmann::json record = trial.to_json();
    record["type"] = "trial";
    write(record);
    ++trial_count_;
    if (trial.accepted) {
        last_accepted_ = trial;
    }
}

void TraceWriter::record_step(int step, double lambda, const Eigen::VectorXd& u) {
    StepSnapshot snap = StepSnapshot::from_solution(last_accepted_, lambda, u, store_u_);
    snap.step = step;
    write(snap.to_json());
    ++step_count_;
}

void TraceWriter::finish(const solver::ContinuationResult& result) {
    write({
        {"type", "complete"},
        {"termination", solver::status_to_string(result.status)},
        {"steps", result.steps},
        {"lambda", result.lambda},
        {"step_size", result.step_size},
        {"accepted_steps", result.trace.accepted_steps},
        {"rejected_steps", result.trace.rejected_steps},
        {"total_newton_steps", result.trace.total_newton_steps}
    });
}

void TraceWriter::write(const nlohmann::json& record) {
    out_ << record.dump() << '\n';
    out_.flush();
    if (!out_) {
        throw std::runtime_error("Failed writing telemetry file: " + path_);
    }
}

} // namespace continua::telemetry
