// Continua: natural parameter continuation for F(u, lambda) = 0
//
// Traces a solution branch of a parameterized nonlinear system by stepping
// lambda forward and correcting each point with Newton's method, adapting
// the step to how quickly Newton converges.
//
// Usage:
//   ./continua_solver [options]
//
// Options:
//   --problem bratu|cubic    Problem to trace (default: bratu)
//   --n <nodes>              Problem size (default: 51)
//   --lambda0 <value>        Initial parameter (default: 0)
//   --step <value>           Initial lambda step (default: 0.1)
//   --max-step <value>       Maximum lambda step (default: 0.5)
//   --aggressiveness <value> Step growth coefficient (default: 2)
//   --max-newton <n>         Newton corrections per step (default: 5)
//   --tol <value>            Newton tolerance (default: 1e-10)
//   --max-steps <n>          Maximum continuation steps
//   --predictor 0|1          Predictor order (default: 1)
//   --milestones a,b,...     Lambda values to stop on; the last one ends the run
//                            (default: those of 1,2,3 above lambda0)
//   --config <path>          JSON configuration over the defaults above,
//                            overridden by other flags
//   --print-config           Print the effective configuration and exit
//   --output <path>          Output JSON Lines file (default: continuation.jsonl)
//   --verbose                Print Newton residuals and step transitions

#include <iostream>
#include <iomanip>
#include <string>
#include <memory>
#include <chrono>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "cli/Options.hpp"
#include "solver/Continuation.hpp"
#include "solver/ContinuationConfig.hpp"
#include "solver/FiniteDiff.hpp"
#include "problems/ProblemFactory.hpp"
#include "telemetry/TraceWriter.hpp"

using namespace continua;

int run(const cli::Args& args) {
    std::cout << "======================================\n";
    std::cout << "  Continua v1.0\n";
    std::cout << "  Natural Parameter Continuation\n";
    std::cout << "======================================\n\n";

    std::unique_ptr<solver::Problem> problem = problems::make_problem(args.problem, args.n);

    std::cout << "Problem: " << args.problem << " (n = " << args.n << ")" << std::endl;
    std::cout << "Predictor: "
              << nlohmann::json(args.config.predictor).get<std::string>() << std::endl;
    if (args.problem == "cubic") {
        std::cout << "Jacobian threads: " << solver::fd_threads() << std::endl;
    }

    telemetry::TraceWriter writer(args.output_path);
    std::cout << "Writing telemetry to: " << args.output_path << "\n\n";

    solver::NaturalContinuation continuation(args.config);

    auto start_time = std::chrono::high_resolution_clock::now();

    auto on_step = writer.attach(continuation,
        [](int step, double lambda, const Eigen::VectorXd& u) {
            std::cout << "  Step " << std::setw(4) << step
                      << ": lambda = " << std::fixed << std::setprecision(6) << lambda
                      << ", ||u|| = " << std::scientific << u.norm() << std::endl;
        });

    Eigen::VectorXd u0 = Eigen::VectorXd::Zero(args.n);
    solver::ContinuationResult result = continuation.run(*problem, u0, args.lambda0, on_step);

    auto end_time = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);

    std::cout << "\n======================================\n";
    std::cout << "  Continuation Complete\n";
    std::cout << "======================================\n\n";

    std::cout << "Termination: " << solver::status_to_string(result.status) << std::endl;
    std::cout << "Accepted steps: " << result.trace.accepted_steps << std::endl;
    std::cout << "Rejected steps: " << result.trace.rejected_steps << std::endl;
    std::cout << "Newton iterations: " << result.trace.total_newton_steps << std::endl;
    std::cout << "Final lambda: " << std::fixed << std::setprecision(6) << result.lambda << std::endl;
    std::cout << "Time: " << duration.count() << " ms\n";

    writer.finish(result);
    std::cout << "\nContinuation data written to: " << args.output_path << std::endl;

    return 0;
}

int main(int argc, char* argv[]) {
    try {
        cli::Args args = cli::parse_args(argc, argv);
        if (args.show_help) {
            cli::print_usage(std::cout);
            return 0;
        }
        if (args.print_config) {
            std::cout << nlohmann::json(args.config).dump(2) << std::endl;
            return 0;
        }
        return run(args);
    } catch (const solver::NewtonConvergenceError& e) {
        std::cerr << "Continuation failed: " << e.what()
                  << " [lambda = " << e.lambda()
                  << ", iterations = " << e.iterations() << "]" << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
