#pragma once

#include <ostream>
#include <string>
#include <vector>
#include "../solver/ContinuationConfig.hpp"

namespace continua::cli {

// Command line arguments for continua_solver
struct Args {
    std::string problem = "bratu";
    int n = 51;
    double lambda0 = 0.0;
    std::string output_path = "continuation.jsonl";
    bool print_config = false;
    bool show_help = false;
    solver::ContinuationConfig config;
};

// Options the command line starts from, before --config and explicit flags:
// max_step 0.5, newton_tol 1e-10, milestones 1,2,3. Default milestones at or
// below lambda0 are dropped once lambda0 is known.
solver::ContinuationConfig default_config();

// Comma separated list of numbers
std::vector<double> parse_list(const std::string& text);

// Throws std::invalid_argument for unknown or incomplete options and
// out of range sizes, std::runtime_error for unreadable config files
Args parse_args(int argc, const char* const argv[]);

void print_usage(std::ostream& os);

} // namespace continua::cli
