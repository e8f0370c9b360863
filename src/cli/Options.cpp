#include "Options.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace continua::cli {

solver::ContinuationConfig default_config() {
    solver::ContinuationConfig config;
    config.max_step = 0.5;
    config.newton_tol = 1e-10;
    config.milestones = {1.0, 2.0, 3.0};
    return config;
}

std::vector<double> parse_list(const std::string& text) {
    std::vector<double> values;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) {
            values.push_back(std::stod(item));
        }
    }
    return values;
}

namespace {

nlohmann::json read_json(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path);
    }
    return nlohmann::json::parse(f);
}

} // namespace

Args parse_args(int argc, const char* const argv[]) {
    Args args;
    args.config = default_config();
    bool milestones_given = false;

    // Config file first so that explicit flags win regardless of order.
    // Keys it leaves out keep the command line defaults.
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            nlohmann::json j = read_json(argv[++i]);
            j.get_to(args.config);
            milestones_given = milestones_given || j.contains("milestones");
        }
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            ++i;
        } else if (arg == "--problem" && i + 1 < argc) {
            args.problem = argv[++i];
        } else if (arg == "--n" && i + 1 < argc) {
            args.n = std::stoi(argv[++i]);
        } else if (arg == "--lambda0" && i + 1 < argc) {
            args.lambda0 = std::stod(argv[++i]);
        } else if (arg == "--step" && i + 1 < argc) {
            args.config.initial_step = std::stod(argv[++i]);
        } else if (arg == "--max-step" && i + 1 < argc) {
            args.config.max_step = std::stod(argv[++i]);
        } else if (arg == "--aggressiveness" && i + 1 < argc) {
            args.config.aggressiveness = std::stod(argv[++i]);
        } else if (arg == "--max-newton" && i + 1 < argc) {
            args.config.max_newton_steps = std::stoi(argv[++i]);
        } else if (arg == "--tol" && i + 1 < argc) {
            args.config.newton_tol = std::stod(argv[++i]);
        } else if (arg == "--max-steps" && i + 1 < argc) {
            args.config.max_steps = std::stoi(argv[++i]);
        } else if (arg == "--predictor" && i + 1 < argc) {
            args.config.predictor = std::stoi(argv[++i]) == 0
                ? solver::PredictorOrder::ZeroOrder
                : solver::PredictorOrder::FirstOrder;
        } else if (arg == "--milestones" && i + 1 < argc) {
            args.config.milestones = parse_list(argv[++i]);
            milestones_given = true;
        } else if (arg == "--output" && i + 1 < argc) {
            args.output_path = argv[++i];
        } else if (arg == "--print-config") {
            args.print_config = true;
        } else if (arg == "--verbose") {
            args.config.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            args.show_help = true;
        } else {
            throw std::invalid_argument("Unknown or incomplete option: " + arg);
        }
    }

    if (args.n < 1) {
        throw std::invalid_argument("--n must be at least 1, got " + std::to_string(args.n));
    }

    if (!milestones_given) {
        auto& m = args.config.milestones;
        const double lambda0 = args.lambda0;
        m.erase(std::remove_if(m.begin(), m.end(),
                               [lambda0](double value) { return value <= lambda0; }),
                m.end());
    }

    return args;
}

void print_usage(std::ostream& os) {
    os << "Continua: natural parameter continuation\n\n"
       << "Usage: continua_solver [options]\n\n"
       << "Options:\n"
       << "  --problem bratu|cubic    Problem to trace (default: bratu)\n"
       << "  --n <nodes>              Problem size (default: 51)\n"
       << "  --lambda0 <value>        Initial parameter (default: 0)\n"
       << "  --step <value>           Initial lambda step (default: 0.1)\n"
       << "  --max-step <value>       Maximum lambda step (default: 0.5)\n"
       << "  --aggressiveness <value> Step growth coefficient (default: 2)\n"
       << "  --max-newton <n>         Newton corrections per step (default: 5)\n"
       << "  --tol <value>            Newton tolerance (default: 1e-10)\n"
       << "  --max-steps <n>          Maximum continuation steps\n"
       << "  --predictor 0|1          Predictor order (default: 1)\n"
       << "  --milestones a,b,...     Lambda values to stop on; the last one ends the run\n"
       << "                           (default: those of 1,2,3 above lambda0)\n"
       << "  --config <path>          JSON configuration over the defaults above,\n"
       << "                           overridden by other flags\n"
       << "  --print-config           Print the effective configuration and exit\n"
       << "  --output <path>          Output JSON Lines file (default: continuation.jsonl)\n"
       << "  --verbose                Print Newton residuals and step transitions\n"
       << "  --help                   Show this help\n";
}

} // namespace continua::cli
