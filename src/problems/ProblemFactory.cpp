#include "ProblemFactory.hpp"
#include <stdexcept>
#include "Bratu1D.hpp"
#include "FiniteDifferenceProblem.hpp"

namespace continua::problems {

std::unique_ptr<solver::Problem> make_cubic(int n) {
    if (n < 1) {
        throw std::invalid_argument("cubic problem needs at least 1 unknown, got " +
                                    std::to_string(n));
    }
    return std::make_unique<FiniteDifferenceProblem>(
        [n](const Eigen::VectorXd& u, double lambda) {
            Eigen::VectorXd weights = Eigen::VectorXd::LinSpaced(n, 1.0, n) / n;
            Eigen::VectorXd r = u + u.array().cube().matrix() - lambda * weights;
            return r;
        });
}

std::unique_ptr<solver::Problem> make_problem(const std::string& name, int n) {
    if (name == "bratu") {
        return std::make_unique<Bratu1D>(n);
    }
    if (name == "cubic") {
        return make_cubic(n);
    }
    throw std::invalid_argument("Unknown problem: " + name);
}

} // namespace continua::problems
