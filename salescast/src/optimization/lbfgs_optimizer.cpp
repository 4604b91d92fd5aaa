#include "salescast/optimization/lbfgs_optimizer.hpp"

#include "salescast/utils/logging.hpp"

#include <LBFGS.h>

#include <cmath>
#include <stdexcept>

namespace salescast::optimization {

using namespace LBFGSpp;

namespace {

bool gradientConverged(const LBFGSOptimizer::Objective& objective, const Eigen::VectorXd& x,
                       const LBFGSOptimizer::Options& options) {
    Eigen::VectorXd grad(x.size());
    const double fx = objective(x, grad);
    if (!std::isfinite(fx) || !grad.allFinite()) {
        return false;
    }
    const double gnorm = grad.norm();
    return gnorm <= options.epsilon || gnorm <= options.epsilon_rel * x.norm();
}

} // namespace

LBFGSOptimizer::Result LBFGSOptimizer::minimize(const Objective& objective,
                                                const Eigen::VectorXd& x0,
                                                const Options& options) {
    if (options.max_iterations <= 0) {
        // LBFGS++ treats zero as "unbounded"; every run here must terminate.
        throw std::invalid_argument("LBFGSOptimizer requires a positive iteration budget.");
    }

    Result result;
    result.x = x0;

    LBFGSParam<double> param;
    param.m = options.m;
    param.epsilon = options.epsilon;
    param.epsilon_rel = options.epsilon_rel;
    param.past = options.past;
    param.delta = options.delta;
    param.max_iterations = options.max_iterations;
    param.max_linesearch = options.max_linesearch;

    LBFGSSolver<double> solver(param);

    // LBFGS++ takes a non-const gradient reference and a non-const functor.
    auto eigen_objective = [&objective](const Eigen::VectorXd& x, Eigen::VectorXd& grad) {
        return objective(x, grad);
    };

    double fx = 0.0;
    try {
        result.iterations = solver.minimize(eigen_objective, result.x, fx);
        result.fx = fx;
        if (!std::isfinite(fx)) {
            result.converged = false;
            result.message = "Objective is not finite";
        } else if (result.iterations >= options.max_iterations &&
                   !gradientConverged(objective, result.x, options)) {
            // LBFGS++ returns k == max_iterations both when its convergence test passes on the
            // last step and when it gives up, so the last step is checked again here.
            result.converged = false;
            result.message = "Iteration budget exhausted";
        } else {
            result.converged = true;
            result.message = "Converged";
        }
    } catch (const std::exception& e) {
        result.converged = false;
        result.fx = fx;
        result.message = std::string("Failed: ") + e.what();
    }

    SALESCAST_TRACE("[LBFGS] {} after {} iterations, f = {}", result.message, result.iterations, result.fx);
    return result;
}

} // namespace salescast::optimization
