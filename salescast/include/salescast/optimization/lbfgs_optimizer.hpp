#pragma once

#include <Eigen/Dense>

#include <functional>
#include <string>

namespace salescast::optimization {

/**
 * @brief L-BFGS optimizer for smooth unconstrained problems
 *
 * Wrapper around the LBFGS++ library. The iteration budget is hard: a run
 * that has not met the gradient or relative-decrease criterion when the
 * budget is spent is reported as not converged.
 */
class LBFGSOptimizer {
public:
    using Objective = std::function<double(const Eigen::VectorXd&, Eigen::VectorXd&)>;

    struct Result {
        Eigen::VectorXd x;               // Final parameters
        double fx = 0.0;                 // Final objective value
        int iterations = 0;              // Number of iterations
        bool converged = false;          // Whether optimization converged
        std::string message;             // Status message
    };

    struct Options {
        int max_iterations;
        double epsilon;           // Gradient norm tolerance
        double epsilon_rel;       // Gradient norm tolerance relative to ||x||
        int past;                 // Window for the relative-decrease test (0 disables it)
        double delta;             // Relative-decrease tolerance
        int m;                    // Number of corrections (L-BFGS memory)
        int max_linesearch;

        Options()
            : max_iterations(1000), epsilon(1e-8), epsilon_rel(1e-8), past(3),
              delta(1e-12), m(10), max_linesearch(64) {}
    };

    /**
     * @brief Minimize objective function
     *
     * @param objective Function that computes f(x) and writes the gradient
     * @param x0 Initial parameters
     * @param options Optimization options
     * @return Result containing the final parameters and diagnostics
     */
    static Result minimize(const Objective& objective,
                           const Eigen::VectorXd& x0,
                           const Options& options = Options());
};

} // namespace salescast::optimization
