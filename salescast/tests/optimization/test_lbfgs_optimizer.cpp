#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "salescast/optimization/lbfgs_optimizer.hpp"

#include <cmath>
#include <stdexcept>

using salescast::optimization::LBFGSOptimizer;
using Catch::Matchers::WithinAbs;

namespace {

// f(x) = sum_i (i + 1) * (x_i - (i + 1))^2, minimum at x_i = i + 1.
double scaledQuadratic(const Eigen::VectorXd &x, Eigen::VectorXd &grad) {
	double f = 0.0;
	grad.resize(x.size());
	for (Eigen::Index i = 0; i < x.size(); ++i) {
		const double w = static_cast<double>(i + 1);
		const double d = x(i) - w;
		f += w * d * d;
		grad(i) = 2.0 * w * d;
	}
	return f;
}

double rosenbrock(const Eigen::VectorXd &x, Eigen::VectorXd &grad) {
	const double a = 1.0 - x(0);
	const double b = x(1) - x(0) * x(0);
	grad.resize(2);
	grad(0) = -2.0 * a - 400.0 * x(0) * b;
	grad(1) = 200.0 * b;
	return a * a + 100.0 * b * b;
}

} // namespace

TEST_CASE("LBFGS minimizes a scaled quadratic", "[optimization][lbfgs]") {
	const Eigen::VectorXd x0 = Eigen::VectorXd::Zero(4);
	const auto result = LBFGSOptimizer::minimize(scaledQuadratic, x0);

	REQUIRE(result.converged);
	REQUIRE(result.message == "Converged");
	for (Eigen::Index i = 0; i < 4; ++i) {
		REQUIRE_THAT(result.x(i), WithinAbs(static_cast<double>(i + 1), 1e-5));
	}
	REQUIRE_THAT(result.fx, WithinAbs(0.0, 1e-8));
}

TEST_CASE("LBFGS reports an exhausted iteration budget", "[optimization][lbfgs]") {
	Eigen::VectorXd x0(2);
	x0 << -1.2, 1.0;

	LBFGSOptimizer::Options options;
	options.max_iterations = 2;
	options.past = 0;
	const auto result = LBFGSOptimizer::minimize(rosenbrock, x0, options);

	REQUIRE_FALSE(result.converged);
	REQUIRE(result.iterations <= 2);
	REQUIRE(std::isfinite(result.fx));
}

TEST_CASE("LBFGS solves Rosenbrock with the default budget", "[optimization][lbfgs]") {
	Eigen::VectorXd x0(2);
	x0 << -1.2, 1.0;
	LBFGSOptimizer::Options options;
	options.past = 0;
	options.epsilon = 1e-6;
	options.epsilon_rel = 1e-6;
	const auto result = LBFGSOptimizer::minimize(rosenbrock, x0, options);

	REQUIRE(result.converged);
	REQUIRE_THAT(result.x(0), WithinAbs(1.0, 1e-3));
	REQUIRE_THAT(result.x(1), WithinAbs(1.0, 1e-3));
}

TEST_CASE("LBFGS converging on the last allowed iteration counts as converged", "[optimization][lbfgs]") {
	Eigen::VectorXd x0 = Eigen::VectorXd::Zero(4);
	LBFGSOptimizer::Options options;
	options.past = 0;
	const auto unbounded = LBFGSOptimizer::minimize(scaledQuadratic, x0, options);
	REQUIRE(unbounded.converged);
	REQUIRE(unbounded.iterations > 1);

	options.max_iterations = unbounded.iterations;
	const auto exact = LBFGSOptimizer::minimize(scaledQuadratic, x0, options);
	REQUIRE(exact.iterations == options.max_iterations);
	REQUIRE(exact.converged);
	REQUIRE(exact.message == "Converged");
	REQUIRE(exact.x.isApprox(unbounded.x));

	options.max_iterations = unbounded.iterations - 1;
	REQUIRE_FALSE(LBFGSOptimizer::minimize(scaledQuadratic, x0, options).converged);
}

TEST_CASE("LBFGS rejects a non-positive iteration budget", "[optimization][lbfgs][error]") {
	LBFGSOptimizer::Options options;
	options.max_iterations = 0;
	REQUIRE_THROWS_AS(LBFGSOptimizer::minimize(scaledQuadratic, Eigen::VectorXd::Zero(2), options),
	                  std::invalid_argument);
}
