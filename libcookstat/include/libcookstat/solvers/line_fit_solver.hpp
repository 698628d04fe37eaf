#pragma once

#include "libcookstat/core/line_fit_result.hpp"
#include "libcookstat/core/regression_errors.hpp"
#include "libcookstat/core/regression_options.hpp"
#include "libcookstat/utils/tracing.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <string>

namespace libcookstat {
namespace solvers {

/**
 * Closed-form least-squares line fit: y = a + b * x
 *
 * Algorithm (direct summation, no centering):
 * 1. Accumulate Σwx, Σwy, Σwx², Σwy², Σwxy (w_i = 1 when unweighted)
 * 2. sqdev_x  = Σwx² - (Σwx)² / n
 * 3. Fail if |sqdev_x| <= options.degenerate_tolerance (exact zero by default)
 * 4. sqdev_xy = Σwxy - (Σwx)(Σwy) / n
 * 5. slope = sqdev_xy / sqdev_x, intercept = (Σwy - slope * Σwx) / n
 *
 * n is the number of observations in both the weighted and unweighted case.
 * For unit weights the result equals the ordinary least-squares line.
 *
 * Design notes:
 * - Header-only
 * - Stateless design (all methods are static)
 */
class LineFitSolver {
public:
	/**
	 * Accumulate the unweighted sums
	 *
	 * @throws core::InvalidInputError if x and y differ in length
	 */
	static core::RegressionSums ComputeSums(const Eigen::VectorXd &x, const Eigen::VectorXd &y);

	/**
	 * Accumulate the weighted sums
	 *
	 * @throws core::InvalidInputError if x and y differ in length
	 * @throws core::DimensionMismatchError if weights differ in length from x
	 */
	static core::RegressionSums ComputeSums(const Eigen::VectorXd &x, const Eigen::VectorXd &y,
	                                        const Eigen::VectorXd &weights);

	/**
	 * Fit an unweighted line
	 *
	 * @param x Predictor values (length n)
	 * @param y Response values (length n)
	 * @param options Degeneracy tolerance
	 * @return LineFitResult with intercept, slope and intermediate sums
	 *
	 * @throws core::InvalidInputError if x/y are empty or of unequal length
	 * @throws core::DegenerateFitError if all x values are equal
	 * @throws std::invalid_argument if options are invalid
	 */
	static core::LineFitResult Fit(const Eigen::VectorXd &x, const Eigen::VectorXd &y,
	                               const core::RegressionOptions &options = core::RegressionOptions());

	/**
	 * Fit a weighted line
	 *
	 * Same contract as the unweighted Fit, plus:
	 * @throws core::DimensionMismatchError if weights differ in length from x
	 */
	static core::LineFitResult Fit(const Eigen::VectorXd &x, const Eigen::VectorXd &y,
	                               const Eigen::VectorXd &weights,
	                               const core::RegressionOptions &options = core::RegressionOptions());

private:
	static void ValidateData(const Eigen::VectorXd &x, const Eigen::VectorXd &y);

	static core::LineFitResult FitFromSums(const core::RegressionSums &sums, size_t n, bool weighted,
	                                       const core::RegressionOptions &options);
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline core::RegressionSums LineFitSolver::ComputeSums(const Eigen::VectorXd &x, const Eigen::VectorXd &y) {
	if (x.size() != y.size()) {
		throw core::InvalidInputError("x and y must have the same length (x: " + std::to_string(x.size()) +
		                              ", y: " + std::to_string(y.size()) + ")");
	}

	core::RegressionSums sums;
	for (Eigen::Index i = 0; i < x.size(); i++) {
		const double xi = x(i);
		const double yi = y(i);
		sums.x += xi;
		sums.y += yi;
		sums.xx += xi * xi;
		sums.yy += yi * yi;
		sums.xy += xi * yi;
	}
	return sums;
}

inline core::RegressionSums LineFitSolver::ComputeSums(const Eigen::VectorXd &x, const Eigen::VectorXd &y,
                                                       const Eigen::VectorXd &weights) {
	if (x.size() != y.size()) {
		throw core::InvalidInputError("x and y must have the same length (x: " + std::to_string(x.size()) +
		                              ", y: " + std::to_string(y.size()) + ")");
	}
	if (weights.size() != x.size()) {
		COOKSTAT_WARN("Weight length " << weights.size() << " does not match x length " << x.size());
		throw core::DimensionMismatchError("Weights vector must have same length as x (weights: " +
		                                   std::to_string(weights.size()) + ", x: " + std::to_string(x.size()) +
		                                   ")");
	}

	core::RegressionSums sums;
	for (Eigen::Index i = 0; i < x.size(); i++) {
		const double w = weights(i);
		const double xi = x(i);
		const double yi = y(i);
		sums.x += w * xi;
		sums.y += w * yi;
		sums.xx += w * xi * xi;
		sums.yy += w * yi * yi;
		sums.xy += w * xi * yi;
	}
	return sums;
}

inline void LineFitSolver::ValidateData(const Eigen::VectorXd &x, const Eigen::VectorXd &y) {
	if (x.size() == 0 || y.size() == 0 || x.size() != y.size()) {
		COOKSTAT_WARN("Cannot fit line: x has " << x.size() << " values, y has " << y.size());
		throw core::InvalidInputError("No data or length mismatch (x: " + std::to_string(x.size()) +
		                              ", y: " + std::to_string(y.size()) + ")");
	}
}

inline core::LineFitResult LineFitSolver::Fit(const Eigen::VectorXd &x, const Eigen::VectorXd &y,
                                              const core::RegressionOptions &options) {
	options.Validate();
	ValidateData(x, y);

	auto sums = ComputeSums(x, y);
	return FitFromSums(sums, static_cast<size_t>(x.size()), false, options);
}

inline core::LineFitResult LineFitSolver::Fit(const Eigen::VectorXd &x, const Eigen::VectorXd &y,
                                              const Eigen::VectorXd &weights,
                                              const core::RegressionOptions &options) {
	options.Validate();
	ValidateData(x, y);

	auto sums = ComputeSums(x, y, weights);
	return FitFromSums(sums, static_cast<size_t>(x.size()), true, options);
}

inline core::LineFitResult LineFitSolver::FitFromSums(const core::RegressionSums &sums, size_t n, bool weighted,
                                                      const core::RegressionOptions &options) {
	const double n_d = static_cast<double>(n);

	core::LineFitResult result;
	result.n_obs = n;
	result.weighted = weighted;
	result.sums = sums;

	result.sqdev_x = sums.xx - sums.x * sums.x / n_d;

	// With the default tolerance of 0 this is an exact equality test
	if (std::abs(result.sqdev_x) <= options.degenerate_tolerance) {
		COOKSTAT_WARN("Degenerate fit: sqdev_x = " << result.sqdev_x << " over " << n << " observations");
		throw core::DegenerateFitError("Can't fit line when x values are all equal (slope undefined)");
	}

	result.sqdev_y = sums.yy - sums.y * sums.y / n_d;
	result.sqdev_xy = sums.xy - sums.x * sums.y / n_d;

	const double slope = result.sqdev_xy / result.sqdev_x;
	const double intercept = (sums.y - slope * sums.x) / n_d;
	result.coefficients = core::Coefficients(intercept, slope);

	COOKSTAT_DEBUG("Line fit over " << n << " observations" << (weighted ? " (weighted)" : "")
	                                << ": intercept = " << intercept << ", slope = " << slope);

	return result;
}

} // namespace solvers
} // namespace libcookstat
