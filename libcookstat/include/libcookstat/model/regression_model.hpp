#pragma once

#include "libcookstat/core/line_fit_result.hpp"
#include "libcookstat/core/regression_options.hpp"
#include "libcookstat/utils/rank_statistics.hpp"
#include <Eigen/Dense>
#include <limits>
#include <optional>
#include <vector>

namespace libcookstat {
namespace model {

/**
 * RegressionModel: least-squares line fit with cached coefficients
 *
 * Holds x, y and optional weights, fits y = intercept + slope * x on
 * demand and derives fitted values, residuals and Cook's distances.
 *
 * The fit is cached. Replacing x, y, the weights or the options through a
 * setter clears the cache; nothing observes changes made to a vector after
 * it was handed in, since the model keeps its own copy.
 *
 * Not synchronized: use one instance per thread or serialize access.
 *
 * Usage:
 *   std::vector<double> x = {1, 2, 3, 4, 5, 6};
 *   std::vector<double> y = {1, 2.1, 3.2, 4, 7, 6};
 *   RegressionModel model(x, y);
 *   auto coefs = model.Coefficients();      // {intercept, slope}
 *   Eigen::VectorXd fitted = model.Fitted();
 *   Eigen::VectorXd residuals = model.Residuals();
 *   Eigen::VectorXd cooks = model.CooksDistance();
 */
class RegressionModel {
public:
	/// Empty model: no data, no weights, default options
	RegressionModel();

	explicit RegressionModel(const core::RegressionOptions &options);

	/**
	 * @throws core::InvalidInputError if x and y differ in length or hold non-finite values
	 */
	RegressionModel(const Eigen::VectorXd &x, const Eigen::VectorXd &y,
	                const core::RegressionOptions &options = core::RegressionOptions());

	/**
	 * @throws core::InvalidInputError if x and y differ in length or hold non-finite values
	 * @throws core::DimensionMismatchError if weights differ in length from x
	 */
	RegressionModel(const Eigen::VectorXd &x, const Eigen::VectorXd &y, const Eigen::VectorXd &weights,
	                const core::RegressionOptions &options = core::RegressionOptions());

	RegressionModel(const std::vector<double> &x, const std::vector<double> &y,
	                const core::RegressionOptions &options = core::RegressionOptions());

	RegressionModel(const std::vector<double> &x, const std::vector<double> &y, const std::vector<double> &weights,
	                const core::RegressionOptions &options = core::RegressionOptions());

	// ========================================================================
	// Data
	// ========================================================================

	/// Replace x; clears the cached fit
	void SetX(const Eigen::VectorXd &x);
	void SetX(const std::vector<double> &x);

	/// Replace y; clears the cached fit
	void SetY(const Eigen::VectorXd &y);
	void SetY(const std::vector<double> &y);

	/**
	 * Replace the weights; clears the cached fit
	 *
	 * @throws core::DimensionMismatchError if x is non-empty and the lengths differ
	 */
	void SetWeights(const Eigen::VectorXd &weights);
	void SetWeights(const std::vector<double> &weights);

	/// Drop the weights (all weights become 1); clears the cached fit
	void ClearWeights();

	const Eigen::VectorXd &X() const {
		return x_;
	}
	const Eigen::VectorXd &Y() const {
		return y_;
	}
	/// Only meaningful if HasWeights()
	const Eigen::VectorXd &Weights() const {
		return weights_;
	}
	bool HasWeights() const {
		return has_weights_;
	}

	const core::RegressionOptions &Options() const {
		return options_;
	}
	/// Replace the options; clears the cached fit
	void SetOptions(const core::RegressionOptions &options);

	// ========================================================================
	// Fit state
	// ========================================================================

	/// NaN until the first successful fit
	double Slope() const {
		return slope_;
	}
	/// NaN until the first successful fit
	double Intercept() const {
		return intercept_;
	}
	/// True after a successful fit, until x, y, weights or options are replaced
	bool IsFitComputed() const {
		return fit_computed_;
	}
	/// Details of the most recent successful fit (sums, squared deviations)
	const core::LineFitResult &LastFit() const {
		return last_fit_;
	}

	// ========================================================================
	// Operations
	// ========================================================================

	/**
	 * Weighted sums of the current data (unit weights when none are set)
	 *
	 * Recomputed on every call.
	 *
	 * @throws core::DimensionMismatchError if weights differ in length from x
	 */
	core::RegressionSums ComputeSums() const;

	/**
	 * Run the regression on the current data and cache the result
	 *
	 * @return {intercept, slope}
	 * @throws core::InvalidInputError if x/y are empty or differ in length
	 * @throws core::DimensionMismatchError if weights differ in length from x
	 * @throws core::DegenerateFitError if all x values are equal
	 */
	core::Coefficients Fit();

	/// {intercept, slope}, fitting first if the cache is empty
	core::Coefficients Coefficients();

	/// intercept + slope * x_i for every x_i, fitting first if needed
	Eigen::VectorXd Fitted();

	/// y_i - fitted_i for every observation
	Eigen::VectorXd Residuals();

	/**
	 * Cook's distance for every observation, in input order
	 *
	 * @throws core::ZeroResidualError if the fit is exact and the policy is Throw
	 * @throws core::DegenerateFitError if a leave-one-out fit is degenerate
	 */
	Eigen::VectorXd CooksDistance();

	/**
	 * N-percentile statistic of arbitrary values (N50 by default)
	 *
	 * Independent of the model state.
	 * @see utils::RankStatistics::N
	 */
	static std::optional<utils::NStatistic> N(const std::vector<double> &values, double percentile = 50.0);

private:
	void ValidateConstruction() const;
	void InvalidateFit(const char *reason);

	Eigen::VectorXd x_;
	Eigen::VectorXd y_;
	Eigen::VectorXd weights_;
	bool has_weights_ = false;

	core::RegressionOptions options_;

	double slope_ = std::numeric_limits<double>::quiet_NaN();
	double intercept_ = std::numeric_limits<double>::quiet_NaN();
	bool fit_computed_ = false;
	core::LineFitResult last_fit_;
};

} // namespace model
} // namespace libcookstat
