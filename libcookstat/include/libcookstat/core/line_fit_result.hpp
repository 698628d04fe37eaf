#pragma once

#include <cstddef>
#include <limits>

namespace libcookstat {
namespace core {

/**
 * Weighted sums over the observations
 *
 * With weights w_i (all 1 when the model is unweighted):
 *   x  = Σ w_i x_i        y  = Σ w_i y_i
 *   xx = Σ w_i x_i²       yy = Σ w_i y_i²
 *   xy = Σ w_i x_i y_i
 */
struct RegressionSums {
	double x = 0.0;
	double y = 0.0;
	double xx = 0.0;
	double yy = 0.0;
	double xy = 0.0;
};

/// Line coefficients, intercept first: y = intercept + slope * x
struct Coefficients {
	double intercept = std::numeric_limits<double>::quiet_NaN();
	double slope = std::numeric_limits<double>::quiet_NaN();

	Coefficients() = default;
	Coefficients(double intercept_, double slope_) : intercept(intercept_), slope(slope_) {
	}

	/// Prediction for a single x
	double Predict(double x) const {
		return intercept + slope * x;
	}

	bool operator==(const Coefficients &other) const {
		return intercept == other.intercept && slope == other.slope;
	}
	bool operator!=(const Coefficients &other) const {
		return !(*this == other);
	}
};

/**
 * Result of a closed-form least-squares line fit
 *
 * The squared deviations use n = number of observations as divisor even
 * when weights are present:
 *   sqdev_x  = Σwx² - (Σwx)² / n
 *   sqdev_y  = Σwy² - (Σwy)² / n
 *   sqdev_xy = Σwxy - (Σwx)(Σwy) / n
 */
struct LineFitResult {
	Coefficients coefficients;

	/// Number of observations used in the fit
	size_t n_obs = 0;

	/// Whether the fit used a weight vector
	bool weighted = false;

	RegressionSums sums;

	double sqdev_x = std::numeric_limits<double>::quiet_NaN();

	/// Not used downstream; kept as a diagnostic value
	double sqdev_y = std::numeric_limits<double>::quiet_NaN();

	double sqdev_xy = std::numeric_limits<double>::quiet_NaN();

	double intercept() const {
		return coefficients.intercept;
	}
	double slope() const {
		return coefficients.slope;
	}
};

} // namespace core
} // namespace libcookstat
