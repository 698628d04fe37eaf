#pragma once

#include "libcookstat/core/line_fit_result.hpp"
#include "libcookstat/core/regression_options.hpp"
#include <Eigen/Dense>

namespace libcookstat {
namespace diagnostics {

/**
 * InfluenceDiagnostics: per-observation influence of a fitted line
 *
 * Cook's distance is computed by brute-force refitting rather than from
 * leverage values. For each observation i:
 *
 *   (a_i, b_i) = line fit on x, y with observation i removed
 *   sum1_i     = Σ_j (ŷ_j - (a_i + b_i x_j))²     over all n original x_j
 *   sum2       = Σ_j r_j²                         residuals of the full fit
 *   D_i        = sum1_i * (n - 2) / sum2 / 2
 *
 * The leave-one-out fits are unweighted unless
 * RegressionOptions::weighted_leave_one_out is set. Rules of thumb:
 * influential when D_i > 4/n or D_i > 1.
 */
class InfluenceDiagnostics {
public:
	/**
	 * Compute Cook's distance with unweighted leave-one-out fits
	 *
	 * @param x Predictor values of the full model (length n)
	 * @param y Response values of the full model (length n)
	 * @param fitted Fitted values of the full model (length n)
	 * @param residuals Residuals of the full model (length n)
	 * @param options Degeneracy tolerance and zero-residual policy
	 * @return Vector of Cook's distances in observation order
	 *
	 * @throws core::InvalidInputError if the vectors differ in length
	 * @throws core::ZeroResidualError if Σr² = 0 and the policy is Throw
	 * @throws core::DegenerateFitError if a leave-one-out fit is degenerate
	 */
	static Eigen::VectorXd ComputeCooksDistance(const Eigen::VectorXd &x, const Eigen::VectorXd &y,
	                                            const Eigen::VectorXd &fitted, const Eigen::VectorXd &residuals,
	                                            const core::RegressionOptions &options = core::RegressionOptions());

	/**
	 * Compute Cook's distance for a weighted model
	 *
	 * weights only enter the leave-one-out fits when
	 * options.weighted_leave_one_out is true; otherwise this is identical
	 * to the unweighted overload.
	 *
	 * @throws core::DimensionMismatchError if weights differ in length from x
	 */
	static Eigen::VectorXd ComputeCooksDistance(const Eigen::VectorXd &x, const Eigen::VectorXd &y,
	                                            const Eigen::VectorXd &weights, const Eigen::VectorXd &fitted,
	                                            const Eigen::VectorXd &residuals,
	                                            const core::RegressionOptions &options = core::RegressionOptions());

	/**
	 * Copy of a vector with element i removed
	 */
	static Eigen::VectorXd RemoveObservation(const Eigen::VectorXd &v, Eigen::Index i);

	/**
	 * Evaluate a line at every x
	 */
	static Eigen::VectorXd Predict(const core::Coefficients &coefficients, const Eigen::VectorXd &x);

private:
	static Eigen::VectorXd ComputeCooksDistanceImpl(const Eigen::VectorXd &x, const Eigen::VectorXd &y,
	                                                const Eigen::VectorXd *weights, const Eigen::VectorXd &fitted,
	                                                const Eigen::VectorXd &residuals,
	                                                const core::RegressionOptions &options);
};

} // namespace diagnostics
} // namespace libcookstat
