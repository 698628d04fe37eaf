#pragma once

#include "influence_diagnostics.hpp"
#include "libcookstat/core/regression_errors.hpp"
#include "libcookstat/solvers/line_fit_solver.hpp"
#include "libcookstat/utils/tracing.hpp"
#include <string>

namespace libcookstat {
namespace diagnostics {

// Implementation of InfluenceDiagnostics methods

inline Eigen::VectorXd InfluenceDiagnostics::RemoveObservation(const Eigen::VectorXd &v, Eigen::Index i) {
	const Eigen::Index n = v.size();
	if (i < 0 || i >= n) {
		throw core::InvalidInputError("Observation index " + std::to_string(i) + " out of range for " +
		                              std::to_string(n) + " values");
	}

	Eigen::VectorXd reduced(n - 1);
	reduced.head(i) = v.head(i);
	reduced.tail(n - 1 - i) = v.tail(n - 1 - i);
	return reduced;
}

inline Eigen::VectorXd InfluenceDiagnostics::Predict(const core::Coefficients &coefficients,
                                                     const Eigen::VectorXd &x) {
	Eigen::VectorXd y_pred(x.size());
	for (Eigen::Index j = 0; j < x.size(); j++) {
		y_pred(j) = coefficients.Predict(x(j));
	}
	return y_pred;
}

inline Eigen::VectorXd InfluenceDiagnostics::ComputeCooksDistance(const Eigen::VectorXd &x,
                                                                  const Eigen::VectorXd &y,
                                                                  const Eigen::VectorXd &fitted,
                                                                  const Eigen::VectorXd &residuals,
                                                                  const core::RegressionOptions &options) {
	return ComputeCooksDistanceImpl(x, y, nullptr, fitted, residuals, options);
}

inline Eigen::VectorXd InfluenceDiagnostics::ComputeCooksDistance(const Eigen::VectorXd &x,
                                                                  const Eigen::VectorXd &y,
                                                                  const Eigen::VectorXd &weights,
                                                                  const Eigen::VectorXd &fitted,
                                                                  const Eigen::VectorXd &residuals,
                                                                  const core::RegressionOptions &options) {
	if (weights.size() != x.size()) {
		throw core::DimensionMismatchError("Weights vector must have same length as x (weights: " +
		                                   std::to_string(weights.size()) + ", x: " + std::to_string(x.size()) +
		                                   ")");
	}
	return ComputeCooksDistanceImpl(x, y, options.weighted_leave_one_out ? &weights : nullptr, fitted, residuals,
	                                options);
}

inline Eigen::VectorXd InfluenceDiagnostics::ComputeCooksDistanceImpl(const Eigen::VectorXd &x,
                                                                      const Eigen::VectorXd &y,
                                                                      const Eigen::VectorXd *weights,
                                                                      const Eigen::VectorXd &fitted,
                                                                      const Eigen::VectorXd &residuals,
                                                                      const core::RegressionOptions &options) {
	options.Validate();

	const Eigen::Index n = y.size();
	if (n == 0) {
		throw core::InvalidInputError("Cook's distance needs at least one observation");
	}
	if (x.size() != n || fitted.size() != n || residuals.size() != n) {
		throw core::InvalidInputError("Cook's distance needs x, y, fitted and residuals of equal length (x: " +
		                              std::to_string(x.size()) + ", y: " + std::to_string(n) +
		                              ", fitted: " + std::to_string(fitted.size()) +
		                              ", residuals: " + std::to_string(residuals.size()) + ")");
	}

	// Constant across observations
	const double sum2 = residuals.squaredNorm();
	if (sum2 == 0.0 && options.zero_residual_policy == core::ZeroResidualPolicy::Throw) {
		COOKSTAT_WARN("Residual sum of squares is zero over " << n << " observations");
		throw core::ZeroResidualError("Cook's distance undefined: residual sum of squares is zero (perfect fit)");
	}

	COOKSTAT_TIMING_START();

	const double scale = static_cast<double>(n - 2);
	Eigen::VectorXd cooks_d(n);

	for (Eigen::Index i = 0; i < n; i++) {
		Eigen::VectorXd x_i = RemoveObservation(x, i);
		Eigen::VectorXd y_i = RemoveObservation(y, i);

		core::LineFitResult loo;
		if (weights != nullptr) {
			loo = solvers::LineFitSolver::Fit(x_i, y_i, RemoveObservation(*weights, i), options);
		} else {
			loo = solvers::LineFitSolver::Fit(x_i, y_i, options);
		}

		// Leave-one-out line evaluated over the full original x
		Eigen::VectorXd fitted_new = Predict(loo.coefficients, x);
		const double sum1 = (fitted - fitted_new).squaredNorm();

		cooks_d(i) = sum1 * scale / sum2 / 2.0;

		COOKSTAT_TRACE("Observation " << i << ": leave-one-out intercept = " << loo.intercept()
		                              << ", slope = " << loo.slope() << ", D = " << cooks_d(i));
	}

	COOKSTAT_TIMING_END("Cook's distance over " + std::to_string(n) + " observations");

	return cooks_d;
}

} // namespace diagnostics
} // namespace libcookstat
