#pragma once

#include <cmath>
#include <string>
#include <stdexcept>

namespace libcookstat {
namespace core {

/// What Cook's distance does when the full model fits the data exactly
enum class ZeroResidualPolicy {
	/// Raise ZeroResidualError
	Throw,
	/// Return the IEEE result of the division (infinity or NaN)
	NonFinite
};

/**
 * Configuration options for the line fit and its diagnostics
 *
 * All options have defaults that reproduce the classic behavior of the
 * library: exact-zero degeneracy test, unweighted leave-one-out fits and
 * an exception when the residual sum of squares vanishes.
 */
struct RegressionOptions {
	// ========================================================================
	// Fit
	// ========================================================================

	/// The fit is degenerate when |sqdev_x| <= degenerate_tolerance
	/// Default: 0.0 (exact equality test, no epsilon)
	double degenerate_tolerance = 0.0;

	// ========================================================================
	// Cook's distance
	// ========================================================================

	/// Drop weight i along with (x_i, y_i) in the leave-one-out fits
	/// Default: false (leave-one-out fits are unweighted even for a weighted model)
	bool weighted_leave_one_out = false;

	/// Behavior when the residual sum of squares is zero
	/// Default: Throw
	ZeroResidualPolicy zero_residual_policy = ZeroResidualPolicy::Throw;

	// ========================================================================
	// Constructors
	// ========================================================================

	RegressionOptions() = default;

	/// Defaults, spelled out for call sites that want to be explicit
	static RegressionOptions Reference() {
		return RegressionOptions();
	}

	/// Degeneracy test bounded by a tolerance instead of exact zero
	static RegressionOptions Tolerant(double tolerance_) {
		RegressionOptions opts;
		opts.degenerate_tolerance = tolerance_;
		return opts;
	}

	// ========================================================================
	// Validation
	// ========================================================================

	/**
	 * Validate option values
	 *
	 * @throws std::invalid_argument if validation fails
	 */
	void Validate() const {
		if (!std::isfinite(degenerate_tolerance) || degenerate_tolerance < 0.0) {
			throw std::invalid_argument("degenerate_tolerance must be finite and non-negative (got " +
			                            std::to_string(degenerate_tolerance) + ")");
		}
	}
};

} // namespace core
} // namespace libcookstat
