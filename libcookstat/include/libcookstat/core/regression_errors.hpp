#pragma once

#include <stdexcept>
#include <string>

namespace libcookstat {
namespace core {

/**
 * Exceptions raised by libcookstat
 *
 * Every failure is reported synchronously by the operation that detects it.
 * Callers can catch the standard bases (std::invalid_argument for bad input,
 * std::runtime_error for numerical failures) or the concrete types below.
 */

/// x/y missing, empty, of unequal length, or containing non-finite values
class InvalidInputError : public std::invalid_argument {
public:
	explicit InvalidInputError(const std::string &message) : std::invalid_argument(message) {
	}
};

/// Weight vector length differs from the x/y length
class DimensionMismatchError : public std::invalid_argument {
public:
	explicit DimensionMismatchError(const std::string &message) : std::invalid_argument(message) {
	}
};

/// Weighted sum of squared x deviations is zero: the slope is undefined
class DegenerateFitError : public std::runtime_error {
public:
	explicit DegenerateFitError(const std::string &message) : std::runtime_error(message) {
	}
};

/// Residual sum of squares is zero, so Cook's distance divides by zero
class ZeroResidualError : public DegenerateFitError {
public:
	explicit ZeroResidualError(const std::string &message) : DegenerateFitError(message) {
	}
};

} // namespace core
} // namespace libcookstat
