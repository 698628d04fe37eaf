#pragma once

#include "libcookstat/core/regression_errors.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <string>
#include <vector>

namespace libcookstat {
namespace utils {

/**
 * @brief Conversion between std::vector<double> and Eigen vectors
 *
 * Used at the RegressionModel boundary so callers can hand in plain
 * standard containers while the numeric code works on Eigen::VectorXd.
 */
class TypeConverter {
public:
	static Eigen::VectorXd ToEigen(const std::vector<double> &values) {
		Eigen::VectorXd result(static_cast<Eigen::Index>(values.size()));
		for (size_t i = 0; i < values.size(); i++) {
			result(static_cast<Eigen::Index>(i)) = values[i];
		}
		return result;
	}

	static std::vector<double> ToStdVector(const Eigen::VectorXd &values) {
		return std::vector<double>(values.data(), values.data() + values.size());
	}

	/**
	 * @brief Check if a vector contains any NaN or infinity
	 */
	static bool HasNonFiniteValues(const Eigen::VectorXd &values) {
		for (Eigen::Index i = 0; i < values.size(); i++) {
			if (!std::isfinite(values(i))) {
				return true;
			}
		}
		return false;
	}

	/**
	 * @brief Reject vectors with NaN or infinity
	 *
	 * @param values Vector to check
	 * @param name Vector name for the error message
	 * @throws core::InvalidInputError on the first non-finite value
	 */
	static void ValidateFinite(const Eigen::VectorXd &values, const std::string &name) {
		for (Eigen::Index i = 0; i < values.size(); i++) {
			if (!std::isfinite(values(i))) {
				throw core::InvalidInputError("Non-finite value in " + name + " at index " + std::to_string(i));
			}
		}
	}
};

} // namespace utils
} // namespace libcookstat
