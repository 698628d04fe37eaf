#pragma once

#include "libcookstat/core/regression_errors.hpp"
#include <algorithm>
#include <cmath>
#include <optional>
#include <string>
#include <vector>

namespace libcookstat {
namespace utils {

/// Value at which the cumulative sum first crosses the threshold, and how many values it took
struct NStatistic {
	double value = 0.0;
	/// 1-based count of sorted values consumed to cross the threshold
	size_t rank = 0;
};

/**
 * RankStatistics: cumulative-mass rank statistics
 *
 * N(values, p) sorts values ascending and walks the running sum until it
 * strictly exceeds total * p / 100. With p = 50 this is the familiar N50
 * of assembly statistics; N90, N80, ... follow from the percentile argument.
 */
class RankStatistics {
public:
	/**
	 * Compute the N-percentile statistic
	 *
	 * Example: N({1, 2, 3, 4}) has total 10, threshold 5, running sums
	 * 1, 3, 6 and returns {value = 3, rank = 3}.
	 *
	 * @param values Input values (not modified)
	 * @param percentile Threshold as a percentage of the total sum; 0 selects
	 *        the default of 50
	 * @return The crossing point, or std::nullopt if the running sum never
	 *         strictly exceeds the threshold (including empty input)
	 * @throws core::InvalidInputError if percentile is negative or not finite
	 */
	static std::optional<NStatistic> N(const std::vector<double> &values, double percentile = 50.0);
};

// ============================================================================
// Implementation
// ============================================================================

inline std::optional<NStatistic> RankStatistics::N(const std::vector<double> &values, double percentile) {
	if (!std::isfinite(percentile) || percentile < 0.0) {
		throw core::InvalidInputError("percentile must be finite and non-negative (got " +
		                              std::to_string(percentile) + ")");
	}

	if (percentile == 0.0) {
		percentile = 50.0;
	}

	std::vector<double> sorted = values;
	std::sort(sorted.begin(), sorted.end());

	double total = 0.0;
	for (double v : sorted) {
		total += v;
	}
	const double threshold = total * percentile / 100.0;

	double running = 0.0;
	for (size_t i = 0; i < sorted.size(); i++) {
		running += sorted[i];
		if (running > threshold) {
			NStatistic result;
			result.value = sorted[i];
			result.rank = i + 1;
			return result;
		}
	}

	return std::nullopt;
}

} // namespace utils
} // namespace libcookstat
