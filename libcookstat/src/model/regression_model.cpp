#include "libcookstat/model/regression_model.hpp"

#include "libcookstat/core/regression_errors.hpp"
#include "libcookstat/diagnostics/influence_diagnostics.hpp"
#include "libcookstat/diagnostics/influence_diagnostics_impl.hpp"
#include "libcookstat/solvers/line_fit_solver.hpp"
#include "libcookstat/utils/tracing.hpp"
#include "libcookstat/utils/type_converter.hpp"

#include <string>

namespace libcookstat {
namespace model {

using utils::TypeConverter;

RegressionModel::RegressionModel() : RegressionModel(core::RegressionOptions()) {
}

RegressionModel::RegressionModel(const core::RegressionOptions &options)
    : options_(options) {
	options_.Validate();
}

RegressionModel::RegressionModel(const Eigen::VectorXd &x, const Eigen::VectorXd &y,
                                 const core::RegressionOptions &options)
    : RegressionModel(options) {
	x_ = x;
	y_ = y;
	ValidateConstruction();
}

RegressionModel::RegressionModel(const Eigen::VectorXd &x, const Eigen::VectorXd &y, const Eigen::VectorXd &weights,
                                 const core::RegressionOptions &options)
    : RegressionModel(options) {
	x_ = x;
	y_ = y;
	weights_ = weights;
	has_weights_ = true;
	ValidateConstruction();
}

RegressionModel::RegressionModel(const std::vector<double> &x, const std::vector<double> &y,
                                 const core::RegressionOptions &options)
    : RegressionModel(TypeConverter::ToEigen(x), TypeConverter::ToEigen(y), options) {
}

RegressionModel::RegressionModel(const std::vector<double> &x, const std::vector<double> &y,
                                 const std::vector<double> &weights, const core::RegressionOptions &options)
    : RegressionModel(TypeConverter::ToEigen(x), TypeConverter::ToEigen(y), TypeConverter::ToEigen(weights),
                      options) {
}

void RegressionModel::ValidateConstruction() const {
	TypeConverter::ValidateFinite(x_, "x");
	TypeConverter::ValidateFinite(y_, "y");

	if (x_.size() != y_.size()) {
		throw core::InvalidInputError("x and y must have the same length (x: " + std::to_string(x_.size()) +
		                              ", y: " + std::to_string(y_.size()) + ")");
	}

	if (has_weights_) {
		TypeConverter::ValidateFinite(weights_, "weights");
		if (weights_.size() != x_.size()) {
			throw core::DimensionMismatchError("Weights vector must have same length as x (weights: " +
			                                   std::to_string(weights_.size()) +
			                                   ", x: " + std::to_string(x_.size()) + ")");
		}
	}
}

void RegressionModel::InvalidateFit(const char *reason) {
	if (fit_computed_) {
		COOKSTAT_TRACE("Cached fit invalidated: " << reason);
	}
	fit_computed_ = false;
}

// ============================================================================
// Data
// ============================================================================

void RegressionModel::SetX(const Eigen::VectorXd &x) {
	TypeConverter::ValidateFinite(x, "x");
	x_ = x;
	InvalidateFit("x replaced");
}

void RegressionModel::SetX(const std::vector<double> &x) {
	SetX(TypeConverter::ToEigen(x));
}

void RegressionModel::SetY(const Eigen::VectorXd &y) {
	TypeConverter::ValidateFinite(y, "y");
	y_ = y;
	InvalidateFit("y replaced");
}

void RegressionModel::SetY(const std::vector<double> &y) {
	SetY(TypeConverter::ToEigen(y));
}

void RegressionModel::SetWeights(const Eigen::VectorXd &weights) {
	TypeConverter::ValidateFinite(weights, "weights");
	if (x_.size() != 0 && weights.size() != x_.size()) {
		throw core::DimensionMismatchError("Weights vector must have same length as x (weights: " +
		                                   std::to_string(weights.size()) + ", x: " + std::to_string(x_.size()) +
		                                   ")");
	}
	weights_ = weights;
	has_weights_ = true;
	InvalidateFit("weights replaced");
}

void RegressionModel::SetWeights(const std::vector<double> &weights) {
	SetWeights(TypeConverter::ToEigen(weights));
}

void RegressionModel::ClearWeights() {
	weights_.resize(0);
	has_weights_ = false;
	InvalidateFit("weights cleared");
}

void RegressionModel::SetOptions(const core::RegressionOptions &options) {
	options.Validate();
	options_ = options;
	InvalidateFit("options replaced");
}

// ============================================================================
// Operations
// ============================================================================

core::RegressionSums RegressionModel::ComputeSums() const {
	if (has_weights_) {
		return solvers::LineFitSolver::ComputeSums(x_, y_, weights_);
	}
	return solvers::LineFitSolver::ComputeSums(x_, y_);
}

core::Coefficients RegressionModel::Fit() {
	core::LineFitResult result = has_weights_ ? solvers::LineFitSolver::Fit(x_, y_, weights_, options_)
	                                          : solvers::LineFitSolver::Fit(x_, y_, options_);

	last_fit_ = result;
	slope_ = result.slope();
	intercept_ = result.intercept();
	fit_computed_ = true;

	return result.coefficients;
}

core::Coefficients RegressionModel::Coefficients() {
	if (fit_computed_) {
		return core::Coefficients(intercept_, slope_);
	}
	return Fit();
}

Eigen::VectorXd RegressionModel::Fitted() {
	core::Coefficients coefficients = Coefficients();
	return diagnostics::InfluenceDiagnostics::Predict(coefficients, x_);
}

Eigen::VectorXd RegressionModel::Residuals() {
	Eigen::VectorXd fitted = Fitted();
	return y_ - fitted;
}

Eigen::VectorXd RegressionModel::CooksDistance() {
	Eigen::VectorXd residuals = Residuals();
	Eigen::VectorXd fitted = Fitted();

	if (has_weights_) {
		return diagnostics::InfluenceDiagnostics::ComputeCooksDistance(x_, y_, weights_, fitted, residuals, options_);
	}
	return diagnostics::InfluenceDiagnostics::ComputeCooksDistance(x_, y_, fitted, residuals, options_);
}

std::optional<utils::NStatistic> RegressionModel::N(const std::vector<double> &values, double percentile) {
	return utils::RankStatistics::N(values, percentile);
}

} // namespace model
} // namespace libcookstat
