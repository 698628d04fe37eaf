#include <catch2/catch.hpp>

#include <libcookstat/model/regression_model.hpp>
#include <libcookstat/core/regression_errors.hpp>
#include <libcookstat/utils/tracing.hpp>
#include <Eigen/Dense>
#include <cmath>
#include <limits>
#include <thread>
#include <vector>

using namespace libcookstat;
using namespace libcookstat::model;
using namespace libcookstat::core;

const double TOLERANCE = 1e-9;

TEST_CASE("RegressionModel: Default Construction", "[model][lifecycle]") {
	RegressionModel model;

	REQUIRE(model.X().size() == 0);
	REQUIRE(model.Y().size() == 0);
	REQUIRE_FALSE(model.HasWeights());
	REQUIRE_FALSE(model.IsFitComputed());
	REQUIRE(std::isnan(model.Slope()));
	REQUIRE(std::isnan(model.Intercept()));

	REQUIRE_THROWS_AS(model.Fit(), InvalidInputError);
	REQUIRE_THROWS_AS(model.Coefficients(), InvalidInputError);
	REQUIRE_FALSE(model.IsFitComputed());
}

TEST_CASE("RegressionModel: Perfectly Linear Data", "[model][fit]") {
	std::vector<double> x = {1.0, 2.0, 3.0, 4.0};
	std::vector<double> y = {2.0, 4.0, 6.0, 8.0};
	RegressionModel model(x, y);

	auto coefs = model.Fit();

	REQUIRE_THAT(coefs.intercept, Catch::Matchers::WithinAbs(0.0, TOLERANCE));
	REQUIRE_THAT(coefs.slope, Catch::Matchers::WithinAbs(2.0, TOLERANCE));
	REQUIRE(model.IsFitComputed());
	REQUIRE(model.Slope() == coefs.slope);
	REQUIRE(model.Intercept() == coefs.intercept);
	REQUIRE(model.LastFit().n_obs == 4);
}

TEST_CASE("RegressionModel: Setters Then Fit", "[model][fit]") {
	RegressionModel model;
	model.SetX(std::vector<double>{1.0, 2.0, 3.0, 4.0, 5.0});
	model.SetY(std::vector<double>{3.0, 5.0, 7.0, 9.0, 11.0});

	auto coefs = model.Coefficients();
	REQUIRE_THAT(coefs.intercept, Catch::Matchers::WithinAbs(1.0, TOLERANCE));
	REQUIRE_THAT(coefs.slope, Catch::Matchers::WithinAbs(2.0, TOLERANCE));
}

TEST_CASE("RegressionModel: Degenerate And Invalid Data", "[model][validation]") {
	SECTION("All x equal") {
		RegressionModel model(std::vector<double>{5.0, 5.0, 5.0}, std::vector<double>{1.0, 2.0, 3.0});
		REQUIRE_THROWS_AS(model.Fit(), DegenerateFitError);
		REQUIRE_THROWS_AS(model.Fitted(), DegenerateFitError);
		REQUIRE_FALSE(model.IsFitComputed());
	}

	SECTION("Mismatched lengths through setters") {
		RegressionModel model;
		model.SetX(std::vector<double>{1.0, 2.0, 3.0});
		model.SetY(std::vector<double>{1.0, 2.0});
		REQUIRE_THROWS_AS(model.Fit(), InvalidInputError);
	}

	SECTION("Mismatched lengths at construction") {
		REQUIRE_THROWS_AS(RegressionModel(std::vector<double>{1.0, 2.0, 3.0}, std::vector<double>{1.0, 2.0}),
		                  InvalidInputError);
	}

	SECTION("Mismatched weights at construction") {
		REQUIRE_THROWS_AS(RegressionModel(std::vector<double>{1.0, 2.0, 3.0}, std::vector<double>{1.0, 2.0, 4.0},
		                                  std::vector<double>{1.0, 1.0}),
		                  DimensionMismatchError);
	}

	SECTION("Mismatched weights through setter") {
		RegressionModel model(std::vector<double>{1.0, 2.0, 3.0}, std::vector<double>{1.0, 2.0, 4.0});
		REQUIRE_THROWS_AS(model.SetWeights(std::vector<double>{1.0}), DimensionMismatchError);
		REQUIRE_FALSE(model.HasWeights());
	}

	SECTION("Weights that no longer match a replaced x") {
		RegressionModel model(std::vector<double>{1.0, 2.0, 3.0}, std::vector<double>{1.0, 2.0, 4.0},
		                      std::vector<double>{1.0, 1.0, 1.0});
		model.SetX(std::vector<double>{1.0, 2.0, 3.0, 4.0});
		model.SetY(std::vector<double>{1.0, 2.0, 4.0, 3.0});
		REQUIRE_THROWS_AS(model.ComputeSums(), DimensionMismatchError);
		REQUIRE_THROWS_AS(model.Fit(), DimensionMismatchError);
	}

	SECTION("Non-finite values are rejected") {
		RegressionModel model;
		REQUIRE_THROWS_AS(model.SetX(std::vector<double>{1.0, std::numeric_limits<double>::quiet_NaN()}),
		                  InvalidInputError);
		REQUIRE_THROWS_AS(model.SetY(std::vector<double>{std::numeric_limits<double>::infinity()}),
		                  InvalidInputError);
		REQUIRE(model.X().size() == 0);
	}

	SECTION("Invalid options") {
		RegressionOptions opts;
		opts.degenerate_tolerance = -1.0;
		REQUIRE_THROWS_AS(RegressionModel(opts), std::invalid_argument);
		RegressionModel model;
		REQUIRE_THROWS_AS(model.SetOptions(opts), std::invalid_argument);
	}
}

TEST_CASE("RegressionModel: Cache Correctness", "[model][cache]") {
	std::vector<double> x = {1.0, 2.0, 3.0, 4.0, 5.0, 6.0};
	std::vector<double> y = {1.0, 2.1, 3.2, 4.0, 7.0, 6.0};
	RegressionModel model(x, y);

	REQUIRE_FALSE(model.IsFitComputed());
	auto first = model.Coefficients();
	REQUIRE(model.IsFitComputed());
	auto second = model.Coefficients();
	REQUIRE(first == second);

	SECTION("Replacing x forces recomputation") {
		model.SetX(std::vector<double>{2.0, 4.0, 6.0, 8.0, 10.0, 12.0});
		REQUIRE_FALSE(model.IsFitComputed());
		auto third = model.Coefficients();
		REQUIRE(model.IsFitComputed());
		REQUIRE_THAT(third.slope, Catch::Matchers::WithinAbs(first.slope / 2.0, TOLERANCE));
	}

	SECTION("Replacing y clears the cache") {
		model.SetY(std::vector<double>{1.0, 2.0, 3.0, 4.0, 5.0, 6.0});
		REQUIRE_FALSE(model.IsFitComputed());
		auto third = model.Coefficients();
		REQUIRE_THAT(third.slope, Catch::Matchers::WithinAbs(1.0, TOLERANCE));
		REQUIRE_THAT(third.intercept, Catch::Matchers::WithinAbs(0.0, TOLERANCE));
	}

	SECTION("Replacing weights clears the cache") {
		model.SetWeights(std::vector<double>{1.0, 1.0, 1.0, 1.0, 1.0, 1.0});
		REQUIRE_FALSE(model.IsFitComputed());
		model.Fit();
		model.ClearWeights();
		REQUIRE_FALSE(model.IsFitComputed());
	}

	SECTION("Replacing options clears the cache") {
		model.SetOptions(RegressionOptions::Tolerant(1e-12));
		REQUIRE_FALSE(model.IsFitComputed());
	}

	SECTION("Caller mutation after hand-off is not observed") {
		x[0] = 100.0;
		REQUIRE(model.IsFitComputed());
		REQUIRE(model.X()(0) == 1.0);
		REQUIRE(model.Coefficients() == first);
	}

	SECTION("Explicit Fit re-runs on unchanged data") {
		auto refit = model.Fit();
		REQUIRE(refit == first);
	}
}

TEST_CASE("RegressionModel: Fitted And Residuals", "[model][residuals]") {
	std::vector<double> x = {0.5, 1.5, 2.0, 3.5, 4.0, 5.5, 6.0, 8.0};
	std::vector<double> y = {1.2, 2.9, 3.1, 6.8, 7.4, 10.9, 11.8, 16.5};
	RegressionModel model(x, y);

	Eigen::VectorXd fitted = model.Fitted();
	Eigen::VectorXd residuals = model.Residuals();

	REQUIRE(fitted.size() == 8);
	REQUIRE(residuals.size() == 8);

	SECTION("y = fitted + residual") {
		for (Eigen::Index i = 0; i < 8; i++) {
			REQUIRE_THAT(fitted(i) + residuals(i), Catch::Matchers::WithinAbs(y[static_cast<size_t>(i)], TOLERANCE));
		}
	}

	SECTION("Fitted follows the coefficients") {
		auto coefs = model.Coefficients();
		for (Eigen::Index i = 0; i < 8; i++) {
			REQUIRE(fitted(i) == coefs.intercept + coefs.slope * x[static_cast<size_t>(i)]);
		}
	}

	SECTION("Idempotent") {
		Eigen::VectorXd again = model.Fitted();
		REQUIRE(again == fitted);
		REQUIRE(model.Residuals() == residuals);
	}

	SECTION("Least-squares residuals sum to zero") {
		REQUIRE_THAT(residuals.sum(), Catch::Matchers::WithinAbs(0.0, 1e-9));
	}
}

TEST_CASE("RegressionModel: Weighted Fit", "[model][weighted]") {
	std::vector<double> x = {1.0, 2.0, 3.0, 4.0, 5.0, 6.0};
	std::vector<double> y = {1.0, 2.1, 3.2, 4.0, 7.0, 6.0};

	RegressionModel unweighted(x, y);
	RegressionModel unit(x, y, std::vector<double>{1.0, 1.0, 1.0, 1.0, 1.0, 1.0});

	REQUIRE(unit.HasWeights());
	auto a = unweighted.Coefficients();
	auto b = unit.Coefficients();
	REQUIRE_THAT(b.intercept, Catch::Matchers::WithinAbs(a.intercept, 1e-12));
	REQUIRE_THAT(b.slope, Catch::Matchers::WithinAbs(a.slope, 1e-12));
	REQUIRE(unit.LastFit().weighted);

	auto sums = unit.ComputeSums();
	REQUIRE_THAT(sums.x, Catch::Matchers::WithinAbs(21.0, TOLERANCE));
	REQUIRE_THAT(sums.xy, Catch::Matchers::WithinAbs(101.8, TOLERANCE));
}

TEST_CASE("RegressionModel: Cook's Distance", "[model][cooks]") {
	std::vector<double> x = {1.0, 2.0, 3.0, 4.0, 5.0, 6.0};
	std::vector<double> y = {1.0, 2.1, 3.2, 4.0, 7.0, 6.0};
	RegressionModel model(x, y);

	Eigen::VectorXd cooks_d = model.CooksDistance();

	REQUIRE(cooks_d.size() == 6);
	for (Eigen::Index i = 0; i < cooks_d.size(); i++) {
		REQUIRE(std::isfinite(cooks_d(i)));
		REQUIRE(cooks_d(i) >= 0.0);
	}
	REQUIRE_THAT(cooks_d(0), Catch::Matchers::WithinRel(0.0001531500174033619, 1e-7));
	REQUIRE_THAT(cooks_d(5), Catch::Matchers::WithinRel(1.0172607030978085, 1e-7));

	// The outer fit is cached, not disturbed by the leave-one-out fits
	REQUIRE(model.IsFitComputed());
	REQUIRE(model.X().size() == 6);

	SECTION("Perfect fit") {
		RegressionModel exact(std::vector<double>{1.0, 2.0, 3.0, 4.0}, std::vector<double>{2.0, 4.0, 6.0, 8.0});
		REQUIRE_THROWS_AS(exact.CooksDistance(), ZeroResidualError);

		RegressionOptions opts;
		opts.zero_residual_policy = ZeroResidualPolicy::NonFinite;
		exact.SetOptions(opts);
		Eigen::VectorXd d = exact.CooksDistance();
		REQUIRE(d.size() == 4);
		REQUIRE_FALSE(std::isfinite(d(0)));
	}
}

TEST_CASE("RegressionModel: N Statistic", "[model][rank]") {
	auto result = RegressionModel::N({1.0, 2.0, 3.0, 4.0});
	REQUIRE(result.has_value());
	REQUIRE(result->value == 3.0);
	REQUIRE(result->rank == 3);

	REQUIRE_FALSE(RegressionModel::N({}).has_value());
}

TEST_CASE("RegressionModel: Independent Instances Across Threads", "[model][threads]") {
	const std::vector<double> x = {1.0, 2.0, 3.0, 4.0, 5.0, 6.0};
	const std::vector<double> y = {1.0, 2.1, 3.2, 4.0, 7.0, 6.0};

	const Eigen::VectorXd expected = RegressionModel(x, y).CooksDistance();

	// Both threads log through the shared tracer while fitting
	const utils::LogLevel saved = utils::Tracer::GetLogLevel();
	utils::Tracer::SetLogLevel(utils::LogLevel::DBG);

	const int rounds = 20;
	std::vector<Eigen::VectorXd> results(2);
	std::vector<std::thread> workers;
	for (size_t t = 0; t < results.size(); t++) {
		workers.emplace_back([&x, &y, &results, t] {
			for (int r = 0; r < rounds; r++) {
				RegressionModel model(x, y);
				results[t] = model.CooksDistance();
			}
		});
	}
	for (auto &worker : workers) {
		worker.join();
	}

	utils::Tracer::SetLogLevel(saved);

	for (const auto &cooks_d : results) {
		REQUIRE(cooks_d.size() == expected.size());
		for (Eigen::Index i = 0; i < expected.size(); i++) {
			REQUIRE(cooks_d(i) == expected(i));
		}
	}
}
