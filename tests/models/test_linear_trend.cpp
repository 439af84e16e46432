#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "common/series_helpers.hpp"
#include "tabcast/models/linear_trend.hpp"

#include <cmath>
#include <stdexcept>
#include <vector>

using namespace tabcast::models;
using tests::helpers::linearSeries;
using tests::helpers::makeSeries;

TEST_CASE("Linear trend recovers an exact line", "[models][linear]") {
	const auto fit = fitLinearTrend(linearSeries(5.0, 3.0, 20));

	REQUIRE(fit.slope == Catch::Approx(3.0));
	REQUIRE(fit.intercept == Catch::Approx(5.0));
	REQUIRE(fit.r_squared == Catch::Approx(1.0));
	REQUIRE(fit.slope_std_err == Catch::Approx(0.0).margin(1e-9));
	REQUIRE(fit.valueAt(20.0) == Catch::Approx(65.0));
}

TEST_CASE("Linear trend forecaster extrapolates past the history", "[models][linear]") {
	auto model = LinearTrendForecasterBuilder().build();
	model->fit(makeSeries(linearSeries(5.0, 3.0, 20)));
	const auto forecast = model->predict(3);

	REQUIRE(forecast.horizon() == 3);
	REQUIRE(forecast.point[0] == Catch::Approx(65.0));
	REQUIRE(forecast.point[2] == Catch::Approx(71.0));
	for (std::size_t i = 0; i < forecast.horizon(); ++i) {
		REQUIRE(forecast.lowerSeries()[i] <= forecast.point[i]);
		REQUIRE(forecast.upperSeries()[i] >= forecast.point[i]);
	}

	const auto info = model->modelInfo();
	REQUIRE(info.method == "linear_regression");
	REQUIRE(info.number("slope") == Catch::Approx(3.0));
	REQUIRE(info.number("intercept") == Catch::Approx(5.0));
	REQUIRE(info.number("r_squared") == Catch::Approx(1.0));
}

TEST_CASE("Linear trend intervals widen away from the data", "[models][linear]") {
	const std::vector<double> noisy{1.0, 3.0, 2.0, 5.0, 4.0, 6.0, 8.0, 7.0, 9.0, 11.0};
	auto model = LinearTrendForecasterBuilder().withZ(1.96).build();
	model->fit(makeSeries(noisy));
	const auto forecast = model->predict(5);

	const auto &fit = model->fitted();
	REQUIRE(fit.slope_std_err > 0.0);
	REQUIRE(fit.r_squared > 0.8);
	REQUIRE(fit.r_squared < 1.0);

	double previous = 0.0;
	for (std::size_t i = 0; i < forecast.horizon(); ++i) {
		const double width = forecast.upperSeries()[i] - forecast.lowerSeries()[i];
		REQUIRE(width > previous);
		previous = width;
	}
}

TEST_CASE("Linear trend interval uses the slope standard error", "[models][linear][intervals]") {
	const std::vector<double> noisy{1.0, 3.0, 2.0, 5.0, 4.0, 6.0, 8.0, 7.0, 9.0, 11.0};
	auto model = LinearTrendForecasterBuilder().build();
	REQUIRE(model->getName() == "LinearTrend");
	model->fit(makeSeries(noisy));

	// Sxx = 82.5, SSE = 6.8727..., se = sqrt(SSE / 8 / Sxx)
	const auto &fit = model->fitted();
	REQUIRE(fit.slope == Catch::Approx(1.0181818182));
	REQUIRE(fit.intercept == Catch::Approx(1.0181818182));
	REQUIRE(fit.sxx == Catch::Approx(82.5));
	REQUIRE(fit.x_mean == Catch::Approx(4.5));
	REQUIRE(fit.slope_std_err == Catch::Approx(0.1020452015));

	const auto forecast = model->predict(3);
	const double expected[] = {0.2422224372, 0.2539495835, 0.2669809978};
	for (std::size_t i = 0; i < 3; ++i) {
		const double x = 10.0 + static_cast<double>(i);
		const double half_width =
		    1.96 * fit.slope_std_err * std::sqrt(1.0 + 1.0 / 10.0 + (x - 4.5) * (x - 4.5) / 82.5);
		REQUIRE(forecast.upperSeries()[i] - forecast.point[i] == Catch::Approx(expected[i]));
		REQUIRE(forecast.point[i] - forecast.lowerSeries()[i] == Catch::Approx(half_width));
	}
}

TEST_CASE("Linear trend handles constant data", "[models][linear]") {
	const auto fit = fitLinearTrend(std::vector<double>(12, 4.0));
	REQUIRE(fit.slope == Catch::Approx(0.0).margin(1e-12));
	REQUIRE(fit.intercept == Catch::Approx(4.0));
	REQUIRE(fit.r_squared == 0.0);
}

TEST_CASE("Linear trend rejects misuse", "[models][linear]") {
	REQUIRE_THROWS_AS(fitLinearTrend({1.0}), std::invalid_argument);
	REQUIRE_THROWS_AS(LinearTrendForecasterBuilder().withZ(0.0).build(), std::invalid_argument);

	auto model = LinearTrendForecasterBuilder().build();
	REQUIRE_THROWS_AS(model->predict(1), std::runtime_error);
	REQUIRE_THROWS_AS(model->modelInfo(), std::runtime_error);
}
