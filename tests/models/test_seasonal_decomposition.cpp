#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "common/series_helpers.hpp"
#include "tabcast/models/seasonal_decomposition.hpp"
#include "tabcast/utils/descriptive.hpp"

#include <cstdint>
#include <stdexcept>
#include <variant>
#include <vector>

using namespace tabcast::models;
using tests::helpers::makeSeries;
using tests::helpers::sineSeries;

TEST_CASE("Seasonal decomposition repeats the seasonal shape", "[models][seasonal]") {
	const auto values = sineSeries(42, 7, 10.0, 100.0);
	auto model = SeasonalDecompositionBuilder().withPeriod(7).build();
	model->fit(makeSeries(values));
	const auto forecast = model->predict(7);

	REQUIRE(forecast.horizon() == 7);
	for (std::size_t i = 0; i < 7; ++i) {
		REQUIRE(forecast.point[i] == Catch::Approx(values[i]).margin(1e-6));
	}
	REQUIRE(model->trend().slope == Catch::Approx(0.0).margin(1e-9));
}

TEST_CASE("Seasonal decomposition intervals have constant width", "[models][seasonal]") {
	auto values = sineSeries(40, 5, 4.0, 20.0);
	for (std::size_t i = 0; i < values.size(); ++i) {
		values[i] += 0.5 * static_cast<double>(i);
	}
	auto model = SeasonalDecompositionBuilder().withPeriod(5).withZ(2.0).build();
	model->fit(makeSeries(values));
	const auto forecast = model->predict(6);

	const double first_width = forecast.upperSeries()[0] - forecast.lowerSeries()[0];
	REQUIRE(first_width > 0.0);
	for (std::size_t i = 0; i < forecast.horizon(); ++i) {
		const double width = forecast.upperSeries()[i] - forecast.lowerSeries()[i];
		REQUIRE(width == Catch::Approx(first_width));
	}
	REQUIRE(model->trend().slope == Catch::Approx(0.5).margin(0.05));

	const auto info = model->modelInfo();
	REQUIRE(info.method == "seasonal_decomposition");
	REQUIRE(std::get<std::int64_t>(*info.get("seasonality_period")) == 5);
	REQUIRE(info.number("trend_slope") == Catch::Approx(model->trend().slope));
}

TEST_CASE("Seasonal decomposition half-width is z times the population std", "[models][seasonal][intervals]") {
	auto values = sineSeries(28, 4, 3.0, 10.0);
	values[5] += 2.0;
	auto model = SeasonalDecompositionBuilder().withPeriod(4).build();
	REQUIRE(model->getName() == "SeasonalDecomposition");
	model->fit(makeSeries(values));
	const auto forecast = model->predict(5);

	const double expected = 1.96 * tabcast::utils::populationStdDev(values);
	for (std::size_t i = 0; i < forecast.horizon(); ++i) {
		REQUIRE(forecast.upperSeries()[i] - forecast.point[i] == Catch::Approx(expected));
		REQUIRE(forecast.point[i] - forecast.lowerSeries()[i] == Catch::Approx(expected));
	}
}

TEST_CASE("Seasonal decomposition rejects misuse", "[models][seasonal]") {
	REQUIRE_THROWS_AS(SeasonalDecompositionBuilder().build(), std::invalid_argument);
	REQUIRE_THROWS_AS(SeasonalDecompositionBuilder().withPeriod(4).withZ(-1.0).build(), std::invalid_argument);

	auto model = SeasonalDecompositionBuilder().withPeriod(12).build();
	REQUIRE_THROWS_AS(model->predict(1), std::runtime_error);
	REQUIRE_THROWS_AS(model->fit(makeSeries(sineSeries(10, 12))), std::invalid_argument);
}
