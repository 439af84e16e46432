#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "common/series_helpers.hpp"
#include "tabcast/seasonality/detector.hpp"

#include <stdexcept>
#include <vector>

using tabcast::seasonality::SeasonalityDetector;
using tabcast::seasonality::SeasonalityProfile;
using tests::helpers::linearSeries;
using tests::helpers::sineSeries;

TEST_CASE("Autocorrelation is normalised to lag zero", "[seasonality][acf]") {
	const auto detector = SeasonalityDetector::builder().build();
	const auto acf = detector.autocorrelation(sineSeries(40, 7), 20);

	REQUIRE(acf.size() == 21);
	REQUIRE(acf[0] == Catch::Approx(1.0));
	REQUIRE(acf[7] > acf[6]);
	REQUIRE(acf[7] > acf[8]);

	const auto flat = detector.autocorrelation(std::vector<double>(10, 3.0), 5);
	REQUIRE(flat.size() == 6);
	REQUIRE(flat.isZero());
}

TEST_CASE("Autocorrelation lags are capped by the series length", "[seasonality][acf]") {
	const auto detector = SeasonalityDetector::builder().build();
	const std::vector<double> data{1.0, 2.0, 3.0, 4.0};

	const auto acf = detector.autocorrelation(data, 100);
	REQUIRE(acf.size() == 4);
	// Centered values -1.5 -0.5 0.5 1.5, energy 5
	REQUIRE(acf[1] == Catch::Approx(1.25 / 5.0));
	REQUIRE(acf[3] == Catch::Approx(-2.25 / 5.0));

	const auto truncated = detector.autocorrelation(data, 1);
	REQUIRE(truncated.size() == 2);
	REQUIRE(truncated[1] == Catch::Approx(acf[1]));

	REQUIRE(detector.autocorrelation({}, 3).size() == 0);
}

TEST_CASE("Detector finds the period of a sine wave", "[seasonality][detector]") {
	const auto detector = SeasonalityDetector::builder().build();

	const auto period = detector.detectPeriod(sineSeries(40, 7, 10.0, 50.0));
	REQUIRE(period.has_value());
	REQUIRE(*period == 7);

	const auto profile = detector.detect(sineSeries(48, 12, 5.0));
	REQUIRE(profile.has_value());
	REQUIRE(profile->period == 12);
	REQUIRE(profile->seasonal_component.size() == 12);
}

TEST_CASE("Detector reports nothing for short, flat or trending data", "[seasonality][detector]") {
	const auto detector = SeasonalityDetector::builder().build();

	REQUIRE_FALSE(detector.detectPeriod(sineSeries(20, 4)).has_value());
	REQUIRE_FALSE(detector.detectPeriod(std::vector<double>(30, 1.0)).has_value());
	REQUIRE_FALSE(detector.detectPeriod(linearSeries(5.0, 3.0, 30)).has_value());
}

TEST_CASE("Detector builder validates its settings", "[seasonality][detector]") {
	REQUIRE_THROWS_AS(SeasonalityDetector::builder().minLag(1).build(), std::invalid_argument);
	REQUIRE_THROWS_AS(SeasonalityDetector::builder().threshold(0.0).build(), std::invalid_argument);
	REQUIRE_THROWS_AS(SeasonalityDetector::builder().threshold(1.0).build(), std::invalid_argument);

	const auto lenient = SeasonalityDetector::builder().minLength(16).build();
	REQUIRE(lenient.detectPeriod(sineSeries(20, 4)).value() == 4);
}

TEST_CASE("Seasonal profile averages each phase around the mean", "[seasonality][profile]") {
	const std::vector<double> data{1.0, 3.0, 1.0, 3.0, 1.0, 3.0};
	const auto profile = SeasonalityProfile::fromSeries(data, 2);

	REQUIRE(profile.seasonal_component[0] == Catch::Approx(-1.0));
	REQUIRE(profile.seasonal_component[1] == Catch::Approx(1.0));
	REQUIRE(profile.offsetAt(7) == Catch::Approx(1.0));

	REQUIRE_THROWS_AS(SeasonalityProfile::fromSeries(data, 1), std::invalid_argument);
	REQUIRE_THROWS_AS(SeasonalityProfile::fromSeries(data, 7), std::invalid_argument);
}
