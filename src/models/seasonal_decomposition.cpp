#include "tabcast/models/seasonal_decomposition.hpp"
#include "tabcast/utils/descriptive.hpp"

#include <stdexcept>
#include <vector>

namespace tabcast::models {

// --- Model Implementation ---

SeasonalDecomposition::SeasonalDecomposition(std::uint32_t period, double z) : period_(period), z_(z) {
	if (period_ < 2) {
		throw std::invalid_argument("Seasonal period must be at least 2.");
	}
	if (z_ <= 0.0) {
		throw std::invalid_argument("Interval quantile must be positive.");
	}
}

void SeasonalDecomposition::fit(const core::TimeSeries &ts) {
	const auto &values = ts.getValues();
	if (values.size() < static_cast<std::size_t>(period_) || values.size() < 2) {
		throw std::invalid_argument("Time series must cover at least one seasonal period.");
	}

	profile_ = seasonality::SeasonalityProfile::fromSeries(values, period_);

	std::vector<double> deseasonalized(values.size());
	for (std::size_t i = 0; i < values.size(); ++i) {
		deseasonalized[i] = values[i] - profile_.offsetAt(i);
	}

	trend_ = fitLinearTrend(deseasonalized);
	std_dev_ = utils::populationStdDev(values);
	n_ = values.size();
	is_fitted_ = true;

	if (std_dev_ == 0.0) {
		TABCAST_WARN("Seasonal decomposition fitted on a constant series; intervals collapse to the estimate.");
	}
	TABCAST_INFO("Seasonal decomposition fitted with {} data points. Period = {}, trend slope = {}.", n_, period_,
	             trend_.slope);
}

core::Forecast SeasonalDecomposition::predict(int horizon) {
	if (!is_fitted_) {
		throw std::runtime_error("Predict called before fit.");
	}
	if (horizon < 0) {
		throw std::invalid_argument("Forecast horizon must be non-negative.");
	}

	core::Forecast forecast;
	forecast.point.reserve(horizon);
	const double half_width = z_ * std_dev_;
	for (int i = 0; i < horizon; ++i) {
		const std::size_t index = n_ + static_cast<std::size_t>(i);
		const double estimate = trend_.valueAt(static_cast<double>(index)) + profile_.offsetAt(index);
		forecast.push(estimate, half_width);
	}
	return forecast;
}

ModelInfo SeasonalDecomposition::modelInfo() const {
	if (!is_fitted_) {
		throw std::runtime_error("Model info requested before fit.");
	}
	ModelInfo info;
	info.method = "seasonal_decomposition";
	info.set("seasonality_period", static_cast<std::int64_t>(period_));
	info.set("trend_slope", trend_.slope);
	return info;
}

// --- Builder Implementation ---

SeasonalDecompositionBuilder &SeasonalDecompositionBuilder::withPeriod(std::uint32_t period) {
	period_ = period;
	return *this;
}

SeasonalDecompositionBuilder &SeasonalDecompositionBuilder::withZ(double z) {
	z_ = z;
	return *this;
}

std::unique_ptr<SeasonalDecomposition> SeasonalDecompositionBuilder::build() {
	TABCAST_DEBUG("Building seasonal decomposition model with period = {}.", period_);
	return std::unique_ptr<SeasonalDecomposition>(new SeasonalDecomposition(period_, z_));
}

} // namespace tabcast::models
