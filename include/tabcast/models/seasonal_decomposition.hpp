#pragma once

#include "tabcast/models/iforecaster.hpp"
#include "tabcast/models/linear_trend.hpp"
#include "tabcast/seasonality/detector.hpp"
#include "tabcast/utils/logging.hpp"

#include <cstdint>
#include <memory>

namespace tabcast::models {

class SeasonalDecompositionBuilder;

/**
 * @class SeasonalDecomposition
 * @brief Additive decomposition into a linear trend and a fixed seasonal profile.
 *
 * The profile is subtracted from the history, a linear trend is fitted to the
 * remainder and forecasts add the profile back at the matching phase. The
 * interval half-width is constant over the horizon: z times the population
 * standard deviation of the history.
 */
class SeasonalDecomposition final : public IForecaster {
public:
	friend class SeasonalDecompositionBuilder;

	void fit(const core::TimeSeries &ts) override;
	core::Forecast predict(int horizon) override;
	ModelInfo modelInfo() const override;
	std::string getName() const override {
		return "SeasonalDecomposition";
	}

	const seasonality::SeasonalityProfile &profile() const {
		return profile_;
	}

	const LinearTrendFit &trend() const {
		return trend_;
	}

private:
	SeasonalDecomposition(std::uint32_t period, double z);

	std::uint32_t period_;
	double z_;
	seasonality::SeasonalityProfile profile_;
	LinearTrendFit trend_;
	double std_dev_ = 0.0;
	std::size_t n_ = 0;
	bool is_fitted_ = false;
};

/**
 * @class SeasonalDecompositionBuilder
 * @brief A builder for fluently configuring and creating SeasonalDecomposition models.
 */
class SeasonalDecompositionBuilder {
public:
	/**
	 * @brief Sets the seasonal period.
	 * @param period Number of index steps per cycle (at least 2).
	 */
	SeasonalDecompositionBuilder &withPeriod(std::uint32_t period);

	SeasonalDecompositionBuilder &withZ(double z);

	std::unique_ptr<SeasonalDecomposition> build();

private:
	std::uint32_t period_ = 0;
	double z_ = 1.96;
};

} // namespace tabcast::models
