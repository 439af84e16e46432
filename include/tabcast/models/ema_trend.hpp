#pragma once

#include "tabcast/models/iforecaster.hpp"
#include "tabcast/utils/logging.hpp"

#include <cstddef>
#include <memory>

namespace tabcast::models {

class EmaTrendBuilder; // Forward declaration

/**
 * @class EmaTrend
 * @brief Exponential moving average level extended by a short-window trend.
 *
 * The level is an EMA seeded with the first observation. The trend is the
 * average change over the last few observations. Interval half-width grows
 * with the square root of the step.
 */
class EmaTrend final : public IForecaster {
public:
	friend class EmaTrendBuilder;

	void fit(const core::TimeSeries &ts) override;
	core::Forecast predict(int horizon) override;
	ModelInfo modelInfo() const override;
	std::string getName() const override {
		return "EmaTrend";
	}

	double level() const {
		return level_;
	}

	double recentTrend() const {
		return recent_trend_;
	}

private:
	EmaTrend(double alpha, std::size_t trend_window, double interval_scale, double z);

	double alpha_;
	std::size_t trend_window_;
	double interval_scale_;
	double z_;
	double level_ = 0.0;
	double recent_trend_ = 0.0;
	double std_dev_ = 0.0;
	bool is_fitted_ = false;
};

/**
 * @class EmaTrendBuilder
 * @brief A builder for fluently configuring and creating EmaTrend models.
 */
class EmaTrendBuilder {
public:
	/**
	 * @brief Sets the smoothing constant of the level.
	 * @param alpha Weight of the newest observation, in (0, 1].
	 */
	EmaTrendBuilder &withAlpha(double alpha);

	/**
	 * @brief Sets how many trailing observations the trend is measured over.
	 */
	EmaTrendBuilder &withTrendWindow(std::size_t window);

	/// Multiplier applied to the standard deviation in the interval half-width.
	EmaTrendBuilder &withIntervalScale(double scale);

	EmaTrendBuilder &withZ(double z);

	std::unique_ptr<EmaTrend> build();

private:
	double alpha_ = 0.3;
	std::size_t trend_window_ = 5;
	double interval_scale_ = 0.5;
	double z_ = 1.96;
};

} // namespace tabcast::models
