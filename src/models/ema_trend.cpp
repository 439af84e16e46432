#include "tabcast/models/ema_trend.hpp"
#include "tabcast/utils/descriptive.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace tabcast::models {

// --- Model Implementation ---

EmaTrend::EmaTrend(double alpha, std::size_t trend_window, double interval_scale, double z)
    : alpha_(alpha), trend_window_(trend_window), interval_scale_(interval_scale), z_(z) {
	if (alpha_ <= 0.0 || alpha_ > 1.0) {
		throw std::invalid_argument("Alpha must be in (0, 1].");
	}
	if (trend_window_ == 0) {
		throw std::invalid_argument("Trend window must be positive.");
	}
	if (interval_scale_ < 0.0) {
		throw std::invalid_argument("Interval scale must be non-negative.");
	}
	if (z_ <= 0.0) {
		throw std::invalid_argument("Interval quantile must be positive.");
	}
}

void EmaTrend::fit(const core::TimeSeries &ts) {
	const auto &values = ts.getValues();
	if (values.empty()) {
		throw std::invalid_argument("Time series cannot be empty for fitting.");
	}

	level_ = values[0];
	for (std::size_t i = 1; i < values.size(); ++i) {
		level_ = alpha_ * values[i] + (1.0 - alpha_) * level_;
	}

	const std::size_t n = values.size();
	const std::size_t window = std::min(trend_window_, n);
	const std::size_t anchor = n > trend_window_ ? n - trend_window_ : 0;
	recent_trend_ = (values.back() - values[anchor]) / static_cast<double>(window);

	std_dev_ = utils::populationStdDev(values);
	is_fitted_ = true;

	if (std_dev_ == 0.0) {
		TABCAST_WARN("EMA model fitted on a constant series; intervals collapse to the estimate.");
	}
	TABCAST_INFO("EMA model fitted with {} data points. Level = {}, recent trend = {}.", n, level_, recent_trend_);
}

core::Forecast EmaTrend::predict(int horizon) {
	if (!is_fitted_) {
		throw std::runtime_error("Predict called before fit.");
	}
	if (horizon < 0) {
		throw std::invalid_argument("Forecast horizon must be non-negative.");
	}

	core::Forecast forecast;
	forecast.point.reserve(horizon);
	for (int i = 0; i < horizon; ++i) {
		const double step = static_cast<double>(i + 1);
		const double estimate = level_ + recent_trend_ * step;
		forecast.push(estimate, z_ * interval_scale_ * std_dev_ * std::sqrt(step));
	}
	return forecast;
}

ModelInfo EmaTrend::modelInfo() const {
	if (!is_fitted_) {
		throw std::runtime_error("Model info requested before fit.");
	}
	ModelInfo info;
	info.method = "exponential_moving_average";
	info.set("alpha", alpha_);
	info.set("recent_trend", recent_trend_);
	return info;
}

// --- Builder Implementation ---

EmaTrendBuilder &EmaTrendBuilder::withAlpha(double alpha) {
	alpha_ = alpha;
	return *this;
}

EmaTrendBuilder &EmaTrendBuilder::withTrendWindow(std::size_t window) {
	trend_window_ = window;
	return *this;
}

EmaTrendBuilder &EmaTrendBuilder::withIntervalScale(double scale) {
	interval_scale_ = scale;
	return *this;
}

EmaTrendBuilder &EmaTrendBuilder::withZ(double z) {
	z_ = z;
	return *this;
}

std::unique_ptr<EmaTrend> EmaTrendBuilder::build() {
	TABCAST_DEBUG("Building EMA model with alpha = {} and trend window = {}.", alpha_, trend_window_);
	return std::unique_ptr<EmaTrend>(new EmaTrend(alpha_, trend_window_, interval_scale_, z_));
}

} // namespace tabcast::models
