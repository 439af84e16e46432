#include "tabcast/validation.hpp"
#include "tabcast/models/linear_trend.hpp"
#include "tabcast/models/naive.hpp"
#include "tabcast/utils/logging.hpp"

#include <memory>
#include <stdexcept>

namespace tabcast::validation {

utils::AccuracyMetrics accuracyMetrics(const std::vector<double> &actual, const std::vector<double> &predicted) {
	if (actual.size() != predicted.size() || actual.empty()) {
		throw std::invalid_argument("Actual and predicted vectors must be non-empty and equal length.");
	}

	utils::AccuracyMetrics metrics;
	metrics.n = actual.size();
	metrics.mse = utils::Metrics::mse(actual, predicted);
	metrics.rmse = utils::Metrics::rmse(actual, predicted);
	metrics.mape = utils::Metrics::mape(actual, predicted);
	return metrics;
}

SplitResult holdoutSplit(const core::TimeSeries &series, std::size_t holdout) {
	if (holdout == 0 || series.size() <= holdout) {
		throw std::invalid_argument("Series must be longer than the holdout window.");
	}
	return SplitResult{series.head(series.size() - holdout), series.tail(holdout)};
}

std::optional<utils::AccuracyMetrics> holdoutBacktest(const core::TimeSeries &series, selectors::Method method,
                                                      std::size_t holdout) {
	if (holdout == 0 || series.size() <= holdout) {
		TABCAST_DEBUG("Backtest skipped: {} points do not exceed the holdout of {}.", series.size(), holdout);
		return std::nullopt;
	}

	const auto split = holdoutSplit(series, holdout);

	std::unique_ptr<models::IForecaster> model;
	if (method == selectors::Method::Linear && split.train.size() >= 2) {
		model = models::LinearTrendForecasterBuilder().build();
	} else {
		model = std::make_unique<models::Naive>();
	}

	model->fit(split.train);
	const auto forecast = model->predict(static_cast<int>(holdout));
	auto metrics = accuracyMetrics(split.test.getValues(), forecast.point);

	if (!metrics.mape) {
		TABCAST_WARN("MAPE undefined: every held-out actual value is zero.");
	}
	return metrics;
}

} // namespace tabcast::validation
