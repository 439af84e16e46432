#include "tabcast/engine/forecast_engine.hpp"
#include "tabcast/models/ema_trend.hpp"
#include "tabcast/models/linear_trend.hpp"
#include "tabcast/models/seasonal_decomposition.hpp"
#include "tabcast/utils/descriptive.hpp"
#include "tabcast/utils/logging.hpp"
#include "tabcast/validation.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <variant>

namespace tabcast::engine {

namespace {

EngineConfig checked(EngineConfig config) {
	validateConfig(config);
	return config;
}

models::ModelInfo roundedInfo(const models::ModelInfo &info, int decimals) {
	models::ModelInfo rounded;
	rounded.method = info.method;
	for (const auto &entry : info.params) {
		if (const auto *real = std::get_if<double>(&entry.second)) {
			rounded.set(entry.first, utils::roundTo(*real, decimals));
		} else {
			rounded.set(entry.first, entry.second);
		}
	}
	return rounded;
}

selectors::Method parseRequestedMethod(const std::string &name) {
	try {
		return selectors::parseMethod(name);
	} catch (const std::invalid_argument &e) {
		throw core::ForecastError(core::ErrorKind::InvalidRequest, e.what());
	}
}

void requireFinite(const core::Forecast &forecast, const std::string &column) {
	const auto &lower = forecast.lowerSeries();
	const auto &upper = forecast.upperSeries();
	for (std::size_t i = 0; i < forecast.horizon(); ++i) {
		if (!std::isfinite(forecast.point[i]) || !std::isfinite(lower[i]) || !std::isfinite(upper[i])) {
			throw core::ForecastError(core::ErrorKind::Internal,
			                          "Forecast for column '" + column + "' is not finite at step " +
			                              std::to_string(i + 1) + "; values are outside the representable range");
		}
	}
}

TrendDirection directionFor(double change_pct, double band) {
	if (change_pct > band) {
		return TrendDirection::Increasing;
	}
	if (change_pct < -band) {
		return TrendDirection::Decreasing;
	}
	return TrendDirection::Stable;
}

} // namespace

std::string trendDirectionName(TrendDirection direction) {
	switch (direction) {
	case TrendDirection::Increasing:
		return "increasing";
	case TrendDirection::Decreasing:
		return "decreasing";
	case TrendDirection::Stable:
		return "stable";
	}
	return "stable";
}

ForecastEngine::ForecastEngine(EngineConfig config)
    : config_(checked(config)), extractor_(config_.min_points),
      detector_(seasonality::SeasonalityDetector::builder()
                    .minLag(config_.min_lag)
                    .threshold(config_.acf_threshold)
                    .minLength(config_.seasonality_min_points)
                    .build()),
      selector_(config_.trend_strength_ratio) {}

int ForecastEngine::resolvePeriods(const std::optional<int> &periods) const {
	const int resolved = periods.value_or(config_.default_periods);
	if (resolved < 1) {
		throw core::ForecastError(core::ErrorKind::InvalidRequest,
		                          "periods must be a positive integer, got " + std::to_string(resolved));
	}
	return resolved;
}

std::unique_ptr<models::IForecaster>
ForecastEngine::makeForecaster(selectors::Method method,
                               const std::optional<seasonality::SeasonalityProfile> &profile) const {
	switch (method) {
	case selectors::Method::Linear:
		return models::LinearTrendForecasterBuilder().withZ(config_.z).build();
	case selectors::Method::Seasonal:
		if (profile) {
			return models::SeasonalDecompositionBuilder().withPeriod(profile->period).withZ(config_.z).build();
		}
		break;
	case selectors::Method::MovingAverage:
	case selectors::Method::Auto:
		break;
	}
	return models::EmaTrendBuilder()
	    .withAlpha(config_.ema_alpha)
	    .withTrendWindow(config_.recent_trend_window)
	    .withIntervalScale(config_.ema_interval_scale)
	    .withZ(config_.z)
	    .build();
}

ForecastResult ForecastEngine::run(const core::Table &table, const std::string &column, int periods,
                                   selectors::Method requested) const {
	const auto series = extractor_.extract(table, column);
	const auto &values = series.getValues();

	const auto profile = detector_.detect(values);

	selectors::SelectionInputs inputs;
	inputs.has_seasonality = profile.has_value();
	inputs.trend = utils::trendPerStep(values);
	inputs.std_dev = utils::populationStdDev(values);
	const auto method = selector_.select(requested, inputs);

	auto model = makeForecaster(method, profile);
	model->fit(series);
	const auto forecast = model->predict(periods);
	requireFinite(forecast, column);
	const int decimals = config_.decimals;

	ForecastResult result;
	result.column = column;
	result.periods = periods;
	result.method = method;
	result.model_info = roundedInfo(model->modelInfo(), decimals);

	if (const auto metrics = validation::holdoutBacktest(series, method, config_.holdout)) {
		if (std::isfinite(metrics->rmse)) {
			if (metrics->mape && std::isfinite(*metrics->mape)) {
				result.accuracy.mape = utils::roundTo(*metrics->mape, decimals);
			}
			result.accuracy.rmse = utils::roundTo(metrics->rmse, decimals);
		} else {
			TABCAST_WARN("Backtest error for '{}' overflowed; accuracy metrics omitted.", column);
		}
	}

	result.historical.reserve(values.size());
	for (const double value : values) {
		result.historical.push_back(utils::roundTo(value, decimals));
	}

	const auto &lower = forecast.lowerSeries();
	const auto &upper = forecast.upperSeries();
	result.forecast.reserve(forecast.horizon());
	for (std::size_t i = 0; i < forecast.horizon(); ++i) {
		ForecastPoint point;
		point.index = values.size() + i;
		point.value = utils::roundTo(forecast.point[i], decimals);
		point.lower = utils::roundTo(lower[i], decimals);
		point.upper = utils::roundTo(upper[i], decimals);
		result.forecast.push_back(point);
	}

	const double current = series.back();
	const double end_value = forecast.point.back();
	const double change_pct = current != 0.0 ? (end_value - current) / current * 100.0 : 0.0;
	if (!std::isfinite(change_pct)) {
		throw core::ForecastError(core::ErrorKind::Internal,
		                          "Forecast change for column '" + column + "' is outside the representable range");
	}

	result.summary.current_value = utils::roundTo(current, decimals);
	result.summary.forecasted_end_value = utils::roundTo(end_value, decimals);
	result.summary.forecast_change_pct = utils::roundTo(change_pct, decimals);
	result.summary.direction = directionFor(change_pct, config_.stable_band_pct);
	if (profile) {
		result.summary.seasonality_period = profile->period;
	}

	TABCAST_INFO("Forecast for '{}': model = {}, periods = {}, trend = {}.", column, model->getName(), periods,
	             trendDirectionName(result.summary.direction));
	return result;
}

ForecastOutcome ForecastEngine::forecast(const ForecastRequest &request) const {
	try {
		const int periods = resolvePeriods(request.periods);
		const auto requested = parseRequestedMethod(request.method);
		return ForecastOutcome::ok(run(request.table, request.value_column, periods, requested));
	} catch (const core::ForecastError &e) {
		TABCAST_ERROR("Forecasting error: {}", e.what());
		return ForecastOutcome::fail(e.kind(), e.what());
	} catch (const std::exception &e) {
		TABCAST_ERROR("Forecasting error: {}", e.what());
		return ForecastOutcome::fail(core::ErrorKind::Internal, e.what());
	}
}

MultiForecastOutcome ForecastEngine::forecastColumns(const MultiForecastRequest &request) const {
	int periods = 0;
	try {
		periods = resolvePeriods(request.periods);
	} catch (const core::ForecastError &e) {
		TABCAST_ERROR("Multi-column forecast error: {}", e.what());
		return MultiForecastOutcome::fail(e.kind(), e.what());
	}

	const std::size_t limit = std::min(request.columns.size(), config_.max_columns);
	if (request.columns.size() > limit) {
		TABCAST_DEBUG("Multi-column forecast limited to the first {} of {} columns.", limit, request.columns.size());
	}

	MultiForecastResult result;
	result.periods = periods;
	for (std::size_t i = 0; i < limit; ++i) {
		const auto &column = request.columns[i];
		try {
			auto single = run(request.table, column, periods, selectors::Method::Auto);
			ColumnForecast entry;
			entry.column = column;
			entry.summary = single.summary;
			entry.model_info = std::move(single.model_info);
			entry.forecast = std::move(single.forecast);
			result.forecasts.push_back(std::move(entry));
		} catch (const core::ForecastError &e) {
			TABCAST_DEBUG("Skipping column '{}': {}", column, e.what());
		} catch (const std::exception &e) {
			TABCAST_WARN("Skipping column '{}' after unexpected error: {}", column, e.what());
		}
	}

	if (result.forecasts.empty()) {
		TABCAST_ERROR("Multi-column forecast error: no columns could be forecasted.");
		return MultiForecastOutcome::fail(core::ErrorKind::NoForecastableColumns, "No columns could be forecasted");
	}
	return MultiForecastOutcome::ok(std::move(result));
}

} // namespace tabcast::engine
