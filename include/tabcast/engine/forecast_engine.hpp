#pragma once

#include "tabcast/core/errors.hpp"
#include "tabcast/core/table.hpp"
#include "tabcast/core/time_series.hpp"
#include "tabcast/data/series_extractor.hpp"
#include "tabcast/engine/config.hpp"
#include "tabcast/models/iforecaster.hpp"
#include "tabcast/seasonality/detector.hpp"
#include "tabcast/selectors/method_selector.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tabcast::engine {

struct ForecastRequest {
	core::Table table;
	std::string value_column;
	/// Accepted for compatibility with the service contract; positions are used instead of dates.
	std::optional<std::string> date_column;
	/// Horizon; EngineConfig::default_periods when absent.
	std::optional<int> periods;
	std::string method = "auto";
};

struct MultiForecastRequest {
	core::Table table;
	std::vector<std::string> columns;
	std::optional<int> periods;
};

struct ForecastPoint {
	std::size_t index = 0;
	double value = 0.0;
	double lower = 0.0;
	double upper = 0.0;
};

enum class TrendDirection {
	Increasing,
	Decreasing,
	Stable
};

std::string trendDirectionName(TrendDirection direction);

struct ForecastSummary {
	double current_value = 0.0;
	double forecasted_end_value = 0.0;
	double forecast_change_pct = 0.0;
	TrendDirection direction = TrendDirection::Stable;
	std::optional<std::uint32_t> seasonality_period;

	bool seasonalityDetected() const {
		return seasonality_period.has_value();
	}
};

/// Backtest accuracy; both metrics absent when the history is too short.
struct AccuracyReport {
	std::optional<double> mape;
	std::optional<double> rmse;
};

struct ForecastResult {
	std::string column;
	int periods = 0;
	/// Strategy actually used, after auto selection and fallback.
	selectors::Method method = selectors::Method::MovingAverage;
	models::ModelInfo model_info;
	AccuracyReport accuracy;
	std::vector<double> historical;
	std::vector<ForecastPoint> forecast;
	ForecastSummary summary;
};

struct ColumnForecast {
	std::string column;
	ForecastSummary summary;
	models::ModelInfo model_info;
	std::vector<ForecastPoint> forecast;
};

struct MultiForecastResult {
	int periods = 0;
	std::vector<ColumnForecast> forecasts;

	std::size_t columnsProcessed() const {
		return forecasts.size();
	}
};

/**
 * @brief Either a value or a structured failure, never both.
 */
template <typename T>
struct Outcome {
	std::optional<T> value;
	std::optional<core::ForecastFailure> failure;

	bool success() const {
		return value.has_value();
	}

	static Outcome ok(T result) {
		Outcome outcome;
		outcome.value = std::move(result);
		return outcome;
	}

	static Outcome fail(core::ErrorKind kind, std::string message) {
		Outcome outcome;
		outcome.failure = core::ForecastFailure{kind, std::move(message)};
		return outcome;
	}
};

using ForecastOutcome = Outcome<ForecastResult>;
using MultiForecastOutcome = Outcome<MultiForecastResult>;

/**
 * @class ForecastEngine
 * @brief Runs the forecasting pipeline over tabular input.
 *
 * extract -> detect seasonality -> select method -> fit and predict ->
 * backtest -> summarise. The engine keeps no state between calls and reports
 * every problem as a failed Outcome instead of throwing.
 */
class ForecastEngine {
public:
	/**
	 * @throws std::invalid_argument If the configuration is invalid.
	 */
	explicit ForecastEngine(EngineConfig config = {});

	/// Forecasts a single column.
	ForecastOutcome forecast(const ForecastRequest &request) const;

	/**
	 * @brief Forecasts up to max_columns columns with automatic method selection.
	 *
	 * Columns that cannot be forecast are left out; the call fails only when
	 * none succeeds.
	 */
	MultiForecastOutcome forecastColumns(const MultiForecastRequest &request) const;

	const EngineConfig &config() const {
		return config_;
	}

private:
	ForecastResult run(const core::Table &table, const std::string &column, int periods,
	                   selectors::Method requested) const;
	std::unique_ptr<models::IForecaster>
	makeForecaster(selectors::Method method, const std::optional<seasonality::SeasonalityProfile> &profile) const;
	int resolvePeriods(const std::optional<int> &periods) const;

	EngineConfig config_;
	data::SeriesExtractor extractor_;
	seasonality::SeasonalityDetector detector_;
	selectors::MethodSelector selector_;
};

} // namespace tabcast::engine
