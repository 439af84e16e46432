#pragma once

#include <cstddef>
#include <cstdint>

namespace tabcast::engine {

/**
 * @struct EngineConfig
 * @brief Tunable constants of the forecasting pipeline.
 *
 * The defaults reproduce the service behaviour; a default-constructed config
 * is always valid.
 */
struct EngineConfig {
	/// Minimum number of numeric values a column needs to be forecast.
	std::size_t min_points = 10;
	/// Horizon used when a request does not name one.
	int default_periods = 10;

	/// Seasonality is only searched in series at least this long.
	std::size_t seasonality_min_points = 21;
	double acf_threshold = 0.3;
	std::uint32_t min_lag = 2;

	/// Auto selection picks linear when |trend| exceeds this fraction of the std deviation.
	double trend_strength_ratio = 0.1;

	double ema_alpha = 0.3;
	std::size_t recent_trend_window = 5;
	double ema_interval_scale = 0.5;

	/// Normal quantile of the 95% interval.
	double z = 1.96;

	std::size_t holdout = 5;
	std::size_t max_columns = 5;

	/// Change (in percent) beyond which the trend is reported as increasing or decreasing.
	double stable_band_pct = 2.0;

	/// Decimal places of every reported number.
	int decimals = 4;
};

/**
 * @brief Checks a configuration for consistency.
 * @throws std::invalid_argument Naming the first offending field.
 */
void validateConfig(const EngineConfig &config);

/**
 * @class EngineConfigBuilder
 * @brief A builder for fluently configuring an EngineConfig.
 */
class EngineConfigBuilder {
public:
	EngineConfigBuilder &withMinPoints(std::size_t value);
	EngineConfigBuilder &withDefaultPeriods(int value);
	EngineConfigBuilder &withSeasonalityMinPoints(std::size_t value);
	EngineConfigBuilder &withAcfThreshold(double value);
	EngineConfigBuilder &withMinLag(std::uint32_t value);
	EngineConfigBuilder &withTrendStrengthRatio(double value);
	EngineConfigBuilder &withEmaAlpha(double value);
	EngineConfigBuilder &withRecentTrendWindow(std::size_t value);
	EngineConfigBuilder &withEmaIntervalScale(double value);
	EngineConfigBuilder &withZ(double value);
	EngineConfigBuilder &withHoldout(std::size_t value);
	EngineConfigBuilder &withMaxColumns(std::size_t value);
	EngineConfigBuilder &withStableBandPct(double value);
	EngineConfigBuilder &withDecimals(int value);

	/**
	 * @brief Validates and returns the configuration.
	 * @throws std::invalid_argument If any setting is out of range.
	 */
	EngineConfig build() const;

private:
	EngineConfig config_;
};

} // namespace tabcast::engine
