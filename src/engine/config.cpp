#include "tabcast/engine/config.hpp"
#include "tabcast/utils/logging.hpp"

#include <stdexcept>

namespace tabcast::engine {

void validateConfig(const EngineConfig &config) {
	if (config.min_points < 2) {
		throw std::invalid_argument("min_points must be at least 2.");
	}
	if (config.default_periods < 1) {
		throw std::invalid_argument("default_periods must be positive.");
	}
	if (config.acf_threshold <= 0.0 || config.acf_threshold >= 1.0) {
		throw std::invalid_argument("acf_threshold must be between 0 and 1.");
	}
	if (config.min_lag < 2) {
		throw std::invalid_argument("min_lag must be at least 2.");
	}
	if (config.trend_strength_ratio < 0.0) {
		throw std::invalid_argument("trend_strength_ratio must be non-negative.");
	}
	if (config.ema_alpha <= 0.0 || config.ema_alpha > 1.0) {
		throw std::invalid_argument("ema_alpha must be in (0, 1].");
	}
	if (config.recent_trend_window == 0) {
		throw std::invalid_argument("recent_trend_window must be positive.");
	}
	if (config.ema_interval_scale < 0.0) {
		throw std::invalid_argument("ema_interval_scale must be non-negative.");
	}
	if (config.z <= 0.0) {
		throw std::invalid_argument("z must be positive.");
	}
	if (config.holdout == 0) {
		throw std::invalid_argument("holdout must be positive.");
	}
	if (config.max_columns == 0) {
		throw std::invalid_argument("max_columns must be positive.");
	}
	if (config.stable_band_pct < 0.0) {
		throw std::invalid_argument("stable_band_pct must be non-negative.");
	}
	if (config.decimals < 0 || config.decimals > 12) {
		throw std::invalid_argument("decimals must be between 0 and 12.");
	}
}

EngineConfigBuilder &EngineConfigBuilder::withMinPoints(std::size_t value) {
	config_.min_points = value;
	return *this;
}

EngineConfigBuilder &EngineConfigBuilder::withDefaultPeriods(int value) {
	config_.default_periods = value;
	return *this;
}

EngineConfigBuilder &EngineConfigBuilder::withSeasonalityMinPoints(std::size_t value) {
	config_.seasonality_min_points = value;
	return *this;
}

EngineConfigBuilder &EngineConfigBuilder::withAcfThreshold(double value) {
	config_.acf_threshold = value;
	return *this;
}

EngineConfigBuilder &EngineConfigBuilder::withMinLag(std::uint32_t value) {
	config_.min_lag = value;
	return *this;
}

EngineConfigBuilder &EngineConfigBuilder::withTrendStrengthRatio(double value) {
	config_.trend_strength_ratio = value;
	return *this;
}

EngineConfigBuilder &EngineConfigBuilder::withEmaAlpha(double value) {
	config_.ema_alpha = value;
	return *this;
}

EngineConfigBuilder &EngineConfigBuilder::withRecentTrendWindow(std::size_t value) {
	config_.recent_trend_window = value;
	return *this;
}

EngineConfigBuilder &EngineConfigBuilder::withEmaIntervalScale(double value) {
	config_.ema_interval_scale = value;
	return *this;
}

EngineConfigBuilder &EngineConfigBuilder::withZ(double value) {
	config_.z = value;
	return *this;
}

EngineConfigBuilder &EngineConfigBuilder::withHoldout(std::size_t value) {
	config_.holdout = value;
	return *this;
}

EngineConfigBuilder &EngineConfigBuilder::withMaxColumns(std::size_t value) {
	config_.max_columns = value;
	return *this;
}

EngineConfigBuilder &EngineConfigBuilder::withStableBandPct(double value) {
	config_.stable_band_pct = value;
	return *this;
}

EngineConfigBuilder &EngineConfigBuilder::withDecimals(int value) {
	config_.decimals = value;
	return *this;
}

EngineConfig EngineConfigBuilder::build() const {
	validateConfig(config_);
	TABCAST_DEBUG("Engine config built: min_points = {}, holdout = {}, max_columns = {}.", config_.min_points,
	              config_.holdout, config_.max_columns);
	return config_;
}

} // namespace tabcast::engine
