#pragma once

#include "tabcast/core/forecast.hpp"
#include "tabcast/core/time_series.hpp"

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace tabcast::models {

/**
 * @struct ModelInfo
 * @brief Name and fitted parameters of a model, in reporting order.
 */
struct ModelInfo {
	using Value = std::variant<std::int64_t, double>;

	std::string method;
	std::vector<std::pair<std::string, Value>> params;

	/// Sets a parameter, replacing an existing entry with the same key.
	void set(const std::string &key, Value value) {
		for (auto &entry : params) {
			if (entry.first == key) {
				entry.second = value;
				return;
			}
		}
		params.emplace_back(key, value);
	}

	std::optional<Value> get(const std::string &key) const {
		for (const auto &entry : params) {
			if (entry.first == key) {
				return entry.second;
			}
		}
		return std::nullopt;
	}

	/// Numeric view of a parameter; throws std::out_of_range when absent.
	double number(const std::string &key) const {
		const auto value = get(key);
		if (!value) {
			throw std::out_of_range("Model parameter '" + key + "' not available.");
		}
		return std::visit([](auto v) { return static_cast<double>(v); }, *value);
	}
};

/**
 * @class IForecaster
 * @brief An interface for all forecasting strategies.
 *
 * Strategies are fitted on a univariate TimeSeries and then project a number
 * of steps beyond its last index, attaching a prediction interval to each
 * step.
 */
class IForecaster {
public:
	virtual ~IForecaster() = default;

	/**
	 * @brief Fits the model to the provided time series data.
	 * @param ts The time series data to train the model on.
	 */
	virtual void fit(const core::TimeSeries &ts) = 0;

	/**
	 * @brief Generates forecasts for a specified number of steps into the future.
	 * @param horizon The number of future time steps to predict.
	 * @return A Forecast object containing point predictions and intervals.
	 */
	virtual core::Forecast predict(int horizon) = 0;

	/**
	 * @brief Describes the fitted model.
	 * @throws std::runtime_error If called before fit.
	 */
	virtual ModelInfo modelInfo() const = 0;

	/**
	 * @brief Gets the name of the forecasting model.
	 * @return A string representing the model's name (e.g., "LinearTrend").
	 */
	virtual std::string getName() const = 0;
};

} // namespace tabcast::models
