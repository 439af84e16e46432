#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <vector>

namespace tabcast::core {

/**
 * @struct Forecast
 * @brief Holds the results of a forecasting operation.
 *
 * Point predictions are always present; the lower and upper bounds of the
 * prediction interval are present once a model has attached them.
 */
struct Forecast {
	using Value = double;
	using Series = std::vector<Value>;

	/// Point forecasts, one per horizon step.
	Series point;

	/// Optional lower bounds of the prediction intervals.
	std::optional<Series> lower;

	/// Optional upper bounds of the prediction intervals.
	std::optional<Series> upper;

	bool empty() const {
		return point.empty();
	}

	/// Returns the forecast horizon (number of steps).
	std::size_t horizon() const {
		return point.size();
	}

	bool hasIntervals() const {
		return lower.has_value() && upper.has_value();
	}

	/// Mutable access to the lower interval, creating it when needed.
	Series &lowerSeries() {
		if (!lower.has_value()) {
			lower.emplace();
		}
		return *lower;
	}

	/// Mutable access to the upper interval, creating it when needed.
	Series &upperSeries() {
		if (!upper.has_value()) {
			upper.emplace();
		}
		return *upper;
	}

	const Series &lowerSeries() const {
		if (!lower.has_value()) {
			throw std::out_of_range("Lower interval not available.");
		}
		return *lower;
	}

	const Series &upperSeries() const {
		if (!upper.has_value()) {
			throw std::out_of_range("Upper interval not available.");
		}
		return *upper;
	}

	/// Appends one step with a symmetric interval of the given half-width.
	void push(Value estimate, Value half_width) {
		point.push_back(estimate);
		lowerSeries().push_back(estimate - half_width);
		upperSeries().push_back(estimate + half_width);
	}
};

} // namespace tabcast::core
