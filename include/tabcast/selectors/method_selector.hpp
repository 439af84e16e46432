#pragma once

#include <string>

namespace tabcast::selectors {

enum class Method {
	Auto,
	Linear,
	Seasonal,
	MovingAverage
};

/**
 * @brief Parses a request method string ("auto", "linear", "seasonal", "moving_average").
 * @throws std::invalid_argument For any other string.
 */
Method parseMethod(const std::string &name);

/// Request-level name of a method, the inverse of parseMethod().
std::string methodName(Method method);

/**
 * @struct SelectionInputs
 * @brief Series characteristics the selector decides on.
 */
struct SelectionInputs {
	bool has_seasonality = false;
	/// (last - first) / n of the history.
	double trend = 0.0;
	/// Population standard deviation of the history.
	double std_dev = 0.0;
};

/**
 * @class MethodSelector
 * @brief Chooses the forecasting strategy for a series.
 *
 * An explicit method is honoured. "auto" picks seasonal when a period was
 * detected, linear when the per-step trend exceeds trend_ratio times the
 * standard deviation, and moving average otherwise. Seasonal without a
 * detected period falls back to moving average. Never returns Method::Auto.
 */
class MethodSelector {
public:
	explicit MethodSelector(double trend_ratio = 0.1);

	Method select(Method requested, const SelectionInputs &inputs) const;

private:
	double trend_ratio_;
};

} // namespace tabcast::selectors
