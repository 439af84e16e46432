#include "tabcast/selectors/method_selector.hpp"
#include "tabcast/utils/logging.hpp"

#include <cmath>
#include <stdexcept>

namespace tabcast::selectors {

Method parseMethod(const std::string &name) {
	if (name == "auto") {
		return Method::Auto;
	}
	if (name == "linear") {
		return Method::Linear;
	}
	if (name == "seasonal") {
		return Method::Seasonal;
	}
	if (name == "moving_average") {
		return Method::MovingAverage;
	}
	throw std::invalid_argument("Unknown forecasting method '" + name +
	                            "'; expected auto, linear, seasonal or moving_average.");
}

std::string methodName(Method method) {
	switch (method) {
	case Method::Auto:
		return "auto";
	case Method::Linear:
		return "linear";
	case Method::Seasonal:
		return "seasonal";
	case Method::MovingAverage:
		return "moving_average";
	}
	return "auto";
}

MethodSelector::MethodSelector(double trend_ratio) : trend_ratio_(trend_ratio) {
	if (trend_ratio_ < 0.0) {
		throw std::invalid_argument("Trend ratio must be non-negative.");
	}
}

Method MethodSelector::select(Method requested, const SelectionInputs &inputs) const {
	Method method = requested;
	if (method == Method::Auto) {
		if (inputs.has_seasonality) {
			method = Method::Seasonal;
		} else if (std::abs(inputs.trend) > inputs.std_dev * trend_ratio_) {
			method = Method::Linear;
		} else {
			method = Method::MovingAverage;
		}
	}

	if (method == Method::Seasonal && !inputs.has_seasonality) {
		TABCAST_DEBUG("Seasonal method requested without detected seasonality, using moving average.");
		method = Method::MovingAverage;
	}
	return method;
}

} // namespace tabcast::selectors
