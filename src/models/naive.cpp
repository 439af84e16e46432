#include "tabcast/models/naive.hpp"
#include "tabcast/utils/logging.hpp"

#include <stdexcept>
#include <vector>

namespace tabcast::models {

void Naive::fit(const core::TimeSeries &ts) {
	if (ts.empty()) {
		throw std::invalid_argument("Cannot fit Naive on empty time series");
	}

	last_value_ = ts.back();
	is_fitted_ = true;

	TABCAST_DEBUG("Naive model fitted with {} data points, last value = {:.4f}", ts.size(), last_value_);
}

core::Forecast Naive::predict(int horizon) {
	if (!is_fitted_) {
		throw std::runtime_error("Naive::predict called before fit");
	}
	if (horizon < 0) {
		throw std::invalid_argument("Forecast horizon must be non-negative.");
	}

	core::Forecast result;
	result.point.assign(static_cast<std::size_t>(horizon), last_value_);
	return result;
}

ModelInfo Naive::modelInfo() const {
	if (!is_fitted_) {
		throw std::runtime_error("Model info requested before fit.");
	}
	ModelInfo info;
	info.method = "naive";
	info.set("last_value", last_value_);
	return info;
}

} // namespace tabcast::models
