#pragma once

#include "tabcast/models/iforecaster.hpp"

#include <string>

namespace tabcast::models {

/**
 * @brief Naive forecasting method (random walk)
 *
 * All future values are predicted to be equal to the last observed value.
 * Used as the carry-forward baseline when backtesting non-linear methods.
 * The forecast carries no interval.
 */
class Naive final : public IForecaster {
public:
	Naive() = default;

	void fit(const core::TimeSeries &ts) override;
	core::Forecast predict(int horizon) override;
	ModelInfo modelInfo() const override;

	std::string getName() const override {
		return "Naive";
	}

	double lastValue() const {
		return last_value_;
	}

private:
	double last_value_ = 0.0;
	bool is_fitted_ = false;
};

} // namespace tabcast::models
