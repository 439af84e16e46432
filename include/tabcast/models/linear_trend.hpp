#pragma once

#include "tabcast/models/iforecaster.hpp"
#include "tabcast/utils/logging.hpp"

#include <cstddef>
#include <memory>
#include <vector>

namespace tabcast::models {

/**
 * @struct LinearTrendFit
 * @brief Ordinary least squares fit of value against position index 0..n-1.
 */
struct LinearTrendFit {
	double slope = 0.0;
	double intercept = 0.0;
	double r_squared = 0.0;
	/// Standard error of the slope estimate, sqrt(SSE / (n - 2)) / sqrt(Sxx).
	double slope_std_err = 0.0;
	double x_mean = 0.0;
	/// Sum of squared deviations of the index from its mean.
	double sxx = 0.0;
	std::size_t n = 0;

	double valueAt(double x) const {
		return intercept + slope * x;
	}

	/// Standard error of a new observation at index @p x.
	double predictionStdErr(double x) const;
};

/**
 * @brief Fits a straight line to @p values by least squares.
 * @throws std::invalid_argument If fewer than two values are given.
 */
LinearTrendFit fitLinearTrend(const std::vector<double> &values);

class LinearTrendForecasterBuilder;

/**
 * @class LinearTrendForecaster
 * @brief Extrapolates the OLS trend line with a prediction interval that widens
 *        with distance from the centre of the fitted range.
 */
class LinearTrendForecaster final : public IForecaster {
public:
	friend class LinearTrendForecasterBuilder;

	void fit(const core::TimeSeries &ts) override;
	core::Forecast predict(int horizon) override;
	ModelInfo modelInfo() const override;
	std::string getName() const override {
		return "LinearTrend";
	}

	const LinearTrendFit &fitted() const {
		return fit_;
	}

private:
	explicit LinearTrendForecaster(double z);

	double z_;
	LinearTrendFit fit_;
	bool is_fitted_ = false;
};

/**
 * @class LinearTrendForecasterBuilder
 * @brief A builder for fluently configuring and creating LinearTrendForecaster models.
 */
class LinearTrendForecasterBuilder {
public:
	/**
	 * @brief Sets the normal quantile used for the interval half-width.
	 * @param z A positive quantile (1.96 for 95%).
	 */
	LinearTrendForecasterBuilder &withZ(double z);

	std::unique_ptr<LinearTrendForecaster> build();

private:
	double z_ = 1.96;
};

} // namespace tabcast::models
