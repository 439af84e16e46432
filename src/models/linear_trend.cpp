#include "tabcast/models/linear_trend.hpp"
#include "tabcast/utils/metrics.hpp"

#include <Eigen/Dense>

#include <cmath>
#include <stdexcept>

namespace tabcast::models {

double LinearTrendFit::predictionStdErr(double x) const {
	if (n == 0 || sxx <= 0.0) {
		return 0.0;
	}
	const double dx = x - x_mean;
	return slope_std_err * std::sqrt(1.0 + 1.0 / static_cast<double>(n) + dx * dx / sxx);
}

LinearTrendFit fitLinearTrend(const std::vector<double> &values) {
	if (values.size() < 2) {
		throw std::invalid_argument("Linear trend requires at least 2 data points.");
	}

	const Eigen::Index n = static_cast<Eigen::Index>(values.size());
	Eigen::MatrixXd design(n, 2);
	design.col(0).setOnes();
	design.col(1) = Eigen::VectorXd::LinSpaced(n, 0.0, static_cast<double>(n - 1));

	const Eigen::Map<const Eigen::VectorXd> y(values.data(), n);
	const Eigen::VectorXd beta = design.colPivHouseholderQr().solve(y);
	const Eigen::VectorXd fitted = design * beta;
	const double sse = (y - fitted).squaredNorm();

	LinearTrendFit fit;
	fit.n = values.size();
	fit.intercept = beta[0];
	fit.slope = beta[1];
	fit.x_mean = static_cast<double>(n - 1) / 2.0;
	fit.sxx = (design.col(1).array() - fit.x_mean).square().sum();
	fit.slope_std_err = n > 2 ? std::sqrt(sse / static_cast<double>(n - 2) / fit.sxx) : 0.0;

	const std::vector<double> fitted_values(fitted.data(), fitted.data() + n);
	fit.r_squared = utils::Metrics::r2(values, fitted_values).value_or(0.0);
	return fit;
}

// --- Model Implementation ---

LinearTrendForecaster::LinearTrendForecaster(double z) : z_(z) {
	if (z_ <= 0.0) {
		throw std::invalid_argument("Interval quantile must be positive.");
	}
}

void LinearTrendForecaster::fit(const core::TimeSeries &ts) {
	fit_ = fitLinearTrend(ts.getValues());
	is_fitted_ = true;
	TABCAST_INFO("Linear trend fitted with {} data points. Slope = {}, intercept = {}, R2 = {}.", fit_.n,
	             fit_.slope, fit_.intercept, fit_.r_squared);
}

core::Forecast LinearTrendForecaster::predict(int horizon) {
	if (!is_fitted_) {
		throw std::runtime_error("Predict called before fit.");
	}
	if (horizon < 0) {
		throw std::invalid_argument("Forecast horizon must be non-negative.");
	}

	core::Forecast forecast;
	forecast.point.reserve(horizon);
	for (int i = 0; i < horizon; ++i) {
		const double x = static_cast<double>(fit_.n + static_cast<std::size_t>(i));
		forecast.push(fit_.valueAt(x), z_ * fit_.predictionStdErr(x));
	}
	return forecast;
}

ModelInfo LinearTrendForecaster::modelInfo() const {
	if (!is_fitted_) {
		throw std::runtime_error("Model info requested before fit.");
	}
	ModelInfo info;
	info.method = "linear_regression";
	info.set("slope", fit_.slope);
	info.set("intercept", fit_.intercept);
	info.set("r_squared", fit_.r_squared);
	return info;
}

// --- Builder Implementation ---

LinearTrendForecasterBuilder &LinearTrendForecasterBuilder::withZ(double z) {
	z_ = z;
	return *this;
}

std::unique_ptr<LinearTrendForecaster> LinearTrendForecasterBuilder::build() {
	TABCAST_DEBUG("Building linear trend model with z = {}.", z_);
	return std::unique_ptr<LinearTrendForecaster>(new LinearTrendForecaster(z_));
}

} // namespace tabcast::models
