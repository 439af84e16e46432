#pragma once

#include <cmath>
#include <cstddef>
#include <limits>
#include <optional>
#include <stdexcept>
#include <vector>

namespace tabcast::utils {

struct AccuracyMetrics {
	double mse = std::numeric_limits<double>::quiet_NaN();
	double rmse = std::numeric_limits<double>::quiet_NaN();
	std::optional<double> mape;
	std::size_t n = 0;
};

class Metrics final {
public:
	static double mse(const std::vector<double> &actual, const std::vector<double> &predicted);
	static double rmse(const std::vector<double> &actual, const std::vector<double> &predicted);

	/**
	 * @brief Mean absolute percentage error in percent.
	 *
	 * Terms whose actual value is exactly zero are left out of the average;
	 * returns std::nullopt when every actual value is zero.
	 */
	static std::optional<double> mape(const std::vector<double> &actual, const std::vector<double> &predicted);

	/// Coefficient of determination; std::nullopt when the actuals have no variance.
	static std::optional<double> r2(const std::vector<double> &actual, const std::vector<double> &predicted);
};

} // namespace tabcast::utils
