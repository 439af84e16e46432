#include "tabcast/utils/descriptive.hpp"

#include <cmath>
#include <numeric>
#include <stdexcept>

namespace tabcast::utils {

double mean(const std::vector<double> &data) {
	if (data.empty()) {
		throw std::invalid_argument("Cannot compute mean of empty data.");
	}
	return std::accumulate(data.begin(), data.end(), 0.0) / static_cast<double>(data.size());
}

double populationStdDev(const std::vector<double> &data) {
	const double mu = mean(data);
	double sum_sq = 0.0;
	for (const double value : data) {
		const double diff = value - mu;
		sum_sq += diff * diff;
	}
	return std::sqrt(sum_sq / static_cast<double>(data.size()));
}

double trendPerStep(const std::vector<double> &data) {
	if (data.size() < 2) {
		return 0.0;
	}
	return (data.back() - data.front()) / static_cast<double>(data.size());
}

double roundTo(double value, int decimals) {
	if (!std::isfinite(value)) {
		return value;
	}
	const double scale = std::pow(10.0, decimals);
	// Values this large are already integral at the requested precision
	const double scaled = std::abs(value) * scale;
	if (!std::isfinite(scaled) || scaled >= 4503599627370496.0) {
		return value;
	}
	const double rounded = std::round(value * scale) / scale;
	// Avoid emitting "-0.0"
	return rounded == 0.0 ? 0.0 : rounded;
}

} // namespace tabcast::utils
