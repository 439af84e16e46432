#include "tabcast/seasonality/detector.hpp"
#include "tabcast/utils/logging.hpp"

#include <algorithm>
#include <numeric>
#include <stdexcept>

namespace tabcast::seasonality {

SeasonalityProfile SeasonalityProfile::fromSeries(const std::vector<double> &data, std::uint32_t period) {
	if (period < 2) {
		throw std::invalid_argument("Seasonal period must be at least 2.");
	}
	if (data.size() < period) {
		throw std::invalid_argument("Series must cover at least one full seasonal period.");
	}

	const double mean = std::accumulate(data.begin(), data.end(), 0.0) / static_cast<double>(data.size());

	SeasonalityProfile profile;
	profile.period = period;
	profile.seasonal_component.reserve(period);
	for (std::uint32_t phase = 0; phase < period; ++phase) {
		double sum = 0.0;
		std::size_t count = 0;
		for (std::size_t i = phase; i < data.size(); i += period) {
			sum += data[i];
			++count;
		}
		profile.seasonal_component.push_back(sum / static_cast<double>(count) - mean);
	}
	return profile;
}

SeasonalityDetector::SeasonalityDetector(std::uint32_t min_lag, double threshold, std::size_t min_length)
    : min_lag_(min_lag), threshold_(threshold), min_length_(min_length) {}

SeasonalityDetector::Builder &SeasonalityDetector::Builder::minLag(std::uint32_t value) {
	min_lag_ = value;
	return *this;
}

SeasonalityDetector::Builder &SeasonalityDetector::Builder::threshold(double value) {
	threshold_ = value;
	return *this;
}

SeasonalityDetector::Builder &SeasonalityDetector::Builder::minLength(std::size_t value) {
	min_length_ = value;
	return *this;
}

SeasonalityDetector SeasonalityDetector::Builder::build() const {
	if (min_lag_ < 2) {
		throw std::invalid_argument("Minimum lag must be at least 2.");
	}
	if (threshold_ <= 0.0 || threshold_ >= 1.0) {
		throw std::invalid_argument("Autocorrelation threshold must be between 0 and 1.");
	}
	return SeasonalityDetector(min_lag_, threshold_, min_length_);
}

SeasonalityDetector::Builder SeasonalityDetector::builder() {
	return Builder();
}

Eigen::VectorXd SeasonalityDetector::autocorrelation(const std::vector<double> &data, std::size_t max_lag) const {
	const Eigen::Index n = static_cast<Eigen::Index>(data.size());
	if (n == 0) {
		return Eigen::VectorXd();
	}
	const Eigen::Index lags = std::min<Eigen::Index>(static_cast<Eigen::Index>(max_lag), n - 1) + 1;
	Eigen::VectorXd acf = Eigen::VectorXd::Zero(lags);

	const Eigen::Map<const Eigen::VectorXd> values(data.data(), n);
	const Eigen::VectorXd centered = (values.array() - values.mean()).matrix();
	const double energy = centered.squaredNorm();
	if (energy <= 0.0) {
		return acf;
	}

	for (Eigen::Index lag = 0; lag < lags; ++lag) {
		acf[lag] = centered.tail(n - lag).dot(centered.head(n - lag)) / energy;
	}
	return acf;
}

std::optional<std::uint32_t> SeasonalityDetector::detectPeriod(const std::vector<double> &data) const {
	const std::size_t n = data.size();
	if (n < min_length_) {
		TABCAST_DEBUG("Seasonality detection skipped: data length {} < {}", n, min_length_);
		return std::nullopt;
	}

	// The scan reads acf[lag + 1] for lag < min(n - 1, n / 2)
	const std::size_t upper = std::min<std::size_t>(n - 1, n / 2);
	const Eigen::VectorXd acf = autocorrelation(data, upper);
	if (acf.size() == 0 || acf[0] == 0.0) {
		TABCAST_WARN("Seasonality detection skipped: series has zero variance.");
		return std::nullopt;
	}

	for (std::size_t lag = min_lag_; lag < upper; ++lag) {
		const double value = acf[static_cast<Eigen::Index>(lag)];
		const double prev = acf[static_cast<Eigen::Index>(lag - 1)];
		const double next = acf[static_cast<Eigen::Index>(lag + 1)];
		if (value > prev && value > next && value > threshold_) {
			TABCAST_DEBUG("Seasonality detected at lag {} (acf = {:.4f}).", lag, value);
			return static_cast<std::uint32_t>(lag);
		}
	}
	return std::nullopt;
}

std::optional<SeasonalityProfile> SeasonalityDetector::detect(const std::vector<double> &data) const {
	const auto period = detectPeriod(data);
	if (!period) {
		return std::nullopt;
	}
	return SeasonalityProfile::fromSeries(data, *period);
}

} // namespace tabcast::seasonality
