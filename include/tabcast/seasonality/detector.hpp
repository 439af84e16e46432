#pragma once

#include <Eigen/Dense>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace tabcast::seasonality {

/**
 * @struct SeasonalityProfile
 * @brief A detected period and the average offset from the series mean at each phase.
 */
struct SeasonalityProfile {
	std::uint32_t period = 0;
	std::vector<double> seasonal_component;

	/// Seasonal offset for an absolute series position.
	double offsetAt(std::size_t index) const {
		return seasonal_component[index % period];
	}

	/**
	 * @brief Builds the profile of @p data for a known period.
	 *
	 * The component for phase p is the mean of all values at positions
	 * congruent to p modulo the period, minus the global mean.
	 * @throws std::invalid_argument If period < 2 or the data is shorter than one period.
	 */
	static SeasonalityProfile fromSeries(const std::vector<double> &data, std::uint32_t period);
};

/**
 * @class SeasonalityDetector
 * @brief Finds a dominant periodic lag from the autocorrelation function.
 *
 * The first lag, in ascending order, that is a strict local maximum of the
 * autocorrelation and exceeds the threshold is reported. Later lags are not
 * considered even when their autocorrelation is higher.
 */
class SeasonalityDetector {
public:
	class Builder {
	public:
		Builder &minLag(std::uint32_t value);
		Builder &threshold(double value);
		Builder &minLength(std::size_t value);
		SeasonalityDetector build() const;

	private:
		std::uint32_t min_lag_ = 2;
		double threshold_ = 0.3;
		std::size_t min_length_ = 21;
	};

	static Builder builder();

	/**
	 * @brief Autocorrelation of the mean-centered series for lags 0..max_lag.
	 *
	 * Normalised so that lag 0 equals 1. @p max_lag is capped at n-1. A series
	 * without variance yields all zeros.
	 */
	Eigen::VectorXd autocorrelation(const std::vector<double> &data, std::size_t max_lag) const;

	/// First qualifying lag, or std::nullopt for short, flat or aperiodic data.
	std::optional<std::uint32_t> detectPeriod(const std::vector<double> &data) const;

	/// detectPeriod() followed by SeasonalityProfile::fromSeries().
	std::optional<SeasonalityProfile> detect(const std::vector<double> &data) const;

private:
	SeasonalityDetector(std::uint32_t min_lag, double threshold, std::size_t min_length);

	std::uint32_t min_lag_;
	double threshold_;
	std::size_t min_length_;
};

} // namespace tabcast::seasonality
