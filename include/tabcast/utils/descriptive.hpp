#pragma once

#include <vector>

namespace tabcast::utils {

/// Arithmetic mean. Throws std::invalid_argument on empty input.
double mean(const std::vector<double> &data);

/// Population standard deviation (divides by n). Throws std::invalid_argument on empty input.
double populationStdDev(const std::vector<double> &data);

/**
 * @brief Average change per observation, (last - first) / n.
 *
 * Used as the trend-strength signal for method selection; 0 for fewer than two
 * observations.
 */
double trendPerStep(const std::vector<double> &data);

/// Rounds half away from zero to @p decimals places. Non-finite and very large values pass through unchanged.
double roundTo(double value, int decimals);

} // namespace tabcast::utils
