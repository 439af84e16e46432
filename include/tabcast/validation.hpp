#pragma once

#include "tabcast/core/time_series.hpp"
#include "tabcast/selectors/method_selector.hpp"
#include "tabcast/utils/metrics.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace tabcast::validation {

utils::AccuracyMetrics accuracyMetrics(const std::vector<double> &actual, const std::vector<double> &predicted);

struct SplitResult {
	core::TimeSeries train;
	core::TimeSeries test;
};

/**
 * @brief Splits off the last @p holdout observations.
 * @throws std::invalid_argument If the series is not longer than the holdout.
 */
SplitResult holdoutSplit(const core::TimeSeries &series, std::size_t holdout);

/**
 * @brief Holdout backtest of the production method.
 *
 * The final @p holdout points are re-forecast from the preceding ones. The
 * linear method re-fits its trend line on the training part; every other
 * method is approximated by carrying the last training value forward.
 * Returns std::nullopt when the series is not longer than the holdout.
 */
std::optional<utils::AccuracyMetrics> holdoutBacktest(const core::TimeSeries &series, selectors::Method method,
                                                      std::size_t holdout = 5);

} // namespace tabcast::validation
