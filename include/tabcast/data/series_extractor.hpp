#pragma once

#include "tabcast/core/table.hpp"
#include "tabcast/core/time_series.hpp"

#include <cstddef>
#include <string>

namespace tabcast::data {

/**
 * @class SeriesExtractor
 * @brief Pulls one named column out of a Table as a numeric TimeSeries.
 *
 * Cells are coerced with core::toNumeric; missing, unparsable and non-finite
 * entries are discarded and the survivors keep their row order.
 */
class SeriesExtractor {
public:
	explicit SeriesExtractor(std::size_t min_points = 10);

	/**
	 * @brief Extracts and validates a column.
	 * @throws core::ForecastError ColumnNotFound if no row carries the column,
	 *         InsufficientData if fewer than min_points numeric values remain.
	 */
	core::TimeSeries extract(const core::Table &table, const std::string &column) const;

	std::size_t minPoints() const {
		return min_points_;
	}

private:
	std::size_t min_points_;
};

} // namespace tabcast::data
