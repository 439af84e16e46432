#include "tabcast/data/series_extractor.hpp"
#include "tabcast/core/errors.hpp"
#include "tabcast/utils/logging.hpp"

#include <cmath>
#include <vector>

namespace tabcast::data {

SeriesExtractor::SeriesExtractor(std::size_t min_points) : min_points_(min_points) {}

core::TimeSeries SeriesExtractor::extract(const core::Table &table, const std::string &column) const {
	if (!table.hasColumn(column)) {
		throw core::ForecastError(core::ErrorKind::ColumnNotFound, "Column '" + column + "' not found");
	}

	const auto cells = table.column(column);
	std::vector<double> values;
	values.reserve(cells.size());
	for (const auto &cell : cells) {
		const auto numeric = core::toNumeric(cell);
		if (numeric && std::isfinite(*numeric)) {
			values.push_back(*numeric);
		}
	}

	if (values.size() < cells.size()) {
		TABCAST_DEBUG("Column '{}': dropped {} of {} cells as missing or non-numeric.", column,
		              cells.size() - values.size(), cells.size());
	}

	if (values.size() < min_points_) {
		throw core::ForecastError(core::ErrorKind::InsufficientData,
		                          "Need at least " + std::to_string(min_points_) +
		                              " data points for forecasting, column '" + column + "' has " +
		                              std::to_string(values.size()));
	}

	return core::TimeSeries(std::move(values), column);
}

} // namespace tabcast::data
