#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace tabcast::core {

/**
 * @brief A single cell of tabular input.
 *
 * Cells arrive untyped from the request layer: a missing/null entry, a number,
 * free text or a boolean flag.
 */
using Cell = std::variant<std::monostate, double, std::string, bool>;

/**
 * @class Table
 * @brief Row-oriented tabular data as received from a request.
 *
 * Rows may carry different key sets; a column exists when at least one row
 * carries it.
 */
class Table {
public:
	using Row = std::unordered_map<std::string, Cell>;

	Table() = default;
	explicit Table(std::vector<Row> rows) : rows_(std::move(rows)) {}

	void addRow(Row row) {
		rows_.push_back(std::move(row));
	}

	const std::vector<Row> &rows() const {
		return rows_;
	}

	std::size_t rowCount() const {
		return rows_.size();
	}

	bool empty() const {
		return rows_.empty();
	}

	bool hasColumn(const std::string &name) const;

	/**
	 * @brief Returns the cells of a column in row order.
	 *
	 * Rows that do not carry the column contribute a null cell so that the
	 * result always has rowCount() entries.
	 * @throws std::out_of_range If no row carries the column.
	 */
	std::vector<Cell> column(const std::string &name) const;

private:
	std::vector<Row> rows_;
};

/**
 * @brief Coerces a cell to a number.
 *
 * Numbers pass through, booleans map to 1/0 and text is parsed as a decimal or
 * scientific literal after trimming whitespace. Null and unparsable cells yield
 * std::nullopt. Non-finite values are returned as parsed; callers decide
 * whether to keep them.
 */
std::optional<double> toNumeric(const Cell &cell);

} // namespace tabcast::core
