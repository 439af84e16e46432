#include "tabcast/core/table.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <stdexcept>

namespace tabcast::core {

namespace {

std::string trim(const std::string &text) {
	std::size_t begin = 0;
	std::size_t end = text.size();
	while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
		++begin;
	}
	while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
		--end;
	}
	return text.substr(begin, end - begin);
}

std::optional<double> parseNumber(const std::string &text) {
	const std::string trimmed = trim(text);
	if (trimmed.empty()) {
		return std::nullopt;
	}
	errno = 0;
	char *parse_end = nullptr;
	const double value = std::strtod(trimmed.c_str(), &parse_end);
	if (parse_end != trimmed.c_str() + trimmed.size() || errno == ERANGE) {
		return std::nullopt;
	}
	return value;
}

} // namespace

bool Table::hasColumn(const std::string &name) const {
	for (const auto &row : rows_) {
		if (row.find(name) != row.end()) {
			return true;
		}
	}
	return false;
}

std::vector<Cell> Table::column(const std::string &name) const {
	if (!hasColumn(name)) {
		throw std::out_of_range("Column '" + name + "' not found.");
	}
	std::vector<Cell> cells;
	cells.reserve(rows_.size());
	for (const auto &row : rows_) {
		auto it = row.find(name);
		cells.push_back(it == row.end() ? Cell{} : it->second);
	}
	return cells;
}

std::optional<double> toNumeric(const Cell &cell) {
	if (const auto *number = std::get_if<double>(&cell)) {
		return *number;
	}
	if (const auto *flag = std::get_if<bool>(&cell)) {
		return *flag ? 1.0 : 0.0;
	}
	if (const auto *text = std::get_if<std::string>(&cell)) {
		return parseNumber(*text);
	}
	return std::nullopt;
}

} // namespace tabcast::core
