#pragma once

#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace tabcast::core {

/**
 * @class TimeSeries
 * @brief An ordered sequence of finite values indexed 0..n-1.
 *
 * Positions carry no calendar meaning: index i is simply the i-th retained
 * observation of the source column.
 */
class TimeSeries {
public:
	using Value = double;

	TimeSeries() = default;

	/**
	 * @brief Constructs a TimeSeries object.
	 * @param values The ordered observations.
	 * @param label Name of the source column.
	 * @throws std::invalid_argument If any value is NaN or infinite.
	 */
	explicit TimeSeries(std::vector<Value> values, std::string label = {})
	    : values_(std::move(values)), label_(std::move(label)) {
		for (const auto value : values_) {
			if (!std::isfinite(value)) {
				throw std::invalid_argument("TimeSeries values must be finite.");
			}
		}
	}

	const std::vector<Value> &getValues() const {
		return values_;
	}

	const std::string &label() const {
		return label_;
	}

	std::size_t size() const {
		return values_.size();
	}

	bool empty() const {
		return values_.empty();
	}

	Value front() const {
		requireNonEmpty();
		return values_.front();
	}

	Value back() const {
		requireNonEmpty();
		return values_.back();
	}

	Value operator[](std::size_t index) const {
		return values_[index];
	}

	/**
	 * @brief Returns the first @p count observations as a new series.
	 * @throws std::out_of_range If @p count exceeds the series length.
	 */
	TimeSeries head(std::size_t count) const {
		if (count > values_.size()) {
			throw std::out_of_range("Requested head exceeds series length.");
		}
		return TimeSeries(std::vector<Value>(values_.begin(), values_.begin() + static_cast<std::ptrdiff_t>(count)),
		                  label_);
	}

	/**
	 * @brief Returns the last @p count observations as a new series.
	 * @throws std::out_of_range If @p count exceeds the series length.
	 */
	TimeSeries tail(std::size_t count) const {
		if (count > values_.size()) {
			throw std::out_of_range("Requested tail exceeds series length.");
		}
		return TimeSeries(std::vector<Value>(values_.end() - static_cast<std::ptrdiff_t>(count), values_.end()), label_);
	}

private:
	void requireNonEmpty() const {
		if (values_.empty()) {
			throw std::out_of_range("TimeSeries is empty.");
		}
	}

	std::vector<Value> values_;
	std::string label_;
};

} // namespace tabcast::core
