#pragma once

#include <stdexcept>
#include <string>

namespace tabcast::core {

/// Reasons a forecast request can fail.
enum class ErrorKind {
	ColumnNotFound,
	InsufficientData,
	InvalidRequest,
	NoForecastableColumns,
	Internal
};

/// Stable snake_case name of an error kind, as reported on the wire.
std::string errorKindName(ErrorKind kind);

/**
 * @class ForecastError
 * @brief Exception raised inside the forecasting pipeline.
 *
 * The engine boundary converts it into a ForecastFailure; it never escapes
 * ForecastEngine.
 */
class ForecastError : public std::runtime_error {
public:
	ForecastError(ErrorKind kind, const std::string &message) : std::runtime_error(message), kind_(kind) {}

	ErrorKind kind() const noexcept {
		return kind_;
	}

private:
	ErrorKind kind_;
};

/// Structured failure returned instead of a forecast.
struct ForecastFailure {
	ErrorKind kind = ErrorKind::Internal;
	std::string message;
};

} // namespace tabcast::core
