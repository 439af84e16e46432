#include "tabcast/core/errors.hpp"

namespace tabcast::core {

std::string errorKindName(ErrorKind kind) {
	switch (kind) {
	case ErrorKind::ColumnNotFound:
		return "column_not_found";
	case ErrorKind::InsufficientData:
		return "insufficient_data";
	case ErrorKind::InvalidRequest:
		return "invalid_request";
	case ErrorKind::NoForecastableColumns:
		return "no_forecastable_columns";
	case ErrorKind::Internal:
		return "internal";
	}
	return "internal";
}

} // namespace tabcast::core
