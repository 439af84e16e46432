#include "tabcast/io/json_codec.hpp"
#include "tabcast/utils/logging.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>
#include <variant>

namespace tabcast::io {

namespace {

core::ForecastError invalid(const std::string &message) {
	return core::ForecastError(core::ErrorKind::InvalidRequest, message);
}

const Json &rowsOf(const Json &body) {
	if (!body.is_object()) {
		throw invalid("Request body must be a JSON object.");
	}
	if (body.contains("rows")) {
		return body.at("rows");
	}
	if (body.contains("data")) {
		return body.at("data");
	}
	throw invalid("Request is missing 'rows'.");
}

std::string requiredString(const Json &body, const char *key) {
	if (!body.contains(key) || !body.at(key).is_string()) {
		throw invalid(std::string("Request field '") + key + "' must be a string.");
	}
	return body.at(key).get<std::string>();
}

std::optional<int> optionalPeriods(const Json &body) {
	if (!body.contains("periods") || body.at("periods").is_null()) {
		return std::nullopt;
	}
	const auto &value = body.at("periods");
	if (value.is_number_integer()) {
		const auto periods = value.get<long long>();
		if (periods < std::numeric_limits<int>::min() || periods > std::numeric_limits<int>::max()) {
			throw invalid("Request field 'periods' is out of range.");
		}
		return static_cast<int>(periods);
	}
	if (value.is_number_float()) {
		const double periods = value.get<double>();
		if (std::floor(periods) == periods && std::abs(periods) <= std::numeric_limits<int>::max()) {
			return static_cast<int>(periods);
		}
	}
	throw invalid("Request field 'periods' must be an integer.");
}

long long integerField(const Json &body, const char *key) {
	const auto &value = body.at(key);
	if (!value.is_number_integer()) {
		throw std::invalid_argument(std::string("Engine config field '") + key + "' must be an integer.");
	}
	return value.get<long long>();
}

std::size_t countField(const Json &body, const char *key) {
	const auto value = integerField(body, key);
	if (value < 0) {
		throw std::invalid_argument(std::string("Engine config field '") + key + "' must be non-negative.");
	}
	return static_cast<std::size_t>(value);
}

double realField(const Json &body, const char *key) {
	const auto &value = body.at(key);
	if (!value.is_number()) {
		throw std::invalid_argument(std::string("Engine config field '") + key + "' must be a number.");
	}
	return value.get<double>();
}

Json pointsToJson(const std::vector<engine::ForecastPoint> &points) {
	Json data = Json::array();
	for (const auto &point : points) {
		Json entry = Json::object();
		entry["index"] = point.index;
		entry["value"] = point.value;
		entry["type"] = "forecast";
		entry["ci_lower"] = point.lower;
		entry["ci_upper"] = point.upper;
		data.push_back(std::move(entry));
	}
	return data;
}

template <typename Request, typename Parser, typename Runner>
Json respond(const std::string &body, Parser parse, Runner run) {
	try {
		const Request request = parse(Json::parse(body));
		return toJson(run(request));
	} catch (const Json::exception &e) {
		TABCAST_ERROR("Malformed request: {}", e.what());
		return toJson(core::ForecastFailure{core::ErrorKind::InvalidRequest, e.what()});
	} catch (const core::ForecastError &e) {
		TABCAST_ERROR("Invalid request: {}", e.what());
		return toJson(core::ForecastFailure{e.kind(), e.what()});
	}
}

} // namespace

core::Table tableFromJson(const Json &rows) {
	if (!rows.is_array()) {
		throw invalid("Request 'rows' must be an array of objects.");
	}

	core::Table table;
	for (const auto &row : rows) {
		if (!row.is_object()) {
			throw invalid("Request 'rows' must be an array of objects.");
		}
		core::Table::Row cells;
		for (const auto &item : row.items()) {
			const auto &value = item.value();
			core::Cell cell;
			if (value.is_number()) {
				cell = value.get<double>();
			} else if (value.is_string()) {
				cell = value.get<std::string>();
			} else if (value.is_boolean()) {
				cell = value.get<bool>();
			}
			cells.emplace(item.key(), std::move(cell));
		}
		table.addRow(std::move(cells));
	}
	return table;
}

engine::ForecastRequest parseForecastRequest(const Json &body) {
	engine::ForecastRequest request;
	request.table = tableFromJson(rowsOf(body));
	request.value_column = requiredString(body, "value_column");
	if (body.contains("date_column") && !body.at("date_column").is_null()) {
		request.date_column = requiredString(body, "date_column");
	}
	request.periods = optionalPeriods(body);
	if (body.contains("method") && !body.at("method").is_null()) {
		request.method = requiredString(body, "method");
	}
	return request;
}

engine::MultiForecastRequest parseMultiForecastRequest(const Json &body) {
	engine::MultiForecastRequest request;
	request.table = tableFromJson(rowsOf(body));
	if (!body.contains("columns") || !body.at("columns").is_array()) {
		throw invalid("Request field 'columns' must be an array of strings.");
	}
	for (const auto &column : body.at("columns")) {
		if (!column.is_string()) {
			throw invalid("Request field 'columns' must be an array of strings.");
		}
		request.columns.push_back(column.get<std::string>());
	}
	request.periods = optionalPeriods(body);
	return request;
}

engine::EngineConfig parseEngineConfig(const Json &body) {
	if (!body.is_object()) {
		throw std::invalid_argument("Engine config must be a JSON object.");
	}

	engine::EngineConfigBuilder builder;
	if (body.contains("min_points")) {
		builder.withMinPoints(countField(body, "min_points"));
	}
	if (body.contains("default_periods")) {
		builder.withDefaultPeriods(static_cast<int>(integerField(body, "default_periods")));
	}
	if (body.contains("seasonality_min_points")) {
		builder.withSeasonalityMinPoints(countField(body, "seasonality_min_points"));
	}
	if (body.contains("acf_threshold")) {
		builder.withAcfThreshold(realField(body, "acf_threshold"));
	}
	if (body.contains("min_lag")) {
		builder.withMinLag(static_cast<std::uint32_t>(countField(body, "min_lag")));
	}
	if (body.contains("trend_strength_ratio")) {
		builder.withTrendStrengthRatio(realField(body, "trend_strength_ratio"));
	}
	if (body.contains("ema_alpha")) {
		builder.withEmaAlpha(realField(body, "ema_alpha"));
	}
	if (body.contains("recent_trend_window")) {
		builder.withRecentTrendWindow(countField(body, "recent_trend_window"));
	}
	if (body.contains("ema_interval_scale")) {
		builder.withEmaIntervalScale(realField(body, "ema_interval_scale"));
	}
	if (body.contains("z")) {
		builder.withZ(realField(body, "z"));
	}
	if (body.contains("holdout")) {
		builder.withHoldout(countField(body, "holdout"));
	}
	if (body.contains("max_columns")) {
		builder.withMaxColumns(countField(body, "max_columns"));
	}
	if (body.contains("stable_band_pct")) {
		builder.withStableBandPct(realField(body, "stable_band_pct"));
	}
	if (body.contains("decimals")) {
		builder.withDecimals(static_cast<int>(integerField(body, "decimals")));
	}
	return builder.build();
}

Json toJson(const models::ModelInfo &info) {
	Json json = Json::object();
	json["method"] = info.method;
	for (const auto &entry : info.params) {
		std::visit([&json, &entry](auto value) { json[entry.first] = value; }, entry.second);
	}
	return json;
}

Json toJson(const engine::ForecastSummary &summary) {
	Json json = Json::object();
	json["current_value"] = summary.current_value;
	json["forecasted_end_value"] = summary.forecasted_end_value;
	json["forecast_change_pct"] = summary.forecast_change_pct;
	json["trend_direction"] = engine::trendDirectionName(summary.direction);
	json["seasonality_detected"] = summary.seasonalityDetected();
	if (summary.seasonality_period) {
		json["seasonality_period"] = *summary.seasonality_period;
	} else {
		json["seasonality_period"] = nullptr;
	}
	return json;
}

Json toJson(const core::ForecastFailure &failure) {
	Json json = Json::object();
	json["success"] = false;
	json["error"] = failure.message;
	json["error_kind"] = core::errorKindName(failure.kind);
	return json;
}

Json toJson(const engine::ForecastOutcome &outcome) {
	if (!outcome.success()) {
		return toJson(*outcome.failure);
	}
	const auto &result = *outcome.value;

	Json json = Json::object();
	json["success"] = true;
	json["column"] = result.column;
	json["periods"] = result.periods;
	json["model_info"] = toJson(result.model_info);

	Json accuracy = Json::object();
	accuracy["mape"] = result.accuracy.mape ? Json(*result.accuracy.mape) : Json(nullptr);
	accuracy["rmse"] = result.accuracy.rmse ? Json(*result.accuracy.rmse) : Json(nullptr);
	json["accuracy_metrics"] = std::move(accuracy);

	Json historical = Json::array();
	for (std::size_t i = 0; i < result.historical.size(); ++i) {
		Json entry = Json::object();
		entry["index"] = i;
		entry["value"] = result.historical[i];
		entry["type"] = "historical";
		historical.push_back(std::move(entry));
	}
	json["historical_data"] = std::move(historical);
	json["forecast_data"] = pointsToJson(result.forecast);
	json["summary"] = toJson(result.summary);
	return json;
}

Json toJson(const engine::MultiForecastOutcome &outcome) {
	if (!outcome.success()) {
		return toJson(*outcome.failure);
	}
	const auto &result = *outcome.value;

	Json forecasts = Json::array();
	for (const auto &entry : result.forecasts) {
		Json item = Json::object();
		item["column"] = entry.column;
		item["summary"] = toJson(entry.summary);
		item["model_info"] = toJson(entry.model_info);
		item["forecast_data"] = pointsToJson(entry.forecast);
		forecasts.push_back(std::move(item));
	}

	Json json = Json::object();
	json["success"] = true;
	json["periods"] = result.periods;
	json["forecasts"] = std::move(forecasts);
	json["columns_processed"] = result.columnsProcessed();
	return json;
}

Json respondSingle(const engine::ForecastEngine &engine, const std::string &body) {
	return respond<engine::ForecastRequest>(
	    body, [](const Json &json) { return parseForecastRequest(json); },
	    [&engine](const engine::ForecastRequest &request) { return engine.forecast(request); });
}

Json respondMulti(const engine::ForecastEngine &engine, const std::string &body) {
	return respond<engine::MultiForecastRequest>(
	    body, [](const Json &json) { return parseMultiForecastRequest(json); },
	    [&engine](const engine::MultiForecastRequest &request) { return engine.forecastColumns(request); });
}

} // namespace tabcast::io
