#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "tabcast/core/errors.hpp"
#include "tabcast/io/json_codec.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <variant>

using namespace tabcast;
using io::Json;

namespace {

Json linearRows(const std::string &column, int count) {
	Json rows = Json::array();
	for (int i = 0; i < count; ++i) {
		rows.push_back(Json{{"date", "2024-01-" + std::to_string(i + 1)}, {column, 5 + 3 * i}});
	}
	return rows;
}

core::ErrorKind parseFailure(const Json &body) {
	try {
		io::parseForecastRequest(body);
	} catch (const core::ForecastError &e) {
		return e.kind();
	}
	FAIL("parseForecastRequest did not throw");
	return core::ErrorKind::Internal;
}

} // namespace

TEST_CASE("Rows become table cells", "[io][json][table]") {
	const auto rows = Json::parse(R"([{"a": 1.5, "b": "2", "c": true, "d": null, "e": [1]}])");
	const auto table = io::tableFromJson(rows);

	REQUIRE(table.rowCount() == 1);
	const auto &row = table.rows().front();
	REQUIRE(std::get<double>(row.at("a")) == Catch::Approx(1.5));
	REQUIRE(std::get<std::string>(row.at("b")) == "2");
	REQUIRE(std::get<bool>(row.at("c")));
	REQUIRE(std::holds_alternative<std::monostate>(row.at("d")));
	REQUIRE(std::holds_alternative<std::monostate>(row.at("e")));

	REQUIRE_THROWS_AS(io::tableFromJson(Json::parse(R"({"a": 1})")), core::ForecastError);
	REQUIRE_THROWS_AS(io::tableFromJson(Json::parse(R"([1, 2])")), core::ForecastError);
}

TEST_CASE("Single forecast request parsing", "[io][json][request]") {
	Json body = Json::object();
	body["data"] = linearRows("sales", 12);
	body["value_column"] = "sales";
	body["date_column"] = "date";
	body["periods"] = 4.0;
	body["method"] = "linear";

	const auto request = io::parseForecastRequest(body);
	REQUIRE(request.table.rowCount() == 12);
	REQUIRE(request.value_column == "sales");
	REQUIRE(request.date_column.value() == "date");
	REQUIRE(request.periods.value() == 4);
	REQUIRE(request.method == "linear");

	Json minimal = Json::object();
	minimal["rows"] = Json::array();
	minimal["value_column"] = "x";
	const auto defaults = io::parseForecastRequest(minimal);
	REQUIRE_FALSE(defaults.periods.has_value());
	REQUIRE(defaults.method == "auto");
}

TEST_CASE("Malformed requests are rejected", "[io][json][request]") {
	REQUIRE(parseFailure(Json::array()) == core::ErrorKind::InvalidRequest);
	REQUIRE(parseFailure(Json{{"value_column", "x"}}) == core::ErrorKind::InvalidRequest);
	REQUIRE(parseFailure(Json{{"rows", Json::array()}}) == core::ErrorKind::InvalidRequest);
	REQUIRE(parseFailure(Json{{"rows", Json::array()}, {"value_column", 3}}) == core::ErrorKind::InvalidRequest);
	REQUIRE(parseFailure(Json{{"rows", Json::array()}, {"value_column", "x"}, {"periods", 2.5}}) ==
	        core::ErrorKind::InvalidRequest);
	REQUIRE(parseFailure(Json{{"rows", Json::array()}, {"value_column", "x"}, {"periods", "3"}}) ==
	        core::ErrorKind::InvalidRequest);

	REQUIRE_THROWS_AS(io::parseMultiForecastRequest(Json{{"rows", Json::array()}, {"columns", "a"}}),
	                  core::ForecastError);
	REQUIRE_THROWS_AS(io::parseMultiForecastRequest(Json{{"rows", Json::array()}, {"columns", {"a", 1}}}),
	                  core::ForecastError);
}

TEST_CASE("Engine config is read from JSON", "[io][json][config]") {
	const auto config = io::parseEngineConfig(Json::parse(R"({"min_points": 5, "z": 2, "holdout": 3})"));
	REQUIRE(config.min_points == 5);
	REQUIRE(config.z == Catch::Approx(2.0));
	REQUIRE(config.holdout == 3);
	REQUIRE(config.max_columns == 5);

	REQUIRE_THROWS_AS(io::parseEngineConfig(Json::parse(R"({"min_points": -1})")), std::invalid_argument);
	REQUIRE_THROWS_AS(io::parseEngineConfig(Json::parse(R"({"holdout": 1.5})")), std::invalid_argument);
	REQUIRE_THROWS_AS(io::parseEngineConfig(Json::parse(R"({"ema_alpha": "high"})")), std::invalid_argument);
	REQUIRE_THROWS_AS(io::parseEngineConfig(Json::parse(R"({"ema_alpha": 2.0})")), std::invalid_argument);
	REQUIRE_THROWS_AS(io::parseEngineConfig(Json::array()), std::invalid_argument);
}

TEST_CASE("Model info keeps the method first", "[io][json][model_info]") {
	models::ModelInfo info;
	info.method = "seasonal_decomposition";
	info.set("seasonality_period", static_cast<std::int64_t>(7));
	info.set("trend_slope", 0.25);

	const auto json = io::toJson(info);
	REQUIRE(json.begin().key() == "method");
	REQUIRE(json.at("seasonality_period").is_number_integer());
	REQUIRE(json.at("trend_slope").get<double>() == Catch::Approx(0.25));
}

TEST_CASE("Single forecast response", "[io][json][response]") {
	Json body = Json::object();
	body["rows"] = linearRows("sales", 20);
	body["value_column"] = "sales";
	body["periods"] = 3;

	const engine::ForecastEngine forecaster;
	const auto response = io::respondSingle(forecaster, body.dump());

	REQUIRE(response.at("success").get<bool>());
	REQUIRE(response.at("column") == "sales");
	REQUIRE(response.at("periods") == 3);
	REQUIRE(response.at("model_info").at("method") == "linear_regression");
	REQUIRE(response.at("accuracy_metrics").at("rmse").is_number());
	REQUIRE(response.at("historical_data").size() == 20);
	REQUIRE(response.at("historical_data")[0].at("type") == "historical");

	const auto &first = response.at("forecast_data")[0];
	REQUIRE(first.at("index") == 20);
	REQUIRE(first.at("type") == "forecast");
	REQUIRE(first.at("value").get<double>() == Catch::Approx(65.0));
	REQUIRE(first.at("ci_lower").get<double>() <= first.at("value").get<double>());
	REQUIRE(first.at("ci_upper").get<double>() >= first.at("value").get<double>());

	const auto &summary = response.at("summary");
	REQUIRE(summary.at("trend_direction") == "increasing");
	REQUIRE_FALSE(summary.at("seasonality_detected").get<bool>());
	REQUIRE(summary.at("seasonality_period").is_null());
}

TEST_CASE("Failures carry a message and kind", "[io][json][response]") {
	const engine::ForecastEngine forecaster;

	Json body = Json::object();
	body["rows"] = linearRows("sales", 12);
	body["value_column"] = "profit";
	const auto missing = io::respondSingle(forecaster, body.dump());
	REQUIRE_FALSE(missing.at("success").get<bool>());
	REQUIRE(missing.at("error") == "Column 'profit' not found");
	REQUIRE(missing.at("error_kind") == "column_not_found");

	const auto malformed = io::respondSingle(forecaster, "{not json");
	REQUIRE_FALSE(malformed.at("success").get<bool>());
	REQUIRE(malformed.at("error_kind") == "invalid_request");

	const auto no_rows = io::respondMulti(forecaster, R"({"columns": ["a"]})");
	REQUIRE(no_rows.at("error_kind") == "invalid_request");
}

TEST_CASE("Multi forecast response", "[io][json][response]") {
	Json rows = Json::array();
	for (int i = 0; i < 12; ++i) {
		rows.push_back(Json{{"a", i * 2}, {"b", 100 - i}});
	}
	Json body = Json::object();
	body["rows"] = rows;
	body["columns"] = Json::array({"a", "missing", "b"});
	body["periods"] = 2;

	const engine::ForecastEngine forecaster;
	const auto response = io::respondMulti(forecaster, body.dump());

	REQUIRE(response.at("success").get<bool>());
	REQUIRE(response.at("periods") == 2);
	REQUIRE(response.at("columns_processed") == 2);
	REQUIRE(response.at("forecasts")[0].at("column") == "a");
	REQUIRE(response.at("forecasts")[1].at("column") == "b");
	REQUIRE(response.at("forecasts")[1].at("forecast_data").size() == 2);

	body["columns"] = Json::array({"missing"});
	const auto failed = io::respondMulti(forecaster, body.dump());
	REQUIRE(failed.at("error") == "No columns could be forecasted");
	REQUIRE(failed.at("error_kind") == "no_forecastable_columns");
}
