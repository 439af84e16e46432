#pragma once

#include "tabcast/core/errors.hpp"
#include "tabcast/core/table.hpp"
#include "tabcast/engine/config.hpp"
#include "tabcast/engine/forecast_engine.hpp"
#include "tabcast/models/iforecaster.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace tabcast::io {

/// Insertion-ordered JSON, so responses keep the field order of the service contract.
using Json = nlohmann::ordered_json;

/**
 * @brief Builds a Table from an array of row objects.
 *
 * Null, number, string and boolean members become cells; nested arrays and
 * objects are kept as null cells.
 * @throws core::ForecastError InvalidRequest if @p rows is not an array of objects.
 */
core::Table tableFromJson(const Json &rows);

/**
 * @brief Reads a single-series request.
 *
 * Rows are taken from "rows" (or "data"); "value_column" is required,
 * "date_column", "periods" and "method" are optional.
 * @throws core::ForecastError InvalidRequest on missing or mistyped fields.
 */
engine::ForecastRequest parseForecastRequest(const Json &body);

/// Multi-series counterpart of parseForecastRequest(); "columns" is required.
engine::MultiForecastRequest parseMultiForecastRequest(const Json &body);

/**
 * @brief Reads engine settings from a JSON object.
 *
 * Keys mirror the EngineConfig field names; absent keys keep their default,
 * unknown keys are ignored.
 * @throws std::invalid_argument On mistyped or out-of-range values.
 */
engine::EngineConfig parseEngineConfig(const Json &body);

Json toJson(const models::ModelInfo &info);
Json toJson(const engine::ForecastSummary &summary);
Json toJson(const core::ForecastFailure &failure);
Json toJson(const engine::ForecastOutcome &outcome);
Json toJson(const engine::MultiForecastOutcome &outcome);

/**
 * @brief Parses a request body, runs it and renders the response.
 *
 * Malformed JSON is reported as an InvalidRequest failure document.
 */
Json respondSingle(const engine::ForecastEngine &engine, const std::string &body);
Json respondMulti(const engine::ForecastEngine &engine, const std::string &body);

} // namespace tabcast::io
