#ifndef TABCAST_NO_LOGGING

#include <catch2/catch_test_macros.hpp>

#include "tabcast/utils/logging.hpp"

#include <stdexcept>

using tabcast::utils::Logging;

TEST_CASE("Logging exposes a shared tabcast logger", "[utils][logging]") {
	auto &logger = Logging::getLogger();
	REQUIRE(logger != nullptr);
	REQUIRE(logger->name() == "tabcast");
	REQUIRE(spdlog::get("tabcast") == logger);
}

TEST_CASE("Logging accepts level names", "[utils][logging]") {
	Logging::init("debug");
	REQUIRE(Logging::getLogger()->level() == spdlog::level::debug);

	Logging::init("off");
	REQUIRE(Logging::getLogger()->level() == spdlog::level::off);

	REQUIRE_THROWS_AS(Logging::init("verbose"), std::invalid_argument);

	Logging::init(spdlog::level::info);
	REQUIRE(Logging::getLogger()->level() == spdlog::level::info);
}

#endif // TABCAST_NO_LOGGING
