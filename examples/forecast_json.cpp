#include "tabcast/engine/forecast_engine.hpp"
#include "tabcast/io/json_codec.hpp"
#include "tabcast/utils/logging.hpp"

#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

using namespace tabcast;

namespace {

void printUsage(const char *program) {
	std::cerr << "Usage: " << program << " <single|multi> <request.json> [--config engine.json] [--log-level level]\n";
}

std::string readFile(const std::string &path) {
	std::ifstream input(path);
	if (!input) {
		throw std::runtime_error("Cannot open '" + path + "'.");
	}
	std::ostringstream buffer;
	buffer << input.rdbuf();
	return buffer.str();
}

} // namespace

int main(int argc, char **argv) {
	if (argc < 3) {
		printUsage(argv[0]);
		return 2;
	}

	const std::string mode = argv[1];
	const std::string request_path = argv[2];
	std::string config_path;
	std::string log_level = "warn";

	for (int i = 3; i < argc; ++i) {
		const std::string arg = argv[i];
		if (arg == "--config" && i + 1 < argc) {
			config_path = argv[++i];
		} else if (arg == "--log-level" && i + 1 < argc) {
			log_level = argv[++i];
		} else {
			printUsage(argv[0]);
			return 2;
		}
	}
	if (mode != "single" && mode != "multi") {
		printUsage(argv[0]);
		return 2;
	}

	try {
		utils::Logging::init(log_level);

		engine::EngineConfig config;
		if (!config_path.empty()) {
			config = io::parseEngineConfig(io::Json::parse(readFile(config_path)));
		}
		const engine::ForecastEngine forecaster(config);

		const std::string body = readFile(request_path);
		const io::Json response =
		    mode == "single" ? io::respondSingle(forecaster, body) : io::respondMulti(forecaster, body);

		std::cout << response.dump(2) << std::endl;
		return response.at("success").get<bool>() ? 0 : 1;
	} catch (const std::exception &e) {
		std::cerr << "error: " << e.what() << "\n";
		return 2;
	}
}
