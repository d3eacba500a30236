/**
 * @file geo_estimator_cli.cpp
 * @brief Command-line front end for the estimate and bearing handlers
 *
 * Usage:
 *   ./geo_estimator_cli --request request.json
 *   ./geo_estimator_cli --request request.json --config service.json --verbose
 *   cat request.json | ./geo_estimator_cli --bearing-only
 *
 * Credentials come from GOOGLE_MAPS_API_KEY, MAPILLARY_TOKEN and
 * NOMINATIM_EMAIL; a config file may override them.
 */

#include <geo_estimator/geo_services.hpp>
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>

using namespace geo_estimator;

// ============================================================================
// Helper Functions
// ============================================================================

void printUsage(const char* prog) {
    std::cout << "Usage: " << prog << " [options]\n\n"
              << "Options:\n"
              << "  --request <path>     Request JSON file (default: stdin)\n"
              << "  --config <path>      Service config JSON overlaid on defaults\n"
              << "  --bearing-only       Compute the bearing only (no network)\n"
              << "  --verbose            Log retries, skips and timeouts to stdout\n"
              << "  --help, -h           Show this help\n";
}

std::string readAll(std::istream& in) {
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    std::string request_path;
    std::string config_path;
    bool bearing_only = false;
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--request" && i + 1 < argc) {
            request_path = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--bearing-only") {
            bearing_only = true;
        } else if (arg == "--verbose") {
            verbose = true;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            printUsage(argv[0]);
            return 1;
        }
    }

    std::string body;
    if (request_path.empty()) {
        body = readAll(std::cin);
    } else {
        std::ifstream file(request_path);
        if (!file) {
            std::cerr << "Error: cannot open request file: " << request_path << "\n";
            return 1;
        }
        body = readAll(file);
    }

    std::unique_ptr<GeoServices> services;
    try {
        Config config = Config::fromEnvironment();
        if (!config_path.empty()) {
            config = Config::fromJsonFile(config_path, config);
        }
        if (verbose) {
            config.verbose = true;
        }
        services = createServices(config);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    EndpointResult result = bearing_only
        ? services->handler().handleBearing(body)
        : services->handler().handleEstimate(body);

    std::cout << result.status << "\n"
              << result.body.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
    return result.status == 200 ? 0 : 1;
}
