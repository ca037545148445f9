/**
 * @file main_cli.cpp
 * @brief Command-line runner for the senate debate engine
 *
 * Runs one complete debate with the console transcript sink. The debate is
 * configured from a TOML file or from the built-in "Land Reform" defaults,
 * and the summary and each senator's memory can be dumped as JSON.
 *
 * @note Exit code 0 on a completed debate, 1 on configuration or runtime errors
 */

#include "DebateSimulation.hpp"
#include "DebateConfig.hpp"
#include "IClock.hpp"
#include "JsonCodec.hpp"
#include "adapters/ConsoleDebateSink.hpp"
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

using namespace senate;

/**
 * @brief Display program usage information
 * @param programName Name of the executable (from argv[0])
 */
void printUsage(const char* programName) {
    std::cout << "Usage: " << programName << " [options]\n"
              << "Options:\n"
              << "  --config <file>    Configuration file (default: built-in Land Reform debate)\n"
              << "  --seed <n>         Fixed random seed for a reproducible debate\n"
              << "  --json             Print the summary and senator memories as JSON\n"
              << "  --help             Show this help message\n"
              << "\nConfiguration file format (TOML):\n"
              << "  [debate]\n"
              << "  topic = \"Land Reform\"\n"
              << "  seed = 42\n"
              << "\n"
              << "  [[senator]]\n"
              << "  id = \"cicero\"\n"
              << "  name = \"Marcus Tullius Cicero\"\n"
              << "  faction = \"Optimates\"\n"
              << "  rank = 4\n"
              << "  stance = \"neutral\"\n"
              << std::endl;
}

/**
 * @brief Main application entry point
 * @param argc Command line argument count
 * @param argv Command line argument values
 * @return Exit code (0 for success, 1 for error)
 */
int main(int argc, char* argv[]) {
    std::string configFile;
    std::optional<std::uint32_t> seedOverride;
    bool jsonOutput = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "--config requires a file name" << std::endl;
                return 1;
            }
            configFile = argv[++i];
        } else if (arg == "--seed") {
            if (i + 1 >= argc) {
                std::cerr << "--seed requires a number" << std::endl;
                return 1;
            }
            try {
                seedOverride = static_cast<std::uint32_t>(std::stoul(argv[++i]));
            } catch (const std::exception&) {
                std::cerr << "Invalid seed: " << argv[i] << std::endl;
                return 1;
            }
        } else if (arg == "--json") {
            jsonOutput = true;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    }

    SimulationConfig config;
    try {
        config = configFile.empty() ? SimulationConfig::defaults() : DebateConfig::loadFromFile(configFile);
    } catch (const std::exception& e) {
        std::cerr << "[Config] Error: " << e.what() << std::endl;
        return 1;
    }
    if (seedOverride) {
        config.seed = seedOverride;
    }

    std::cout << "Starting senate debate on '" << config.topic << "'" << std::endl;
    if (config.seed) {
        std::cout << "Seed: " << *config.seed << std::endl;
    }

    auto clock = std::make_shared<SystemClock>();
    auto sink = std::make_shared<adapters::ConsoleDebateSink>();

    try {
        DebateSimulation simulation(clock, sink);
        simulation.configure(config);

        auto summary = simulation.run();
        if (!summary) {
            std::cerr << "Debate could not be conducted" << std::endl;
            return 1;
        }

        if (jsonOutput) {
            nlohmann::json report;
            report["summary"] = JsonCodec::summaryToJson(*summary);
            nlohmann::json senators = nlohmann::json::array();
            for (const auto& agent : simulation.agents()) {
                nlohmann::json entry = JsonCodec::senatorToJson(agent->senator());
                auto stance = agent->stanceOn(config.topic);
                entry["stance"] = stance ? stanceToString(*stance) : "undecided";
                entry["memory"] = JsonCodec::memoryToJson(agent->memory());
                senators.push_back(entry);
            }
            report["senators"] = senators;
            std::cout << report.dump(2) << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
