/**
 * @file DebateConfig.hpp
 * @brief TOML configuration file parser for the debate runner
 *
 * Provides a simple TOML-subset parser for debate settings, the probability
 * constants of the decision policies and the list of participating senators.
 *
 * Supported Sections:
 * - [debate]: topic, seed, history_size, speech_pause_ms, generator_timeout_ms
 * - [reaction]: base, cap, relationship_weight, faction_bonus, max_topic_interest, strong_relationship
 * - [interjection]: base, cap, relationship_weight, rank_step, rank_cap, stance_bonus
 * - [stance_change]: base, cap, relationship_weight, faction_bonus, rank_step, rank_cap
 * - [[senator]]: id, name, faction, rank, stance (repeatable)
 *
 * @note Simple line-based parser; no inline tables or multi-line values
 * @note Senators default to the three-senator "Land Reform" cast when none are listed
 */

#pragma once

#include "DebateSimulation.hpp"
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace senate {

/**
 * @brief TOML configuration loader for SimulationConfig
 *
 * Unknown keys are ignored. Malformed numbers and senator tables without an
 * id raise std::runtime_error; unknown stance names are reported and left
 * unset so the agent picks one at debate start.
 */
class DebateConfig {
public:
    /**
     * @brief Load and parse TOML configuration file
     * @param filename Path to TOML configuration file
     * @return Complete simulation configuration
     * @throws std::runtime_error if the file cannot be read or a value is malformed
     */
    static SimulationConfig loadFromFile(const std::string& filename) {
        std::ifstream file(filename);
        if (!file.is_open()) {
            throw std::runtime_error("Could not open config file: " + filename);
        }
        return load(file);
    }

    /**
     * @brief Parse TOML configuration held in memory
     * @param text TOML document
     * @return Complete simulation configuration
     * @throws std::runtime_error if a value is malformed
     */
    static SimulationConfig loadFromString(const std::string& text) {
        std::istringstream in(text);
        return load(in);
    }

    /**
     * @brief Parse TOML configuration from a stream
     * @param in Input stream positioned at the start of the document
     * @return Complete simulation configuration
     * @throws std::runtime_error if a value is malformed
     */
    static SimulationConfig load(std::istream& in) {
        SimulationConfig config = SimulationConfig::defaults();
        std::vector<SenatorProfile> senators;

        std::string currentSection;
        std::string line;
        int lineNumber = 0;
        while (std::getline(in, line)) {
            ++lineNumber;

            // Remove comments outside of quoted values
            size_t commentPos = findComment(line);
            if (commentPos != std::string::npos) {
                line = line.substr(0, commentPos);
            }

            trim(line);
            if (line.empty()) {
                continue;
            }

            // Array-of-tables header starts a new senator entry
            if (line.rfind("[[", 0) == 0) {
                if (line.size() >= 4 && line.compare(line.size() - 2, 2, "]]") == 0) {
                    currentSection = line.substr(2, line.length() - 4);
                    trim(currentSection);
                    if (currentSection == "senator") {
                        senators.emplace_back();
                    }
                }
                continue;
            }

            if (line[0] == '[') {
                if (line.back() == ']') {
                    currentSection = line.substr(1, line.length() - 2);
                    trim(currentSection);
                }
                continue;
            }

            size_t equalPos = line.find('=');
            if (equalPos == std::string::npos) {
                continue;
            }

            std::string key = line.substr(0, equalPos);
            std::string value = line.substr(equalPos + 1);
            trim(key);
            trim(value);
            unquote(value);

            if (currentSection == "debate") {
                if (key == "topic") {
                    config.topic = value;
                } else if (key == "seed") {
                    config.seed = static_cast<std::uint32_t>(toUnsigned(key, value, lineNumber));
                } else if (key == "history_size") {
                    config.historySize = static_cast<std::size_t>(toUnsigned(key, value, lineNumber));
                } else if (key == "speech_pause_ms") {
                    config.speechPause = std::chrono::milliseconds(toUnsigned(key, value, lineNumber));
                } else if (key == "generator_timeout_ms") {
                    config.generatorTimeout = std::chrono::milliseconds(toUnsigned(key, value, lineNumber));
                }
            } else if (currentSection == "reaction") {
                auto& s = config.policy.reaction;
                if (key == "base") s.base = toDouble(key, value, lineNumber);
                else if (key == "cap") s.cap = toDouble(key, value, lineNumber);
                else if (key == "relationship_weight") s.relationshipWeight = toDouble(key, value, lineNumber);
                else if (key == "faction_bonus") s.factionBonus = toDouble(key, value, lineNumber);
                else if (key == "max_topic_interest") s.maxTopicInterest = toDouble(key, value, lineNumber);
                else if (key == "strong_relationship") s.strongRelationship = toDouble(key, value, lineNumber);
            } else if (currentSection == "interjection") {
                auto& s = config.policy.interjection;
                if (key == "base") s.base = toDouble(key, value, lineNumber);
                else if (key == "cap") s.cap = toDouble(key, value, lineNumber);
                else if (key == "relationship_weight") s.relationshipWeight = toDouble(key, value, lineNumber);
                else if (key == "rank_step") s.rankStep = toDouble(key, value, lineNumber);
                else if (key == "rank_cap") s.rankCap = toDouble(key, value, lineNumber);
                else if (key == "stance_bonus") s.stanceBonus = toDouble(key, value, lineNumber);
            } else if (currentSection == "stance_change") {
                auto& s = config.policy.stanceChange;
                if (key == "base") s.base = toDouble(key, value, lineNumber);
                else if (key == "cap") s.cap = toDouble(key, value, lineNumber);
                else if (key == "relationship_weight") s.relationshipWeight = toDouble(key, value, lineNumber);
                else if (key == "faction_bonus") s.factionBonus = toDouble(key, value, lineNumber);
                else if (key == "rank_step") s.rankStep = toDouble(key, value, lineNumber);
                else if (key == "rank_cap") s.rankCap = toDouble(key, value, lineNumber);
            } else if (currentSection == "senator" && !senators.empty()) {
                auto& profile = senators.back();
                if (key == "id") {
                    profile.senator.id = value;
                } else if (key == "name") {
                    profile.senator.name = value;
                } else if (key == "faction") {
                    profile.senator.faction = value;
                } else if (key == "rank") {
                    profile.senator.rank = static_cast<int>(toUnsigned(key, value, lineNumber));
                } else if (key == "stance") {
                    auto stance = stringToStance(value);
                    if (stance) {
                        profile.initialStance = stance;
                    } else {
                        std::cerr << "[Config] Warning: unknown stance '" << value
                                  << "' on line " << lineNumber << "; senator will choose at debate start" << std::endl;
                    }
                }
            }
        }

        if (!senators.empty()) {
            for (auto& profile : senators) {
                if (profile.senator.id.empty()) {
                    throw std::runtime_error("[[senator]] entry without an id");
                }
                if (profile.senator.name.empty()) {
                    profile.senator.name = profile.senator.id;
                }
            }
            config.senators = std::move(senators);
        }

        return config;
    }

private:
    static unsigned long toUnsigned(const std::string& key, const std::string& value, int lineNumber) {
        try {
            size_t consumed = 0;
            if (!value.empty() && value[0] == '-') {
                throw std::invalid_argument("negative");
            }
            unsigned long result = std::stoul(value, &consumed);
            if (consumed != value.size()) {
                throw std::invalid_argument("trailing characters");
            }
            return result;
        } catch (const std::exception&) {
            throw std::runtime_error("Malformed value for '" + key + "' on line " +
                                     std::to_string(lineNumber) + ": " + value);
        }
    }

    static double toDouble(const std::string& key, const std::string& value, int lineNumber) {
        try {
            size_t consumed = 0;
            double result = std::stod(value, &consumed);
            if (consumed != value.size()) {
                throw std::invalid_argument("trailing characters");
            }
            return result;
        } catch (const std::exception&) {
            throw std::runtime_error("Malformed value for '" + key + "' on line " +
                                     std::to_string(lineNumber) + ": " + value);
        }
    }

    /**
     * @brief Position of the first '#' outside double quotes
     * @param line Raw configuration line
     * @return Index of the comment marker or std::string::npos
     */
    static size_t findComment(const std::string& line) {
        bool quoted = false;
        for (size_t i = 0; i < line.size(); ++i) {
            if (line[i] == '"') {
                quoted = !quoted;
            } else if (line[i] == '#' && !quoted) {
                return i;
            }
        }
        return std::string::npos;
    }

    /**
     * @brief Trim whitespace from both ends of string
     * @param str String to trim (modified in place)
     */
    static void trim(std::string& str) {
        str.erase(0, str.find_first_not_of(" \t\r"));
        str.erase(str.find_last_not_of(" \t\r") + 1);
    }

    /**
     * @brief Remove surrounding quotes from string value
     * @param value String value to unquote (modified in place)
     */
    static void unquote(std::string& value) {
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }
    }
};

} // namespace senate
