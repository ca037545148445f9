/**
 * @file DebateSimulation.hpp
 * @brief Wiring for a complete senate debate
 *
 * Assembles the event bus, one autonomous agent per configured senator, the
 * debate manager and the decision policy, then runs a full debate through
 * the content generator. Used by the CLI and the end-to-end tests.
 *
 * @note Each simulation owns its own bus; simulations never share state
 * @note All randomness is seeded per agent so a fixed seed replays a debate
 */

#pragma once

#include "Event.hpp"
#include "IClock.hpp"
#include "IRng.hpp"
#include "adapters/DefaultPolicies.hpp"
#include "domain/DebateManager.hpp"
#include "domain/EventBus.hpp"
#include "domain/SenatorAgent.hpp"
#include "ports/IContentGenerator.hpp"
#include "ports/IDebateSink.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace senate {

/**
 * @brief A configured participant and the stance it brings into the chamber
 *
 * When no initial stance is given the agent picks one at random when the
 * debate opens.
 */
struct SenatorProfile {
    Senator senator;
    std::optional<Stance> initialStance;
};

/**
 * @brief In-memory form of the debate configuration
 *
 * Populated from defaults or from the TOML loader in platform/desktop.
 */
struct SimulationConfig {
    std::string topic = "Land Reform";                           ///< Debate topic
    std::optional<std::uint32_t> seed;                           ///< Fixed seed for reproducible runs
    std::size_t historySize = domain::EventBus::DEFAULT_MAX_HISTORY; ///< Event bus history capacity
    std::chrono::milliseconds speechPause{0};                    ///< Pause between speeches
    std::chrono::milliseconds generatorTimeout{2000};            ///< Speech generation deadline, 0 disables
    adapters::PolicySettings policy;                             ///< Probability constants
    std::vector<SenatorProfile> senators;                        ///< Participants in speaking order

    /**
     * @brief Three-senator "Land Reform" debate used when no file is given
     * @return Configuration with ranks 4, 3 and 2 across two factions
     */
    static SimulationConfig defaults();
};

/**
 * @brief Complete debate simulation
 *
 * Owns the bus, the agents and the manager. Agents are destroyed before the
 * manager and the manager before the bus so every subscription is released
 * against a live bus.
 */
class DebateSimulation {
public:
    /**
     * @brief Construct simulation with dependency injection
     * @param clock Clock shared by every component for timestamps
     * @param sink Optional display sink for speeches, reactions and rulings
     */
    explicit DebateSimulation(std::shared_ptr<IClock> clock,
                              std::shared_ptr<ports::IDebateSink> sink = nullptr);
    ~DebateSimulation();

    DebateSimulation(const DebateSimulation&) = delete;
    DebateSimulation& operator=(const DebateSimulation&) = delete;

    /**
     * @brief Build the bus, agents and manager for a configuration
     * @param config Debate configuration
     * @throws std::invalid_argument if no senators are configured or ids repeat
     * @post Any previous debate state is discarded
     */
    void configure(const SimulationConfig& config);

    /**
     * @brief Run one debate with the built-in template generator
     * @return Debate summary, or std::nullopt if the debate could not start
     * @pre configure() has been called
     */
    std::optional<ports::DebateSummary> run();

    /**
     * @brief Run one debate with a caller-supplied generator
     * @param generator Speech generator, wrapped with the configured timeout
     * @return Debate summary, or std::nullopt if the debate could not start
     * @pre configure() has been called
     */
    std::optional<ports::DebateSummary> run(std::shared_ptr<ports::IContentGenerator> generator);

    bool isConfigured() const { return manager_ != nullptr; }
    const SimulationConfig& config() const { return config_; }

    domain::EventBus& bus() { return *bus_; }
    domain::DebateManager& manager() { return *manager_; }
    const std::vector<std::unique_ptr<domain::SenatorAgent>>& agents() const { return agents_; }

    /**
     * @brief Look up an agent by senator id
     * @return Agent pointer, or nullptr if no such senator is configured
     */
    domain::SenatorAgent* agent(const std::string& senatorId) const;

    std::vector<Senator> senators() const;

private:
    std::shared_ptr<IRng> makeRng(std::uint32_t offset) const;
    void teardown();

    std::shared_ptr<IClock> clock_;
    std::shared_ptr<ports::IDebateSink> sink_;
    SimulationConfig config_;

    std::shared_ptr<domain::EventBus> bus_;
    std::shared_ptr<adapters::DefaultDecisionPolicy> policy_;
    std::unique_ptr<domain::DebateManager> manager_;
    std::vector<std::unique_ptr<domain::SenatorAgent>> agents_;
};

} // namespace senate
