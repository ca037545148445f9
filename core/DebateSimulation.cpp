#include "DebateSimulation.hpp"
#include "adapters/TimeoutContentGenerator.hpp"
#include "sim/TemplateContentGenerator.hpp"
#include <iostream>
#include <set>
#include <stdexcept>

namespace senate {

SimulationConfig SimulationConfig::defaults() {
    SimulationConfig config;
    config.topic = "Land Reform";
    config.senators = {
        {{"cicero", "Marcus Tullius Cicero", "Optimates", 4}, Stance::Neutral},
        {{"cato", "Marcus Porcius Cato", "Optimates", 3}, Stance::Oppose},
        {{"gracchus", "Tiberius Gracchus", "Populares", 2}, Stance::Support},
    };
    return config;
}

DebateSimulation::DebateSimulation(std::shared_ptr<IClock> clock,
                                   std::shared_ptr<ports::IDebateSink> sink)
    : clock_(std::move(clock)), sink_(std::move(sink)) {
    if (!clock_) {
        throw std::invalid_argument("DebateSimulation requires a clock");
    }
}

DebateSimulation::~DebateSimulation() {
    teardown();
}

void DebateSimulation::teardown() {
    agents_.clear();
    manager_.reset();
    policy_.reset();
    bus_.reset();
}

std::shared_ptr<IRng> DebateSimulation::makeRng(std::uint32_t offset) const {
    if (config_.seed) {
        return std::make_shared<StandardRng>(*config_.seed + offset);
    }
    return std::make_shared<StandardRng>();
}

void DebateSimulation::configure(const SimulationConfig& config) {
    if (config.senators.empty()) {
        throw std::invalid_argument("simulation needs at least one senator");
    }

    std::set<std::string> ids;
    for (const auto& profile : config.senators) {
        if (!ids.insert(profile.senator.id).second) {
            throw std::invalid_argument("duplicate senator id: " + profile.senator.id);
        }
    }

    teardown();
    config_ = config;

    bus_ = std::make_shared<domain::EventBus>(config_.historySize);
    policy_ = std::make_shared<adapters::DefaultDecisionPolicy>(config_.policy);
    manager_ = std::make_unique<domain::DebateManager>(bus_, clock_, sink_, config_.speechPause);

    std::uint32_t offset = 1;
    for (const auto& profile : config_.senators) {
        auto agent = std::make_unique<domain::SenatorAgent>(profile.senator, bus_, makeRng(offset++),
                                                            clock_, policy_, sink_);
        if (profile.initialStance) {
            agent->assignStance(config_.topic, *profile.initialStance);
        }
        agents_.push_back(std::move(agent));
    }

    // Speakers argue the position their agent currently holds.
    manager_->setStanceHintProvider([this](const Senator& speaker, const std::string& topic) -> std::optional<Stance> {
        const auto* speakerAgent = agent(speaker.id);
        if (!speakerAgent) {
            return std::nullopt;
        }
        return speakerAgent->stanceOn(topic);
    });

    std::cout << "[Simulation] Configured debate on '" << config_.topic << "' with "
              << agents_.size() << " senators" << std::endl;
}

std::optional<ports::DebateSummary> DebateSimulation::run() {
    return run(std::make_shared<sim::TemplateContentGenerator>(makeRng(0)));
}

std::optional<ports::DebateSummary> DebateSimulation::run(std::shared_ptr<ports::IContentGenerator> generator) {
    if (!isConfigured()) {
        throw std::logic_error("DebateSimulation::run called before configure");
    }
    if (!generator) {
        throw std::invalid_argument("DebateSimulation::run requires a generator");
    }

    std::shared_ptr<ports::IContentGenerator> effective = generator;
    if (config_.generatorTimeout.count() > 0) {
        effective = std::make_shared<adapters::TimeoutContentGenerator>(generator, config_.generatorTimeout);
    }

    return manager_->conductDebate(config_.topic, senators(), *effective);
}

domain::SenatorAgent* DebateSimulation::agent(const std::string& senatorId) const {
    for (const auto& candidate : agents_) {
        if (candidate->senator().id == senatorId) {
            return candidate.get();
        }
    }
    return nullptr;
}

std::vector<Senator> DebateSimulation::senators() const {
    std::vector<Senator> result;
    result.reserve(config_.senators.size());
    for (const auto& profile : config_.senators) {
        result.push_back(profile.senator);
    }
    return result;
}

} // namespace senate
