#pragma once

#include "AgentMemory.hpp"
#include "../Event.hpp"
#include "../EventFactory.hpp"
#include "../IClock.hpp"
#include "../IRng.hpp"
#include "../ports/IDebateSink.hpp"
#include "../ports/IDecisionPolicy.hpp"
#include "../ports/IEventBus.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace senate::domain {

enum class AgentState {
    Idle,
    Observing,
    Speaking
};

std::string agentStateToString(AgentState state);

struct ReactionDecision {
    double probability = 0.0;
    double roll = 1.0;
    bool react = false;
    ReactionType reactionType = ReactionType::Neutral;
};

struct InterjectionDecision {
    double probability = 0.0;
    double roll = 1.0;
    bool interject = false;
    bool orderViolation = false;
    InterjectionType interjectionType = InterjectionType::Informational;
};

struct StanceChangeDecision {
    double probability = 0.0;
    double roll = 1.0;
    bool change = false;
    Stance oldStance = Stance::Neutral;
    Stance newStance = Stance::Neutral;
};

// Autonomous participant. Listens to Debate and Speech events, keeps its own
// memory and stance per topic, and answers speeches with reactions,
// interjections and occasional stance changes.
class SenatorAgent {
public:
    static constexpr double AGREEMENT_IMPACT = 0.05;
    static constexpr double SUPPORT_IMPACT = 0.1;
    static constexpr double EMOTIONAL_IMPACT = -0.2;

    SenatorAgent(Senator senator,
                 std::shared_ptr<ports::IEventBus> bus,
                 std::shared_ptr<IRng> rng,
                 std::shared_ptr<IClock> clock,
                 std::shared_ptr<ports::IDecisionPolicy> policy,
                 std::shared_ptr<ports::IDebateSink> sink = nullptr);
    ~SenatorAgent();

    SenatorAgent(const SenatorAgent&) = delete;
    SenatorAgent& operator=(const SenatorAgent&) = delete;

    void onSpeech(const Event& event);
    void onDebate(const Event& event);

    // Pure decisions given the current memory and stance. Each call draws from the RNG.
    ReactionDecision decideReaction(const Event& speech);
    InterjectionDecision decideInterjection(const Event& speech);
    StanceChangeDecision decideStanceChange(const Event& speech);

    void assignStance(const std::string& topic, Stance stance);
    void adjustRelationship(const std::string& senatorName, double delta, const std::string& reason);

    const Senator& senator() const { return senator_; }
    const std::string& subscriberId() const { return subscriberId_; }
    AgentState state() const { return state_; }
    const AgentMemory& memory() const { return memory_; }
    const std::string& activeTopic() const { return activeTopic_; }
    const std::optional<Senator>& currentSpeaker() const { return currentSpeaker_; }
    bool debateInProgress() const { return debateInProgress_; }

    std::optional<Stance> stanceOn(const std::string& topic) const;
    std::optional<Stance> currentStance() const { return stanceOn(activeTopic_); }

private:
    void react(const Event& speech);
    void interject(const Event& speech);
    void considerStanceChange(const Event& speech);
    void ensureStance(const std::string& topic);
    std::string pick(const std::vector<std::string>& options);
    std::string logTag() const;

    Senator senator_;
    std::string subscriberId_;
    std::shared_ptr<ports::IEventBus> bus_;
    std::shared_ptr<IRng> rng_;
    std::shared_ptr<IClock> clock_;
    std::shared_ptr<ports::IDecisionPolicy> policy_;
    std::shared_ptr<ports::IDebateSink> sink_;
    EventFactory factory_;

    AgentMemory memory_;
    AgentState state_ = AgentState::Idle;
    std::string activeTopic_;
    std::optional<Senator> currentSpeaker_;
    bool debateInProgress_ = false;
    std::map<std::string, Stance> stances_;
};

} // namespace senate::domain
