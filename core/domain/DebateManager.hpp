#pragma once

#include "../Event.hpp"
#include "../EventFactory.hpp"
#include "../IClock.hpp"
#include "../ports/IContentGenerator.hpp"
#include "../ports/IDebateSink.hpp"
#include "../ports/IEventBus.hpp"
#include <chrono>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace senate::domain {

enum class DebateState {
    NotStarted,
    InProgress,
    Ended
};

enum class InterjectionRuling {
    Allowed,
    Denied,
    Discarded
};

std::string debateStateToString(DebateState state);
std::string interjectionRulingToString(InterjectionRuling ruling);

// Chamber etiquette: a senior senator may always interrupt a junior one, and
// peers may only interrupt each other on a point of order.
bool isInterruptionAllowed(int interjectorRank, int speakerRank, InterjectionType type);

struct InterjectionRecord {
    std::string eventId;
    Senator interjector;
    Senator targetSpeaker;
    InterjectionType interjectionType = InterjectionType::Informational;
    std::string englishText;
    bool allowed = false;
    std::string timestamp;
};

using StanceHintProvider = std::function<std::optional<Stance>(const Senator&, const std::string&)>;

// Orchestrates one debate: speaker queue, lifecycle events and interjection
// arbitration. Senators act autonomously on the same bus.
class DebateManager {
public:
    static constexpr int SUBSCRIBER_PRIORITY = 100;
    static constexpr const char* SUBSCRIBER_ID = "debate-manager";

    DebateManager(std::shared_ptr<ports::IEventBus> bus,
                  std::shared_ptr<IClock> clock,
                  std::shared_ptr<ports::IDebateSink> sink = nullptr,
                  std::chrono::milliseconds speechPause = std::chrono::milliseconds(0));
    ~DebateManager();

    DebateManager(const DebateManager&) = delete;
    DebateManager& operator=(const DebateManager&) = delete;

    bool startDebate(const std::string& topic, const std::vector<Senator>& senators);
    bool registerSpeaker(const Senator& senator);
    std::optional<Senator> nextSpeaker();
    EventPtr publishSpeech(const Senator& speaker,
                           const std::string& topic,
                           SpeechContent content,
                           Stance stance,
                           std::vector<std::string> keyPoints = {});
    bool changeTopic(const std::string& newTopic);
    InterjectionRuling handleInterjection(const Event& event);
    void handleReaction(const Event& event);
    std::optional<ports::DebateSummary> endDebate();

    // Runs a whole debate: every queued senator speaks once, in order.
    std::optional<ports::DebateSummary> conductDebate(const std::string& topic,
                                                      const std::vector<Senator>& senators,
                                                      ports::IContentGenerator& generator);

    void setStanceHintProvider(StanceHintProvider provider) { stanceHintProvider_ = std::move(provider); }
    void setSpeechPause(std::chrono::milliseconds pause) { speechPause_ = pause; }

    DebateState state() const { return state_; }
    bool debateInProgress() const { return state_ == DebateState::InProgress; }
    const std::string& currentTopic() const { return currentTopic_; }
    const std::optional<Senator>& currentSpeaker() const { return currentSpeaker_; }
    const std::deque<Senator>& registeredSpeakers() const { return speakerQueue_; }
    const std::vector<InterjectionRecord>& interjectionLog() const { return interjectionLog_; }
    std::size_t reactionCount() const { return reactionCount_; }

private:
    bool isQueued(const std::string& senatorId) const;
    void addParticipant(const Senator& senator);
    std::vector<std::string> participantNames() const;
    ports::DebateSummary buildSummary() const;

    std::shared_ptr<ports::IEventBus> bus_;
    std::shared_ptr<IClock> clock_;
    std::shared_ptr<ports::IDebateSink> sink_;
    std::chrono::milliseconds speechPause_;
    EventFactory factory_;
    StanceHintProvider stanceHintProvider_;

    DebateState state_ = DebateState::NotStarted;
    std::string currentTopic_;
    std::optional<Senator> currentSpeaker_;
    std::deque<Senator> speakerQueue_;
    std::vector<Senator> participants_;

    std::vector<ports::PriorSpeech> priorSpeeches_;
    std::map<std::string, std::size_t> speechCounts_;
    std::vector<InterjectionRecord> interjectionLog_;
    std::size_t reactionCount_ = 0;
    std::chrono::system_clock::time_point startedAt_;
};

} // namespace senate::domain
