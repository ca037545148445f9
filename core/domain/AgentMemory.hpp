#pragma once

#include "../Event.hpp"
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace senate::domain {

struct EventRecord {
    std::string eventId;
    EventType eventType = EventType::Debate;
    std::string timestamp;
    std::string sourceName;
    Metadata metadata;
};

struct ReactionRecord {
    std::string eventId;
    ReactionType reactionType = ReactionType::Neutral;
    std::string content;
    std::string timestamp;
};

struct StanceChangeRecord {
    Stance oldStance = Stance::Neutral;
    Stance newStance = Stance::Neutral;
    std::string reason;
    std::string eventId;
    std::string timestamp;
};

struct RelationshipImpact {
    std::string eventId;
    double impact = 0.0;
    std::string reason;
    std::string timestamp;
};

// Per-senator, append-only record of observed events and own decisions.
// Queries are answered from indices kept alongside the logs.
class AgentMemory {
public:
    static constexpr double MIN_RELATIONSHIP = -1.0;
    static constexpr double MAX_RELATIONSHIP = 1.0;

    void recordEvent(const Event& event);
    void recordReaction(const std::string& eventId, ReactionType reactionType,
                        const std::string& content, const std::string& timestamp);
    void recordStanceChange(const std::string& topic, Stance oldStance, Stance newStance,
                            const std::string& reason, const std::string& eventId,
                            const std::string& timestamp);
    void recordRelationshipImpact(const std::string& senatorName, const std::string& eventId,
                                  double impact, const std::string& reason,
                                  const std::string& timestamp);

    std::vector<EventRecord> eventsByType(EventType type) const;
    std::vector<EventRecord> eventsBySource(const std::string& sourceName) const;
    std::vector<ReactionRecord> reactionsTo(const std::string& eventId) const;
    const std::vector<StanceChangeRecord>& stanceChangesFor(const std::string& topic) const;
    const std::vector<RelationshipImpact>& relationshipImpactsBy(const std::string& senatorName) const;
    std::vector<EventRecord> recentEvents(std::size_t count) const;

    double relationshipScore(const std::string& senatorName) const;
    bool hasEvent(const std::string& eventId) const;

    const std::vector<EventRecord>& eventHistory() const { return eventHistory_; }
    const std::vector<ReactionRecord>& reactionHistory() const { return reactionHistory_; }
    const std::map<std::string, std::vector<StanceChangeRecord>>& stanceChanges() const { return stanceChanges_; }
    const std::map<std::string, std::vector<RelationshipImpact>>& relationshipImpacts() const { return relationshipImpacts_; }
    const std::map<std::string, double>& relationshipScores() const { return relationshipScores_; }

private:
    std::vector<EventRecord> collect(const std::vector<std::size_t>& indices) const;

    std::vector<EventRecord> eventHistory_;
    std::vector<ReactionRecord> reactionHistory_;
    std::map<std::string, std::vector<StanceChangeRecord>> stanceChanges_;
    std::map<std::string, std::vector<RelationshipImpact>> relationshipImpacts_;
    std::map<std::string, double> relationshipScores_;

    std::unordered_map<EventType, std::vector<std::size_t>> byType_;
    std::unordered_map<std::string, std::vector<std::size_t>> bySource_;
    std::unordered_map<std::string, std::size_t> byId_;
    std::unordered_map<std::string, std::vector<std::size_t>> reactionsByEvent_;
};

} // namespace senate::domain
