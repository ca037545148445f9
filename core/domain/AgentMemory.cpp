#include "AgentMemory.hpp"
#include <algorithm>

namespace senate::domain {

namespace {

const std::vector<StanceChangeRecord> kNoStanceChanges;
const std::vector<RelationshipImpact> kNoImpacts;

} // namespace

void AgentMemory::recordEvent(const Event& event) {
    EventRecord record;
    record.eventId = event.id;
    record.eventType = event.type;
    record.timestamp = event.timestamp;
    record.sourceName = event.sourceName();
    record.metadata = event.metadata;

    std::size_t index = eventHistory_.size();
    eventHistory_.push_back(std::move(record));

    const auto& stored = eventHistory_.back();
    byType_[stored.eventType].push_back(index);
    bySource_[stored.sourceName].push_back(index);
    byId_.emplace(stored.eventId, index);
}

void AgentMemory::recordReaction(const std::string& eventId, ReactionType reactionType,
                                 const std::string& content, const std::string& timestamp) {
    reactionsByEvent_[eventId].push_back(reactionHistory_.size());
    reactionHistory_.push_back({eventId, reactionType, content, timestamp});
}

void AgentMemory::recordStanceChange(const std::string& topic, Stance oldStance, Stance newStance,
                                     const std::string& reason, const std::string& eventId,
                                     const std::string& timestamp) {
    stanceChanges_[topic].push_back({oldStance, newStance, reason, eventId, timestamp});
}

void AgentMemory::recordRelationshipImpact(const std::string& senatorName, const std::string& eventId,
                                           double impact, const std::string& reason,
                                           const std::string& timestamp) {
    relationshipImpacts_[senatorName].push_back({eventId, impact, reason, timestamp});

    double& score = relationshipScores_[senatorName];
    score = std::clamp(score + impact, MIN_RELATIONSHIP, MAX_RELATIONSHIP);
}

std::vector<EventRecord> AgentMemory::eventsByType(EventType type) const {
    auto it = byType_.find(type);
    return it == byType_.end() ? std::vector<EventRecord>{} : collect(it->second);
}

std::vector<EventRecord> AgentMemory::eventsBySource(const std::string& sourceName) const {
    auto it = bySource_.find(sourceName);
    return it == bySource_.end() ? std::vector<EventRecord>{} : collect(it->second);
}

std::vector<ReactionRecord> AgentMemory::reactionsTo(const std::string& eventId) const {
    std::vector<ReactionRecord> result;
    auto it = reactionsByEvent_.find(eventId);
    if (it == reactionsByEvent_.end()) {
        return result;
    }
    result.reserve(it->second.size());
    for (std::size_t index : it->second) {
        result.push_back(reactionHistory_[index]);
    }
    return result;
}

const std::vector<StanceChangeRecord>& AgentMemory::stanceChangesFor(const std::string& topic) const {
    auto it = stanceChanges_.find(topic);
    return it == stanceChanges_.end() ? kNoStanceChanges : it->second;
}

const std::vector<RelationshipImpact>& AgentMemory::relationshipImpactsBy(const std::string& senatorName) const {
    auto it = relationshipImpacts_.find(senatorName);
    return it == relationshipImpacts_.end() ? kNoImpacts : it->second;
}

std::vector<EventRecord> AgentMemory::recentEvents(std::size_t count) const {
    std::size_t n = std::min(count, eventHistory_.size());
    return std::vector<EventRecord>(eventHistory_.end() - static_cast<std::ptrdiff_t>(n), eventHistory_.end());
}

double AgentMemory::relationshipScore(const std::string& senatorName) const {
    auto it = relationshipScores_.find(senatorName);
    return it == relationshipScores_.end() ? 0.0 : it->second;
}

bool AgentMemory::hasEvent(const std::string& eventId) const {
    return byId_.count(eventId) > 0;
}

std::vector<EventRecord> AgentMemory::collect(const std::vector<std::size_t>& indices) const {
    std::vector<EventRecord> result;
    result.reserve(indices.size());
    for (std::size_t index : indices) {
        result.push_back(eventHistory_[index]);
    }
    return result;
}

} // namespace senate::domain
