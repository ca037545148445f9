#pragma once

#include "Senator.hpp"
#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <variant>
#include <unordered_map>

namespace senate {

enum class EventType {
    Debate,
    Speech,
    Reaction,
    Interjection
};

enum class DebateEventType {
    DebateStart,
    DebateEnd,
    SpeakerChange,
    TopicChange
};

enum class ReactionType {
    Agreement,
    Disagreement,
    Interest,
    Boredom,
    Skepticism,
    Neutral
};

enum class InterjectionType {
    Support,
    Challenge,
    Procedural,
    Emotional,
    Informational
};

using Metadata = std::unordered_map<std::string, std::string>;

struct SpeechContent {
    std::string text;
    std::string localizedText;
};

struct DebatePayload {
    DebateEventType kind = DebateEventType::DebateStart;
    std::string topic;
    std::vector<std::string> participants;
    std::string previousTopic;
};

struct SpeechPayload {
    Senator speaker;
    std::string topic;
    SpeechContent content;
    Stance stance = Stance::Neutral;
    std::vector<std::string> keyPoints;
};

struct ReactionPayload {
    Senator reactor;
    std::string targetEventId;
    EventType targetEventType = EventType::Speech;
    ReactionType reactionType = ReactionType::Neutral;
    std::string content;
};

struct InterjectionPayload {
    Senator interjector;
    Senator targetSpeaker;
    InterjectionType interjectionType = InterjectionType::Informational;
    std::string latinText;
    std::string englishText;
    std::string targetSpeechId;
    bool causesDisruption = false;
};

using EventPayload = std::variant<DebatePayload, SpeechPayload, ReactionPayload, InterjectionPayload>;

struct Event {
    std::string id;
    EventType type = EventType::Debate;
    std::string timestamp;
    std::optional<Senator> source;
    Metadata metadata;
    int priority = 0;
    EventPayload payload;

    const DebatePayload* debate() const { return std::get_if<DebatePayload>(&payload); }
    const SpeechPayload* speech() const { return std::get_if<SpeechPayload>(&payload); }
    const ReactionPayload* reaction() const { return std::get_if<ReactionPayload>(&payload); }
    const InterjectionPayload* interjection() const { return std::get_if<InterjectionPayload>(&payload); }

    // Id of the event a reaction or interjection refers to, empty otherwise.
    std::string referencedEventId() const;
    std::string sourceName() const;
};

using EventPtr = std::shared_ptr<const Event>;

bool causesDisruption(InterjectionType type);

std::string eventTypeToString(EventType type);
std::optional<EventType> stringToEventType(const std::string& str);

std::string debateEventTypeToString(DebateEventType type);
std::optional<DebateEventType> stringToDebateEventType(const std::string& str);

std::string reactionTypeToString(ReactionType type);
std::optional<ReactionType> stringToReactionType(const std::string& str);

std::string interjectionTypeToString(InterjectionType type);
std::optional<InterjectionType> stringToInterjectionType(const std::string& str);

} // namespace senate
