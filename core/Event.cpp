#include "Event.hpp"
#include <unordered_map>

namespace senate {

namespace {

template<typename Enum>
std::optional<Enum> lookup(const std::unordered_map<std::string, Enum>& table, const std::string& str) {
    auto it = table.find(str);
    if (it == table.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace

std::string Event::referencedEventId() const {
    if (const auto* r = reaction()) {
        return r->targetEventId;
    }
    if (const auto* i = interjection()) {
        return i->targetSpeechId;
    }
    return {};
}

std::string Event::sourceName() const {
    return source ? source->name : "Unknown";
}

bool causesDisruption(InterjectionType type) {
    return type == InterjectionType::Procedural || type == InterjectionType::Emotional;
}

std::string stanceToString(Stance stance) {
    switch (stance) {
        case Stance::Support: return "support";
        case Stance::Oppose: return "oppose";
        case Stance::Neutral: return "neutral";
    }
    return "neutral";
}

std::optional<Stance> stringToStance(const std::string& str) {
    static const std::unordered_map<std::string, Stance> stringMap = {
        {"support", Stance::Support},
        {"oppose", Stance::Oppose},
        {"neutral", Stance::Neutral}
    };
    return lookup(stringMap, str);
}

std::string eventTypeToString(EventType type) {
    switch (type) {
        case EventType::Debate: return "debate";
        case EventType::Speech: return "speech";
        case EventType::Reaction: return "reaction";
        case EventType::Interjection: return "interjection";
    }
    return "unknown";
}

std::optional<EventType> stringToEventType(const std::string& str) {
    static const std::unordered_map<std::string, EventType> stringMap = {
        {"debate", EventType::Debate},
        {"speech", EventType::Speech},
        {"reaction", EventType::Reaction},
        {"interjection", EventType::Interjection}
    };
    return lookup(stringMap, str);
}

std::string debateEventTypeToString(DebateEventType type) {
    switch (type) {
        case DebateEventType::DebateStart: return "debate_start";
        case DebateEventType::DebateEnd: return "debate_end";
        case DebateEventType::SpeakerChange: return "speaker_change";
        case DebateEventType::TopicChange: return "topic_change";
    }
    return "unknown";
}

std::optional<DebateEventType> stringToDebateEventType(const std::string& str) {
    static const std::unordered_map<std::string, DebateEventType> stringMap = {
        {"debate_start", DebateEventType::DebateStart},
        {"debate_end", DebateEventType::DebateEnd},
        {"speaker_change", DebateEventType::SpeakerChange},
        {"topic_change", DebateEventType::TopicChange}
    };
    return lookup(stringMap, str);
}

std::string reactionTypeToString(ReactionType type) {
    switch (type) {
        case ReactionType::Agreement: return "agreement";
        case ReactionType::Disagreement: return "disagreement";
        case ReactionType::Interest: return "interest";
        case ReactionType::Boredom: return "boredom";
        case ReactionType::Skepticism: return "skepticism";
        case ReactionType::Neutral: return "neutral";
    }
    return "neutral";
}

std::optional<ReactionType> stringToReactionType(const std::string& str) {
    static const std::unordered_map<std::string, ReactionType> stringMap = {
        {"agreement", ReactionType::Agreement},
        {"disagreement", ReactionType::Disagreement},
        {"interest", ReactionType::Interest},
        {"boredom", ReactionType::Boredom},
        {"skepticism", ReactionType::Skepticism},
        {"neutral", ReactionType::Neutral}
    };
    return lookup(stringMap, str);
}

std::string interjectionTypeToString(InterjectionType type) {
    switch (type) {
        case InterjectionType::Support: return "support";
        case InterjectionType::Challenge: return "challenge";
        case InterjectionType::Procedural: return "procedural";
        case InterjectionType::Emotional: return "emotional";
        case InterjectionType::Informational: return "informational";
    }
    return "informational";
}

std::optional<InterjectionType> stringToInterjectionType(const std::string& str) {
    static const std::unordered_map<std::string, InterjectionType> stringMap = {
        {"support", InterjectionType::Support},
        {"challenge", InterjectionType::Challenge},
        {"procedural", InterjectionType::Procedural},
        {"emotional", InterjectionType::Emotional},
        {"informational", InterjectionType::Informational}
    };
    return lookup(stringMap, str);
}

} // namespace senate
