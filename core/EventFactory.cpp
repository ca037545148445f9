#include "EventFactory.hpp"
#include "../crypto/Uuid.hpp"

namespace senate {

EventFactory::EventFactory(std::shared_ptr<IClock> clock)
    : clock_(std::move(clock)) {
}

std::shared_ptr<Event> EventFactory::makeEnvelope(EventType type, std::optional<Senator> source) const {
    auto event = std::make_shared<Event>();
    event->id = Uuid::generateV4();
    event->type = type;
    event->timestamp = clock_->iso8601();
    event->priority = source ? source->rank : 0;
    event->source = std::move(source);
    return event;
}

EventPtr EventFactory::debateEvent(DebateEventType kind,
                                   const std::string& topic,
                                   const std::vector<std::string>& participants,
                                   std::optional<Senator> source,
                                   Metadata metadata,
                                   const std::string& previousTopic) const {
    auto event = makeEnvelope(EventType::Debate, std::move(source));
    event->metadata = std::move(metadata);
    event->metadata["topic"] = topic;
    event->metadata["debate_event_type"] = debateEventTypeToString(kind);

    DebatePayload payload;
    payload.kind = kind;
    payload.topic = topic;
    payload.participants = participants;
    payload.previousTopic = previousTopic;
    event->payload = std::move(payload);
    return event;
}

EventPtr EventFactory::speechEvent(const Senator& speaker,
                                   const std::string& topic,
                                   SpeechContent content,
                                   Stance stance,
                                   std::vector<std::string> keyPoints) const {
    auto event = makeEnvelope(EventType::Speech, speaker);
    event->metadata["topic"] = topic;
    event->metadata["stance"] = stanceToString(stance);
    event->metadata["speaker_faction"] = speaker.faction;

    SpeechPayload payload;
    payload.speaker = speaker;
    payload.topic = topic;
    payload.content = std::move(content);
    payload.stance = stance;
    payload.keyPoints = std::move(keyPoints);
    event->payload = std::move(payload);
    return event;
}

EventPtr EventFactory::reactionEvent(const Senator& reactor,
                                     const Event& target,
                                     ReactionType reactionType,
                                     const std::string& content) const {
    auto event = makeEnvelope(EventType::Reaction, reactor);
    event->metadata["reaction_type"] = reactionTypeToString(reactionType);
    event->metadata["target_event_id"] = target.id;

    ReactionPayload payload;
    payload.reactor = reactor;
    payload.targetEventId = target.id;
    payload.targetEventType = target.type;
    payload.reactionType = reactionType;
    payload.content = content;
    event->payload = std::move(payload);
    return event;
}

EventPtr EventFactory::interjectionEvent(const Senator& interjector,
                                         const Senator& targetSpeaker,
                                         InterjectionType interjectionType,
                                         const std::string& latinText,
                                         const std::string& englishText,
                                         const std::string& targetSpeechId) const {
    auto event = makeEnvelope(EventType::Interjection, interjector);
    event->metadata["interjection_type"] = interjectionTypeToString(interjectionType);
    event->metadata["target_speaker"] = targetSpeaker.name;
    event->metadata["target_speech_id"] = targetSpeechId;

    InterjectionPayload payload;
    payload.interjector = interjector;
    payload.targetSpeaker = targetSpeaker;
    payload.interjectionType = interjectionType;
    payload.latinText = latinText;
    payload.englishText = englishText;
    payload.targetSpeechId = targetSpeechId;
    payload.causesDisruption = causesDisruption(interjectionType);
    event->payload = std::move(payload);
    return event;
}

} // namespace senate
