#pragma once

#include "Event.hpp"
#include "IClock.hpp"
#include <memory>

namespace senate {

// Builds immutable events with a fresh UUID, the clock's timestamp and a
// priority taken from the source senator's rank.
class EventFactory {
public:
    explicit EventFactory(std::shared_ptr<IClock> clock);

    EventPtr debateEvent(DebateEventType kind,
                         const std::string& topic,
                         const std::vector<std::string>& participants,
                         std::optional<Senator> source = std::nullopt,
                         Metadata metadata = {},
                         const std::string& previousTopic = {}) const;

    EventPtr speechEvent(const Senator& speaker,
                         const std::string& topic,
                         SpeechContent content,
                         Stance stance,
                         std::vector<std::string> keyPoints) const;

    EventPtr reactionEvent(const Senator& reactor,
                           const Event& target,
                           ReactionType reactionType,
                           const std::string& content) const;

    EventPtr interjectionEvent(const Senator& interjector,
                               const Senator& targetSpeaker,
                               InterjectionType interjectionType,
                               const std::string& latinText,
                               const std::string& englishText,
                               const std::string& targetSpeechId) const;

    const IClock& clock() const { return *clock_; }

private:
    std::shared_ptr<Event> makeEnvelope(EventType type, std::optional<Senator> source) const;

    std::shared_ptr<IClock> clock_;
};

} // namespace senate
