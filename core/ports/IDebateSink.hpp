#pragma once

#include "../Event.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace senate::ports {

struct StanceChangeNotice {
    Senator senator;
    std::string topic;
    Stance oldStance = Stance::Neutral;
    Stance newStance = Stance::Neutral;
    std::string reason;
    std::string eventId;
};

struct DebateSummary {
    std::string topic;
    std::vector<std::string> participants;
    std::size_t speechCount = 0;
    std::size_t reactionCount = 0;
    std::size_t interjectionCount = 0;
    std::size_t allowedInterjections = 0;
    std::string mostActiveSpeaker;
    double durationSeconds = 0.0;
};

// Display/log collaborator. Receives well-formed notifications only; rendering
// is the implementation's concern.
class IDebateSink {
public:
    virtual ~IDebateSink() = default;

    virtual void onDebateStarted(const std::string& topic, const std::vector<std::string>& participants) = 0;
    virtual void onSpeech(const Event& speech) = 0;
    virtual void onReaction(const Event& reaction) = 0;
    virtual void onInterjection(const Event& interjection, bool disruptsSpeech) = 0;
    virtual void onStanceChange(const StanceChangeNotice& notice) = 0;
    virtual void onDebateEnded(const DebateSummary& summary) = 0;
};

} // namespace senate::ports
