#pragma once

#include "../ports/IDebateSink.hpp"
#include <string>
#include <vector>

namespace senate::sim {

struct RecordedInterjection {
    Event event;
    bool disruptsSpeech = false;
};

class RecordingDebateSink : public ports::IDebateSink {
public:
    void onDebateStarted(const std::string& topic, const std::vector<std::string>& participants) override {
        startedTopics.push_back(topic);
        lastParticipants = participants;
    }

    void onSpeech(const Event& speech) override { speeches.push_back(speech); }
    void onReaction(const Event& reaction) override { reactions.push_back(reaction); }

    void onInterjection(const Event& interjection, bool disruptsSpeech) override {
        interjections.push_back({interjection, disruptsSpeech});
    }

    void onStanceChange(const ports::StanceChangeNotice& notice) override { stanceChanges.push_back(notice); }
    void onDebateEnded(const ports::DebateSummary& summary) override { summaries.push_back(summary); }

    void clear() {
        startedTopics.clear();
        lastParticipants.clear();
        speeches.clear();
        reactions.clear();
        interjections.clear();
        stanceChanges.clear();
        summaries.clear();
    }

    std::vector<std::string> startedTopics;
    std::vector<std::string> lastParticipants;
    std::vector<Event> speeches;
    std::vector<Event> reactions;
    std::vector<RecordedInterjection> interjections;
    std::vector<ports::StanceChangeNotice> stanceChanges;
    std::vector<ports::DebateSummary> summaries;
};

} // namespace senate::sim
