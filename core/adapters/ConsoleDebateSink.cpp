#include "ConsoleDebateSink.hpp"
#include <iomanip>

namespace senate::adapters {

void ConsoleDebateSink::onDebateStarted(const std::string& topic, const std::vector<std::string>& participants) {
    out_ << "\n=== Debate: " << topic << " ===\n";
    out_ << "Participants:";
    for (const auto& name : participants) {
        out_ << " " << name;
    }
    out_ << "\n" << std::endl;
}

void ConsoleDebateSink::onSpeech(const Event& speech) {
    const auto* payload = speech.speech();
    if (!payload) return;

    out_ << payload->speaker.name << " (" << payload->speaker.faction << ", "
         << stanceToString(payload->stance) << "):\n";
    out_ << "  " << payload->content.text << "\n";
    if (!payload->content.localizedText.empty()) {
        out_ << "  [" << payload->content.localizedText << "]\n";
    }
    for (const auto& point : payload->keyPoints) {
        out_ << "  - " << point << "\n";
    }
    out_ << std::flush;
}

void ConsoleDebateSink::onReaction(const Event& reaction) {
    const auto* payload = reaction.reaction();
    if (!payload) return;

    out_ << "    * " << payload->reactor.name << " " << payload->content
         << " (" << reactionTypeToString(payload->reactionType) << ")" << std::endl;
}

void ConsoleDebateSink::onInterjection(const Event& interjection, bool disruptsSpeech) {
    const auto* payload = interjection.interjection();
    if (!payload) return;

    out_ << "    ! " << payload->interjector.name << " interrupts " << payload->targetSpeaker.name
         << ": \"" << payload->latinText << "\" (" << payload->englishText << ")";
    if (disruptsSpeech && payload->causesDisruption) {
        out_ << " [disruption]";
    }
    out_ << std::endl;
}

void ConsoleDebateSink::onStanceChange(const ports::StanceChangeNotice& notice) {
    out_ << "    ~ " << notice.senator.name << " now " << stanceToString(notice.newStance)
         << " (was " << stanceToString(notice.oldStance) << "): " << notice.reason << std::endl;
}

void ConsoleDebateSink::onDebateEnded(const ports::DebateSummary& summary) {
    out_ << "\n=== Debate concluded: " << summary.topic << " ===\n"
         << "Speeches: " << summary.speechCount
         << "  Reactions: " << summary.reactionCount
         << "  Interjections: " << summary.interjectionCount
         << " (" << summary.allowedInterjections << " allowed)\n";
    if (!summary.mostActiveSpeaker.empty()) {
        out_ << "Most active: " << summary.mostActiveSpeaker << "\n";
    }
    out_ << "Duration: " << std::fixed << std::setprecision(2) << summary.durationSeconds << "s" << std::endl;
}

} // namespace senate::adapters
