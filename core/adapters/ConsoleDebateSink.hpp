#pragma once

#include "../ports/IDebateSink.hpp"
#include <iostream>
#include <ostream>

namespace senate::adapters {

// Plain-text chamber transcript.
class ConsoleDebateSink : public ports::IDebateSink {
public:
    explicit ConsoleDebateSink(std::ostream& out = std::cout) : out_(out) {}

    void onDebateStarted(const std::string& topic, const std::vector<std::string>& participants) override;
    void onSpeech(const Event& speech) override;
    void onReaction(const Event& reaction) override;
    void onInterjection(const Event& interjection, bool disruptsSpeech) override;
    void onStanceChange(const ports::StanceChangeNotice& notice) override;
    void onDebateEnded(const ports::DebateSummary& summary) override;

private:
    std::ostream& out_;
};

} // namespace senate::adapters
