#include "DebateManager.hpp"
#include <algorithm>
#include <iostream>
#include <thread>

namespace senate::domain {

std::string debateStateToString(DebateState state) {
    switch (state) {
        case DebateState::NotStarted: return "not_started";
        case DebateState::InProgress: return "in_progress";
        case DebateState::Ended: return "ended";
    }
    return "not_started";
}

std::string interjectionRulingToString(InterjectionRuling ruling) {
    switch (ruling) {
        case InterjectionRuling::Allowed: return "allowed";
        case InterjectionRuling::Denied: return "denied";
        case InterjectionRuling::Discarded: return "discarded";
    }
    return "discarded";
}

bool isInterruptionAllowed(int interjectorRank, int speakerRank, InterjectionType type) {
    if (interjectorRank > speakerRank) {
        return true;
    }
    return interjectorRank == speakerRank && type == InterjectionType::Procedural;
}

DebateManager::DebateManager(std::shared_ptr<ports::IEventBus> bus,
                             std::shared_ptr<IClock> clock,
                             std::shared_ptr<ports::IDebateSink> sink,
                             std::chrono::milliseconds speechPause)
    : bus_(std::move(bus)),
      clock_(std::move(clock)),
      sink_(std::move(sink)),
      speechPause_(speechPause),
      factory_(clock_) {

    bus_->subscribe(EventType::Interjection, SUBSCRIBER_ID,
                    [this](const EventPtr& event) { handleInterjection(*event); },
                    SUBSCRIBER_PRIORITY);
    bus_->subscribe(EventType::Reaction, SUBSCRIBER_ID,
                    [this](const EventPtr& event) { handleReaction(*event); },
                    SUBSCRIBER_PRIORITY);
}

DebateManager::~DebateManager() {
    bus_->unsubscribeAll(SUBSCRIBER_ID);
}

bool DebateManager::isQueued(const std::string& senatorId) const {
    return std::any_of(speakerQueue_.begin(), speakerQueue_.end(),
                       [&](const Senator& s) { return s.id == senatorId; });
}

void DebateManager::addParticipant(const Senator& senator) {
    bool known = std::any_of(participants_.begin(), participants_.end(),
                             [&](const Senator& s) { return s.id == senator.id; });
    if (!known) {
        participants_.push_back(senator);
    }
}

std::vector<std::string> DebateManager::participantNames() const {
    std::vector<std::string> names;
    names.reserve(participants_.size());
    for (const auto& senator : participants_) {
        names.push_back(senator.name);
    }
    return names;
}

bool DebateManager::startDebate(const std::string& topic, const std::vector<Senator>& senators) {
    if (state_ == DebateState::InProgress) {
        std::cerr << "[DebateManager] Cannot start debate on '" << topic
                  << "': debate on '" << currentTopic_ << "' already in progress" << std::endl;
        return false;
    }

    currentTopic_ = topic;
    currentSpeaker_.reset();
    speakerQueue_.clear();
    participants_.clear();
    priorSpeeches_.clear();
    speechCounts_.clear();
    interjectionLog_.clear();
    reactionCount_ = 0;

    for (const auto& senator : senators) {
        if (!isQueued(senator.id)) {
            speakerQueue_.push_back(senator);
            addParticipant(senator);
        }
    }

    state_ = DebateState::InProgress;
    startedAt_ = clock_->now();

    auto names = participantNames();
    Metadata metadata;
    metadata["participant_count"] = std::to_string(names.size());
    metadata["participants"] = [&names] {
        std::string joined;
        for (const auto& name : names) {
            if (!joined.empty()) joined += ",";
            joined += name;
        }
        return joined;
    }();

    std::cout << "[DebateManager] Debate started on '" << topic << "' with "
              << names.size() << " participants" << std::endl;

    if (sink_) {
        sink_->onDebateStarted(topic, names);
    }
    bus_->publish(factory_.debateEvent(DebateEventType::DebateStart, topic, names,
                                       std::nullopt, std::move(metadata)));
    return true;
}

bool DebateManager::registerSpeaker(const Senator& senator) {
    if (isQueued(senator.id)) {
        return false;
    }
    speakerQueue_.push_back(senator);
    addParticipant(senator);
    return true;
}

std::optional<Senator> DebateManager::nextSpeaker() {
    if (state_ != DebateState::InProgress) {
        std::cerr << "[DebateManager] Cannot advance speaker: no debate in progress" << std::endl;
        return std::nullopt;
    }
    if (speakerQueue_.empty()) {
        return std::nullopt;
    }

    Senator speaker = speakerQueue_.front();
    speakerQueue_.pop_front();
    currentSpeaker_ = speaker;

    Metadata metadata;
    metadata["speaker_name"] = speaker.name;
    metadata["speaker_faction"] = speaker.faction;

    std::cout << "[DebateManager] Speaker: " << speaker.name << " (" << speaker.faction << ")" << std::endl;
    bus_->publish(factory_.debateEvent(DebateEventType::SpeakerChange, currentTopic_,
                                       participantNames(), speaker, std::move(metadata)));
    return speaker;
}

EventPtr DebateManager::publishSpeech(const Senator& speaker,
                                      const std::string& topic,
                                      SpeechContent content,
                                      Stance stance,
                                      std::vector<std::string> keyPoints) {
    auto event = factory_.speechEvent(speaker, topic, std::move(content), stance, std::move(keyPoints));
    const auto& payload = *event->speech();

    ++speechCounts_[speaker.name];
    priorSpeeches_.push_back({speaker.name, stance, payload.keyPoints});

    if (sink_) {
        sink_->onSpeech(*event);
    }
    bus_->publish(event);
    return event;
}

bool DebateManager::changeTopic(const std::string& newTopic) {
    if (state_ != DebateState::InProgress) {
        std::cerr << "[DebateManager] Cannot change topic to '" << newTopic
                  << "': no debate in progress" << std::endl;
        return false;
    }

    std::string previous = currentTopic_;
    currentTopic_ = newTopic;

    Metadata metadata;
    metadata["previous_topic"] = previous;
    std::cout << "[DebateManager] Topic changed from '" << previous << "' to '" << newTopic << "'" << std::endl;
    bus_->publish(factory_.debateEvent(DebateEventType::TopicChange, newTopic, participantNames(),
                                       std::nullopt, std::move(metadata), previous));
    return true;
}

InterjectionRuling DebateManager::handleInterjection(const Event& event) {
    const auto* interjection = event.interjection();
    if (!interjection) {
        return InterjectionRuling::Discarded;
    }
    if (state_ != DebateState::InProgress || !currentSpeaker_) {
        std::cerr << "[DebateManager] Interjection received but no debate in progress" << std::endl;
        return InterjectionRuling::Discarded;
    }

    bool allowed = isInterruptionAllowed(interjection->interjector.rank, currentSpeaker_->rank,
                                         interjection->interjectionType);

    InterjectionRecord record;
    record.eventId = event.id;
    record.interjector = interjection->interjector;
    record.targetSpeaker = *currentSpeaker_;
    record.interjectionType = interjection->interjectionType;
    record.englishText = interjection->englishText;
    record.allowed = allowed;
    record.timestamp = event.timestamp;
    interjectionLog_.push_back(record);

    if (allowed) {
        std::cout << "[DebateManager] INTERJECTION: " << interjection->englishText << std::endl;
    }
    std::cout << "[DebateManager] " << interjection->interjector.name << " ("
              << interjectionTypeToString(interjection->interjectionType) << ") -> "
              << currentSpeaker_->name << " Allowed: " << (allowed ? "true" : "false") << std::endl;

    if (allowed && sink_) {
        sink_->onInterjection(event, true);
    }
    return allowed ? InterjectionRuling::Allowed : InterjectionRuling::Denied;
}

void DebateManager::handleReaction(const Event& event) {
    const auto* reaction = event.reaction();
    if (!reaction) return;

    if (state_ != DebateState::InProgress) {
        std::cerr << "[DebateManager] Reaction received but no debate in progress" << std::endl;
        return;
    }

    ++reactionCount_;
    std::cout << "[DebateManager] Reaction from " << reaction->reactor.name << " to "
              << reaction->targetEventId << ": " << reactionTypeToString(reaction->reactionType)
              << " - " << reaction->content << std::endl;

    if (sink_) {
        sink_->onReaction(event);
    }
}

ports::DebateSummary DebateManager::buildSummary() const {
    ports::DebateSummary summary;
    summary.topic = currentTopic_;
    summary.participants = participantNames();
    summary.reactionCount = reactionCount_;
    summary.interjectionCount = interjectionLog_.size();
    summary.allowedInterjections = static_cast<std::size_t>(
        std::count_if(interjectionLog_.begin(), interjectionLog_.end(),
                      [](const InterjectionRecord& r) { return r.allowed; }));

    std::size_t best = 0;
    for (const auto& name : summary.participants) {
        auto it = speechCounts_.find(name);
        std::size_t count = it == speechCounts_.end() ? 0 : it->second;
        summary.speechCount += count;
        if (count > best) {
            best = count;
            summary.mostActiveSpeaker = name;
        }
    }

    auto elapsed = clock_->now() - startedAt_;
    summary.durationSeconds = std::chrono::duration<double>(elapsed).count();
    return summary;
}

std::optional<ports::DebateSummary> DebateManager::endDebate() {
    if (state_ != DebateState::InProgress) {
        std::cerr << "[DebateManager] Cannot end debate: no debate in progress" << std::endl;
        return std::nullopt;
    }

    auto summary = buildSummary();

    Metadata metadata;
    metadata["participant_count"] = std::to_string(summary.participants.size());
    metadata["speech_count"] = std::to_string(summary.speechCount);
    metadata["interjection_count"] = std::to_string(summary.interjectionCount);

    state_ = DebateState::Ended;
    bus_->publish(factory_.debateEvent(DebateEventType::DebateEnd, summary.topic, summary.participants,
                                       std::nullopt, std::move(metadata)));

    std::cout << "[DebateManager] Debate on '" << summary.topic << "' ended: "
              << summary.speechCount << " speeches, "
              << summary.reactionCount << " reactions, "
              << summary.interjectionCount << " interjections ("
              << summary.allowedInterjections << " allowed)" << std::endl;

    currentTopic_.clear();
    currentSpeaker_.reset();
    speakerQueue_.clear();

    if (sink_) {
        sink_->onDebateEnded(summary);
    }
    return summary;
}

std::optional<ports::DebateSummary> DebateManager::conductDebate(const std::string& topic,
                                                                 const std::vector<Senator>& senators,
                                                                 ports::IContentGenerator& generator) {
    if (!startDebate(topic, senators)) {
        return std::nullopt;
    }

    while (auto speaker = nextSpeaker()) {
        ports::SpeechRequest request;
        request.speaker = *speaker;
        request.topic = currentTopic_;
        request.context = priorSpeeches_;
        if (stanceHintProvider_) {
            request.stanceHint = stanceHintProvider_(*speaker, currentTopic_);
        }

        ports::GenerationResult result;
        try {
            result = generator.generate(request);
        } catch (const std::exception& e) {
            result = ports::GenerationResult::failure(ports::GenerationStatus::Failed, e.what());
        }

        if (!result.ok()) {
            std::cerr << "[DebateManager] Speech generation for " << speaker->name << " "
                      << ports::generationStatusToString(result.status) << ": " << result.error
                      << "; skipping speaker" << std::endl;
            continue;
        }

        publishSpeech(*speaker, currentTopic_, result.speech.content, result.speech.stance,
                      result.speech.keyPoints);

        if (speechPause_.count() > 0) {
            std::this_thread::sleep_for(speechPause_);
        }
    }

    return endDebate();
}

} // namespace senate::domain
