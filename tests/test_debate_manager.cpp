#include <gtest/gtest.h>
#include "../core/domain/DebateManager.hpp"
#include "../core/domain/EventBus.hpp"
#include "../core/sim/RecordingDebateSink.hpp"
#include "../core/sim/SimulatedClock.hpp"
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace senate;

namespace {

// Succeeds for everyone except the listed senator ids.
class SelectiveGenerator : public ports::IContentGenerator {
public:
    std::vector<std::string> failFor;
    std::vector<std::string> throwFor;
    std::vector<ports::SpeechRequest> requests;

    ports::GenerationResult generate(const ports::SpeechRequest& request) override {
        requests.push_back(request);
        for (const auto& id : throwFor) {
            if (id == request.speaker.id) throw std::runtime_error("backend crashed");
        }
        for (const auto& id : failFor) {
            if (id == request.speaker.id) {
                return ports::GenerationResult::failure(ports::GenerationStatus::Failed, "backend unavailable");
            }
        }
        ports::GeneratedSpeech speech;
        speech.content = {request.speaker.name + " speaks on " + request.topic, "Oratio"};
        speech.stance = request.stanceHint.value_or(Stance::Neutral);
        speech.keyPoints = {"point of " + request.speaker.name};
        return ports::GenerationResult::success(speech);
    }
};

} // namespace

class DebateManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<sim::SimulatedClock>();
        clock_->freezeTime();
        factory_ = std::make_unique<EventFactory>(clock_);
        bus_ = std::make_shared<domain::EventBus>();
        sink_ = std::make_shared<sim::RecordingDebateSink>();
        manager_ = std::make_unique<domain::DebateManager>(bus_, clock_, sink_);
    }

    EventPtr interjectionFrom(const Senator& interjector, const Senator& target, InterjectionType type) {
        return factory_->interjectionEvent(interjector, target, type, "Nego!", "I must challenge!", "speech-id");
    }

    std::vector<EventPtr> history() const { return bus_->getRecentEvents(bus_->maxHistory()); }

    Senator cicero_{"cicero", "Cicero", "Optimates", 4};
    Senator cato_{"cato", "Cato", "Optimates", 3};
    Senator gracchus_{"gracchus", "Gracchus", "Populares", 2};
    Senator crassus_{"crassus", "Crassus", "Populares", 1};

    std::shared_ptr<sim::SimulatedClock> clock_;
    std::unique_ptr<EventFactory> factory_;
    std::shared_ptr<domain::EventBus> bus_;
    std::shared_ptr<sim::RecordingDebateSink> sink_;
    std::unique_ptr<domain::DebateManager> manager_;
};

TEST_F(DebateManagerTest, InterruptionArbitrationTable) {
    EXPECT_TRUE(domain::isInterruptionAllowed(4, 2, InterjectionType::Challenge));
    EXPECT_TRUE(domain::isInterruptionAllowed(4, 2, InterjectionType::Emotional));
    EXPECT_FALSE(domain::isInterruptionAllowed(2, 2, InterjectionType::Challenge));
    EXPECT_TRUE(domain::isInterruptionAllowed(2, 2, InterjectionType::Procedural));
    EXPECT_FALSE(domain::isInterruptionAllowed(1, 2, InterjectionType::Procedural));
    EXPECT_FALSE(domain::isInterruptionAllowed(1, 2, InterjectionType::Support));
    EXPECT_FALSE(domain::isInterruptionAllowed(0, 0, InterjectionType::Informational));
    EXPECT_TRUE(domain::isInterruptionAllowed(0, 0, InterjectionType::Procedural));
}

TEST_F(DebateManagerTest, LandReformEndToEndOrdering) {
    ASSERT_TRUE(manager_->startDebate("Land Reform", {cicero_, cato_, gracchus_}));
    EXPECT_TRUE(manager_->debateInProgress());

    for (int i = 0; i < 3; ++i) {
        auto speaker = manager_->nextSpeaker();
        ASSERT_TRUE(speaker.has_value());
        manager_->publishSpeech(*speaker, "Land Reform", {"Speech of " + speaker->name, ""},
                                Stance::Neutral, {});
    }
    EXPECT_FALSE(manager_->nextSpeaker().has_value());

    auto events = history();
    ASSERT_EQ(events.size(), 7u);
    ASSERT_NE(events[0]->debate(), nullptr);
    EXPECT_EQ(events[0]->debate()->kind, DebateEventType::DebateStart);
    EXPECT_EQ(events[0]->metadata.at("participant_count"), "3");
    EXPECT_EQ(events[0]->debate()->participants,
              (std::vector<std::string>{"Cicero", "Cato", "Gracchus"}));

    const Senator* expected[] = {&cicero_, &cato_, &gracchus_};
    for (int i = 0; i < 3; ++i) {
        const auto& change = events[1 + 2 * i];
        const auto& spoken = events[2 + 2 * i];
        ASSERT_NE(change->debate(), nullptr);
        EXPECT_EQ(change->debate()->kind, DebateEventType::SpeakerChange);
        ASSERT_TRUE(change->source.has_value());
        EXPECT_EQ(change->source->id, expected[i]->id);
        EXPECT_EQ(change->metadata.at("speaker_name"), expected[i]->name);
        EXPECT_EQ(change->metadata.at("speaker_faction"), expected[i]->faction);
        EXPECT_EQ(change->priority, expected[i]->rank);

        ASSERT_NE(spoken->speech(), nullptr);
        EXPECT_EQ(spoken->speech()->speaker.id, expected[i]->id);
    }

    clock_->advance(std::chrono::seconds(5));
    auto summary = manager_->endDebate();
    ASSERT_TRUE(summary.has_value());
    EXPECT_FALSE(manager_->debateInProgress());
    EXPECT_EQ(manager_->state(), domain::DebateState::Ended);

    events = history();
    ASSERT_EQ(events.size(), 8u);
    ASSERT_NE(events.back()->debate(), nullptr);
    EXPECT_EQ(events.back()->debate()->kind, DebateEventType::DebateEnd);
    EXPECT_EQ(events.back()->metadata.at("speech_count"), "3");
    EXPECT_EQ(events.back()->metadata.at("interjection_count"), "0");

    EXPECT_EQ(summary->topic, "Land Reform");
    EXPECT_EQ(summary->speechCount, 3u);
    EXPECT_EQ(summary->mostActiveSpeaker, "Cicero");
    EXPECT_DOUBLE_EQ(summary->durationSeconds, 5.0);

    EXPECT_TRUE(manager_->currentTopic().empty());
    EXPECT_FALSE(manager_->currentSpeaker().has_value());
    EXPECT_TRUE(manager_->registeredSpeakers().empty());

    ASSERT_EQ(sink_->startedTopics.size(), 1u);
    EXPECT_EQ(sink_->speeches.size(), 3u);
    ASSERT_EQ(sink_->summaries.size(), 1u);
}

TEST_F(DebateManagerTest, SeniorChallengeIsAllowedAndJuniorChallengeDenied) {
    ASSERT_TRUE(manager_->startDebate("Land Reform", {gracchus_, cicero_, crassus_}));
    auto speaker = manager_->nextSpeaker();
    ASSERT_TRUE(speaker.has_value());
    ASSERT_EQ(speaker->id, "gracchus");

    bus_->publish(interjectionFrom(cicero_, gracchus_, InterjectionType::Challenge));
    ASSERT_EQ(sink_->interjections.size(), 1u);
    EXPECT_TRUE(sink_->interjections[0].disruptsSpeech);
    EXPECT_EQ(sink_->interjections[0].event.interjection()->interjector.id, "cicero");

    bus_->publish(interjectionFrom(crassus_, gracchus_, InterjectionType::Challenge));
    EXPECT_EQ(sink_->interjections.size(), 1u);

    const auto& log = manager_->interjectionLog();
    ASSERT_EQ(log.size(), 2u);
    EXPECT_TRUE(log[0].allowed);
    EXPECT_FALSE(log[1].allowed);
    EXPECT_EQ(log[1].interjector.id, "crassus");
    EXPECT_EQ(log[1].targetSpeaker.id, "gracchus");

    EXPECT_EQ(manager_->handleInterjection(*interjectionFrom(cicero_, gracchus_, InterjectionType::Challenge)),
              domain::InterjectionRuling::Allowed);
    EXPECT_EQ(manager_->handleInterjection(*interjectionFrom(crassus_, gracchus_, InterjectionType::Challenge)),
              domain::InterjectionRuling::Denied);

    auto summary = manager_->endDebate();
    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary->interjectionCount, 4u);
    EXPECT_EQ(summary->allowedInterjections, 2u);
}

TEST_F(DebateManagerTest, DeniedInterjectionTextIsNotAnnounced) {
    ASSERT_TRUE(manager_->startDebate("Land Reform", {gracchus_}));
    manager_->nextSpeaker();

    auto junior = factory_->interjectionEvent(crassus_, gracchus_, InterjectionType::Challenge,
                                              "Nego!", "Crassus objects loudly", "speech-id");
    ::testing::internal::CaptureStdout();
    auto ruling = manager_->handleInterjection(*junior);
    std::string denied = ::testing::internal::GetCapturedStdout();

    EXPECT_EQ(ruling, domain::InterjectionRuling::Denied);
    EXPECT_EQ(denied.find("Crassus objects loudly"), std::string::npos);
    EXPECT_NE(denied.find("Allowed: false"), std::string::npos);

    auto senior = factory_->interjectionEvent(cicero_, gracchus_, InterjectionType::Challenge,
                                              "Nego!", "Cicero objects loudly", "speech-id");
    ::testing::internal::CaptureStdout();
    manager_->handleInterjection(*senior);
    std::string allowed = ::testing::internal::GetCapturedStdout();

    EXPECT_NE(allowed.find("INTERJECTION: Cicero objects loudly"), std::string::npos);
    EXPECT_NE(allowed.find("Allowed: true"), std::string::npos);
}

TEST_F(DebateManagerTest, PeerProceduralInterjectionIsAllowed) {
    Senator flaccus{"flaccus", "Flaccus", "Populares", 2};
    ASSERT_TRUE(manager_->startDebate("Land Reform", {gracchus_}));
    manager_->nextSpeaker();

    EXPECT_EQ(manager_->handleInterjection(*interjectionFrom(flaccus, gracchus_, InterjectionType::Procedural)),
              domain::InterjectionRuling::Allowed);
    EXPECT_EQ(manager_->handleInterjection(*interjectionFrom(flaccus, gracchus_, InterjectionType::Challenge)),
              domain::InterjectionRuling::Denied);
}

TEST_F(DebateManagerTest, InterjectionWithoutDebateOrSpeakerIsDiscarded) {
    auto event = interjectionFrom(cicero_, gracchus_, InterjectionType::Challenge);
    EXPECT_EQ(manager_->handleInterjection(*event), domain::InterjectionRuling::Discarded);

    ASSERT_TRUE(manager_->startDebate("Land Reform", {gracchus_}));
    // No speaker has the floor yet
    EXPECT_EQ(manager_->handleInterjection(*event), domain::InterjectionRuling::Discarded);

    EXPECT_TRUE(manager_->interjectionLog().empty());
    EXPECT_TRUE(sink_->interjections.empty());
}

TEST_F(DebateManagerTest, LifecycleRejectsInvalidTransitions) {
    EXPECT_EQ(manager_->state(), domain::DebateState::NotStarted);
    EXPECT_FALSE(manager_->endDebate().has_value());
    EXPECT_FALSE(manager_->changeTopic("Grain Dole"));

    // A queued speaker cannot take the floor before the debate opens
    manager_->registerSpeaker(gracchus_);
    EXPECT_FALSE(manager_->nextSpeaker().has_value());
    EXPECT_FALSE(manager_->currentSpeaker().has_value());
    EXPECT_EQ(bus_->historySize(), 0u);

    ASSERT_TRUE(manager_->startDebate("Land Reform", {cicero_, cato_}));
    auto before = bus_->historySize();

    EXPECT_FALSE(manager_->startDebate("Grain Dole", {gracchus_}));
    EXPECT_EQ(manager_->currentTopic(), "Land Reform");
    EXPECT_EQ(manager_->registeredSpeakers().size(), 2u);
    EXPECT_EQ(bus_->historySize(), before);

    ASSERT_TRUE(manager_->endDebate().has_value());
    EXPECT_FALSE(manager_->endDebate().has_value());

    auto afterEnd = bus_->historySize();
    manager_->registerSpeaker(gracchus_);
    EXPECT_FALSE(manager_->nextSpeaker().has_value());
    EXPECT_FALSE(manager_->currentSpeaker().has_value());
    EXPECT_EQ(bus_->historySize(), afterEnd);

    // A new debate may follow an ended one
    EXPECT_TRUE(manager_->startDebate("Grain Dole", {gracchus_}));
    EXPECT_EQ(manager_->currentTopic(), "Grain Dole");
}

TEST_F(DebateManagerTest, SpeakerQueueRejectsDuplicates) {
    ASSERT_TRUE(manager_->startDebate("Land Reform", {cicero_, cato_, cicero_}));
    EXPECT_EQ(manager_->registeredSpeakers().size(), 2u);
    EXPECT_EQ(history().front()->metadata.at("participant_count"), "2");

    EXPECT_FALSE(manager_->registerSpeaker(cato_));
    EXPECT_TRUE(manager_->registerSpeaker(gracchus_));
    EXPECT_EQ(manager_->registeredSpeakers().size(), 3u);
    EXPECT_EQ(manager_->registeredSpeakers().back().id, "gracchus");
}

TEST_F(DebateManagerTest, TopicChangeIsPublished) {
    ASSERT_TRUE(manager_->startDebate("Land Reform", {cicero_}));
    ASSERT_TRUE(manager_->changeTopic("Grain Dole"));

    EXPECT_EQ(manager_->currentTopic(), "Grain Dole");
    auto last = history().back();
    ASSERT_NE(last->debate(), nullptr);
    EXPECT_EQ(last->debate()->kind, DebateEventType::TopicChange);
    EXPECT_EQ(last->debate()->topic, "Grain Dole");
    EXPECT_EQ(last->debate()->previousTopic, "Land Reform");
}

TEST_F(DebateManagerTest, ReactionsAreCountedAndForwarded) {
    auto orphanTarget = factory_->speechEvent(gracchus_, "Land Reform", {"...", ""}, Stance::Support, {});
    auto early = factory_->reactionEvent(cato_, *orphanTarget, ReactionType::Boredom, "Stifles a yawn");
    bus_->publish(early);
    EXPECT_EQ(manager_->reactionCount(), 0u);

    ASSERT_TRUE(manager_->startDebate("Land Reform", {gracchus_, cato_}));
    auto speaker = manager_->nextSpeaker();
    auto spoken = manager_->publishSpeech(*speaker, "Land Reform", {"...", ""}, Stance::Support);
    bus_->publish(factory_->reactionEvent(cato_, *spoken, ReactionType::Skepticism, "Raises an eyebrow skeptically"));

    EXPECT_EQ(manager_->reactionCount(), 1u);
    ASSERT_EQ(sink_->reactions.size(), 1u);
    EXPECT_EQ(sink_->reactions[0].reaction()->targetEventId, spoken->id);

    auto summary = manager_->endDebate();
    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary->reactionCount, 1u);
}

TEST_F(DebateManagerTest, ConductDebateSkipsFailedSpeakers) {
    SelectiveGenerator generator;
    generator.failFor = {"cato"};
    generator.throwFor = {"crassus"};
    manager_->setStanceHintProvider([](const Senator& s, const std::string&) -> std::optional<Stance> {
        if (s.id == "cicero") return Stance::Oppose;
        return std::nullopt;
    });

    auto summary = manager_->conductDebate("Land Reform", {cicero_, cato_, crassus_, gracchus_}, generator);

    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary->speechCount, 2u);
    EXPECT_EQ(manager_->state(), domain::DebateState::Ended);

    ASSERT_EQ(generator.requests.size(), 4u);
    ASSERT_TRUE(generator.requests[0].stanceHint.has_value());
    EXPECT_EQ(*generator.requests[0].stanceHint, Stance::Oppose);
    EXPECT_FALSE(generator.requests[1].stanceHint.has_value());
    EXPECT_TRUE(generator.requests[0].context.empty());
    // Failed speakers contribute no context
    ASSERT_EQ(generator.requests[3].context.size(), 1u);
    EXPECT_EQ(generator.requests[3].context[0].speakerName, "Cicero");
    EXPECT_EQ(generator.requests[3].context[0].stance, Stance::Oppose);

    ASSERT_EQ(sink_->speeches.size(), 2u);
    EXPECT_EQ(sink_->speeches[1].speech()->speaker.id, "gracchus");
    EXPECT_EQ(history().back()->debate()->kind, DebateEventType::DebateEnd);
}

TEST_F(DebateManagerTest, ConductDebateRefusesWhileAnotherIsRunning) {
    SelectiveGenerator generator;
    ASSERT_TRUE(manager_->startDebate("Land Reform", {cicero_}));

    EXPECT_FALSE(manager_->conductDebate("Grain Dole", {gracchus_}, generator).has_value());
    EXPECT_TRUE(generator.requests.empty());
    EXPECT_EQ(manager_->currentTopic(), "Land Reform");
}

TEST_F(DebateManagerTest, UnsubscribesOnDestruction) {
    EXPECT_EQ(bus_->subscriberCount(EventType::Interjection), 1u);
    EXPECT_EQ(bus_->subscriberCount(EventType::Reaction), 1u);
    manager_.reset();
    EXPECT_EQ(bus_->subscriberCount(EventType::Interjection), 0u);
    EXPECT_EQ(bus_->subscriberCount(EventType::Reaction), 0u);
}
