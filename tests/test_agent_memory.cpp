#include <gtest/gtest.h>
#include "../core/domain/AgentMemory.hpp"
#include "../core/EventFactory.hpp"
#include "../core/sim/SimulatedClock.hpp"
#include <memory>

using namespace senate;

class AgentMemoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<sim::SimulatedClock>();
        clock_->freezeTime();
        factory_ = std::make_unique<EventFactory>(clock_);
    }

    EventPtr speechBy(const Senator& speaker) {
        return factory_->speechEvent(speaker, "Land Reform", {"text", ""}, Stance::Oppose, {"point"});
    }

    Senator cato_{"cato", "Cato", "Optimates", 3};
    Senator gracchus_{"gracchus", "Gracchus", "Populares", 2};

    std::shared_ptr<sim::SimulatedClock> clock_;
    std::unique_ptr<EventFactory> factory_;
    domain::AgentMemory memory_;
};

TEST_F(AgentMemoryTest, IndexesEventsByTypeAndSource) {
    auto first = speechBy(cato_);
    auto second = speechBy(gracchus_);
    auto third = speechBy(cato_);
    auto debate = factory_->debateEvent(DebateEventType::DebateStart, "Land Reform", {"Cato", "Gracchus"});

    memory_.recordEvent(*first);
    memory_.recordEvent(*second);
    memory_.recordEvent(*debate);
    memory_.recordEvent(*third);

    auto speeches = memory_.eventsByType(EventType::Speech);
    ASSERT_EQ(speeches.size(), 3u);
    EXPECT_EQ(speeches[0].eventId, first->id);
    EXPECT_EQ(speeches[2].eventId, third->id);

    auto byCato = memory_.eventsBySource("Cato");
    ASSERT_EQ(byCato.size(), 2u);
    EXPECT_EQ(byCato[1].eventId, third->id);
    EXPECT_EQ(byCato[0].metadata.at("topic"), "Land Reform");

    auto anonymous = memory_.eventsBySource("Unknown");
    ASSERT_EQ(anonymous.size(), 1u);
    EXPECT_EQ(anonymous[0].eventType, EventType::Debate);

    EXPECT_TRUE(memory_.eventsByType(EventType::Interjection).empty());
    EXPECT_TRUE(memory_.hasEvent(second->id));
}

TEST_F(AgentMemoryTest, RecentEventsAreNewestLast) {
    std::vector<EventPtr> events;
    for (int i = 0; i < 4; ++i) {
        events.push_back(speechBy(cato_));
        memory_.recordEvent(*events.back());
    }

    auto recent = memory_.recentEvents(2);
    ASSERT_EQ(recent.size(), 2u);
    EXPECT_EQ(recent[0].eventId, events[2]->id);
    EXPECT_EQ(recent[1].eventId, events[3]->id);
    EXPECT_EQ(memory_.recentEvents(10).size(), 4u);
}

TEST_F(AgentMemoryTest, ReactionsAreIndexedByTargetEvent) {
    memory_.recordReaction("speech-1", ReactionType::Agreement, "Nods", "t1");
    memory_.recordReaction("speech-2", ReactionType::Boredom, "Yawns", "t2");
    memory_.recordReaction("speech-1", ReactionType::Interest, "Leans forward", "t3");

    auto reactions = memory_.reactionsTo("speech-1");
    ASSERT_EQ(reactions.size(), 2u);
    EXPECT_EQ(reactions[0].reactionType, ReactionType::Agreement);
    EXPECT_EQ(reactions[1].content, "Leans forward");
    EXPECT_TRUE(memory_.reactionsTo("speech-3").empty());
    EXPECT_EQ(memory_.reactionHistory().size(), 3u);
}

TEST_F(AgentMemoryTest, RelationshipScoreIsClampedToUnitRange) {
    EXPECT_DOUBLE_EQ(memory_.relationshipScore("Gracchus"), 0.0);

    for (int i = 0; i < 15; ++i) {
        memory_.recordRelationshipImpact("Gracchus", "e", 0.1, "support", "t");
    }
    EXPECT_DOUBLE_EQ(memory_.relationshipScore("Gracchus"), 1.0);

    for (int i = 0; i < 30; ++i) {
        memory_.recordRelationshipImpact("Gracchus", "e", -0.2, "emotional", "t");
    }
    EXPECT_DOUBLE_EQ(memory_.relationshipScore("Gracchus"), -1.0);

    // Every impact is kept even when the score saturates
    EXPECT_EQ(memory_.relationshipImpactsBy("Gracchus").size(), 45u);
    EXPECT_TRUE(memory_.relationshipImpactsBy("Cato").empty());
}

TEST_F(AgentMemoryTest, StanceChangesAppendPerTopic) {
    memory_.recordStanceChange("Land Reform", Stance::Neutral, Stance::Support, "persuaded", "e1", "t1");
    memory_.recordStanceChange("Grain Dole", Stance::Oppose, Stance::Neutral, "doubt", "e2", "t2");
    memory_.recordStanceChange("Land Reform", Stance::Support, Stance::Neutral, "doubt", "e3", "t3");

    const auto& changes = memory_.stanceChangesFor("Land Reform");
    ASSERT_EQ(changes.size(), 2u);
    EXPECT_EQ(changes[0].newStance, Stance::Support);
    EXPECT_EQ(changes[1].oldStance, Stance::Support);
    EXPECT_EQ(changes[1].eventId, "e3");

    EXPECT_EQ(memory_.stanceChangesFor("Grain Dole").size(), 1u);
    EXPECT_TRUE(memory_.stanceChangesFor("Census").empty());
}
