#include <gtest/gtest.h>
#include "../core/DebateSimulation.hpp"
#include "../core/sim/RecordingDebateSink.hpp"
#include "../core/sim/SimulatedClock.hpp"
#include <map>
#include <memory>
#include <stdexcept>

using namespace senate;

class DebateSimulationTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<sim::SimulatedClock>();
        clock_->freezeTime();
        sink_ = std::make_shared<sim::RecordingDebateSink>();

        config_ = SimulationConfig::defaults();
        config_.seed = 7;
        config_.generatorTimeout = std::chrono::milliseconds(0);
    }

    std::map<std::string, Stance> stances(const DebateSimulation& simulation) const {
        std::map<std::string, Stance> result;
        for (const auto& agent : simulation.agents()) {
            result[agent->senator().id] = agent->stanceOn(config_.topic).value_or(Stance::Neutral);
        }
        return result;
    }

    std::shared_ptr<sim::SimulatedClock> clock_;
    std::shared_ptr<sim::RecordingDebateSink> sink_;
    SimulationConfig config_;
};

TEST_F(DebateSimulationTest, DefaultDebateRunsToCompletion) {
    DebateSimulation simulation(clock_, sink_);
    simulation.configure(config_);

    auto summary = simulation.run();

    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary->topic, "Land Reform");
    EXPECT_EQ(summary->participants.size(), 3u);
    EXPECT_EQ(summary->speechCount, 3u);
    EXPECT_LE(summary->allowedInterjections, summary->interjectionCount);

    ASSERT_EQ(sink_->startedTopics.size(), 1u);
    EXPECT_EQ(sink_->speeches.size(), 3u);
    ASSERT_EQ(sink_->summaries.size(), 1u);

    auto recent = simulation.bus().getRecentEvents(1);
    ASSERT_EQ(recent.size(), 1u);
    ASSERT_NE(recent[0]->debate(), nullptr);
    EXPECT_EQ(recent[0]->debate()->kind, DebateEventType::DebateEnd);

    EXPECT_EQ(simulation.manager().state(), domain::DebateState::Ended);
    for (const auto& agent : simulation.agents()) {
        EXPECT_EQ(agent->state(), domain::AgentState::Idle);
        EXPECT_TRUE(agent->stanceOn("Land Reform").has_value());
    }
}

TEST_F(DebateSimulationTest, SameSeedReproducesOutcome) {
    DebateSimulation first(clock_);
    first.configure(config_);
    auto a = first.run();

    DebateSimulation second(clock_);
    second.configure(config_);
    auto b = second.run();

    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(a->reactionCount, b->reactionCount);
    EXPECT_EQ(a->interjectionCount, b->interjectionCount);
    EXPECT_EQ(a->allowedInterjections, b->allowedInterjections);
    EXPECT_EQ(a->mostActiveSpeaker, b->mostActiveSpeaker);
    EXPECT_EQ(stances(first), stances(second));
}

TEST_F(DebateSimulationTest, InitialStancesSteerSpeeches) {
    DebateSimulation simulation(clock_, sink_);
    config_.policy.stanceChange.cap = 0.0;
    simulation.configure(config_);
    simulation.run();

    ASSERT_EQ(sink_->speeches.size(), 3u);
    EXPECT_EQ(sink_->speeches[0].speech()->stance, Stance::Neutral);
    EXPECT_EQ(sink_->speeches[1].speech()->stance, Stance::Oppose);
    EXPECT_EQ(sink_->speeches[2].speech()->stance, Stance::Support);
    EXPECT_TRUE(sink_->stanceChanges.empty());
}

TEST_F(DebateSimulationTest, GeneratorTimeoutWrapsTemplateGenerator) {
    config_.generatorTimeout = std::chrono::milliseconds(2000);
    DebateSimulation simulation(clock_, sink_);
    simulation.configure(config_);

    auto summary = simulation.run();
    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary->speechCount, 3u);
}

TEST_F(DebateSimulationTest, RejectsInvalidConfiguration) {
    DebateSimulation simulation(clock_);

    SimulationConfig empty = config_;
    empty.senators.clear();
    EXPECT_THROW(simulation.configure(empty), std::invalid_argument);

    SimulationConfig duplicate = config_;
    duplicate.senators.push_back(duplicate.senators.front());
    EXPECT_THROW(simulation.configure(duplicate), std::invalid_argument);

    EXPECT_FALSE(simulation.isConfigured());
    EXPECT_THROW(simulation.run(), std::logic_error);
    EXPECT_THROW(DebateSimulation(nullptr), std::invalid_argument);
}

TEST_F(DebateSimulationTest, ReconfigureReplacesAgents) {
    DebateSimulation simulation(clock_);
    simulation.configure(config_);
    EXPECT_EQ(simulation.agents().size(), 3u);

    SimulationConfig pair = config_;
    pair.senators.pop_back();
    simulation.configure(pair);

    EXPECT_EQ(simulation.agents().size(), 2u);
    EXPECT_EQ(simulation.agent("gracchus"), nullptr);
    ASSERT_NE(simulation.agent("cato"), nullptr);
    EXPECT_EQ(simulation.agent("cato")->stanceOn("Land Reform").value_or(Stance::Neutral), Stance::Oppose);
}
