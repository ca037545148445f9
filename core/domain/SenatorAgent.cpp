#include "SenatorAgent.hpp"
#include "Rhetoric.hpp"
#include <array>
#include <cmath>
#include <iostream>

namespace senate::domain {

namespace {

constexpr std::array<Stance, 3> kAllStances = {Stance::Support, Stance::Oppose, Stance::Neutral};

constexpr std::array<ReactionType, 6> kAllReactions = {
    ReactionType::Agreement, ReactionType::Disagreement, ReactionType::Interest,
    ReactionType::Boredom, ReactionType::Skepticism, ReactionType::Neutral};

// Weight order matches kInterjectionOrder.
constexpr std::array<InterjectionType, 5> kInterjectionOrder = {
    InterjectionType::Support, InterjectionType::Challenge, InterjectionType::Procedural,
    InterjectionType::Emotional, InterjectionType::Informational};

std::vector<double> interjectionWeights(double relationship, double strong, int rank, bool stanceAgrees) {
    bool senior = rank > 2;
    if (relationship > strong) {
        return {0.5, 0.1, senior ? 0.1 : 0.0, 0.0, 0.3};
    }
    if (relationship < -strong) {
        return {0.0, 0.5, senior ? 0.2 : 0.1, 0.2, 0.1};
    }
    return {stanceAgrees ? 0.2 : 0.1,
            stanceAgrees ? 0.1 : 0.2,
            senior ? 0.2 : 0.1,
            0.1,
            0.3};
}

double interjectionImpact(InterjectionType type) {
    switch (type) {
        case InterjectionType::Support: return SenatorAgent::SUPPORT_IMPACT;
        case InterjectionType::Challenge: return -SenatorAgent::SUPPORT_IMPACT;
        case InterjectionType::Emotional: return SenatorAgent::EMOTIONAL_IMPACT;
        case InterjectionType::Procedural:
        case InterjectionType::Informational:
            break;
    }
    return 0.0;
}

} // namespace

std::string agentStateToString(AgentState state) {
    switch (state) {
        case AgentState::Idle: return "idle";
        case AgentState::Observing: return "observing";
        case AgentState::Speaking: return "speaking";
    }
    return "idle";
}

SenatorAgent::SenatorAgent(Senator senator,
                           std::shared_ptr<ports::IEventBus> bus,
                           std::shared_ptr<IRng> rng,
                           std::shared_ptr<IClock> clock,
                           std::shared_ptr<ports::IDecisionPolicy> policy,
                           std::shared_ptr<ports::IDebateSink> sink)
    : senator_(std::move(senator)),
      subscriberId_("senator:" + senator_.id),
      bus_(std::move(bus)),
      rng_(std::move(rng)),
      clock_(std::move(clock)),
      policy_(std::move(policy)),
      sink_(std::move(sink)),
      factory_(clock_) {

    bus_->subscribe(EventType::Speech, subscriberId_,
                    [this](const EventPtr& event) { onSpeech(*event); }, senator_.rank);
    bus_->subscribe(EventType::Debate, subscriberId_,
                    [this](const EventPtr& event) { onDebate(*event); }, senator_.rank);
}

SenatorAgent::~SenatorAgent() {
    bus_->unsubscribeAll(subscriberId_);
}

std::string SenatorAgent::logTag() const {
    return "[Senator " + senator_.name + "] ";
}

std::string SenatorAgent::pick(const std::vector<std::string>& options) {
    return options[pickIndex(*rng_, options.size())];
}

std::optional<Stance> SenatorAgent::stanceOn(const std::string& topic) const {
    auto it = stances_.find(topic);
    if (it == stances_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void SenatorAgent::assignStance(const std::string& topic, Stance stance) {
    stances_[topic] = stance;
}

void SenatorAgent::adjustRelationship(const std::string& senatorName, double delta, const std::string& reason) {
    memory_.recordRelationshipImpact(senatorName, "", delta, reason, clock_->iso8601());
}

void SenatorAgent::ensureStance(const std::string& topic) {
    if (topic.empty() || stances_.count(topic) > 0) {
        return;
    }
    Stance stance = kAllStances[pickIndex(*rng_, kAllStances.size())];
    stances_[topic] = stance;
    std::cout << logTag() << "Takes a " << stanceToString(stance) << " stance on " << topic << std::endl;
}

void SenatorAgent::onDebate(const Event& event) {
    const auto* debate = event.debate();
    if (!debate) return;

    memory_.recordEvent(event);

    switch (debate->kind) {
        case DebateEventType::DebateStart:
            state_ = AgentState::Observing;
            activeTopic_ = debate->topic;
            currentSpeaker_.reset();
            debateInProgress_ = true;
            ensureStance(activeTopic_);
            break;

        case DebateEventType::SpeakerChange:
            currentSpeaker_ = event.source;
            if (state_ != AgentState::Idle) {
                bool named = currentSpeaker_ && currentSpeaker_->id == senator_.id;
                state_ = named ? AgentState::Speaking : AgentState::Observing;
            }
            break;

        case DebateEventType::TopicChange:
            activeTopic_ = debate->topic;
            ensureStance(activeTopic_);
            break;

        case DebateEventType::DebateEnd:
            state_ = AgentState::Idle;
            activeTopic_.clear();
            currentSpeaker_.reset();
            debateInProgress_ = false;
            break;
    }
}

void SenatorAgent::onSpeech(const Event& event) {
    const auto* speech = event.speech();
    if (!speech || state_ == AgentState::Idle) return;

    if (speech->speaker.id == senator_.id) {
        if (state_ == AgentState::Speaking) {
            state_ = AgentState::Observing;
        }
        return;
    }
    // Decisions are taken only while listening from the benches.
    if (state_ != AgentState::Observing) return;

    memory_.recordEvent(event);

    try {
        react(event);
    } catch (const std::exception& e) {
        std::cerr << logTag() << "Reaction step failed: event=" << event.id << " error=" << e.what() << std::endl;
    }

    try {
        interject(event);
    } catch (const std::exception& e) {
        std::cerr << logTag() << "Interjection step failed: event=" << event.id << " error=" << e.what() << std::endl;
    }

    try {
        considerStanceChange(event);
    } catch (const std::exception& e) {
        std::cerr << logTag() << "Stance step failed: event=" << event.id << " error=" << e.what() << std::endl;
    }
}

ReactionDecision SenatorAgent::decideReaction(const Event& speech) {
    ReactionDecision decision;
    const auto* payload = speech.speech();
    if (!payload) return decision;

    const auto& policy = policy_->getReactionPolicy();
    double r = memory_.relationshipScore(payload->speaker.name);

    ports::ReactionFactors factors;
    factors.relationship = r;
    factors.sameFaction = payload->speaker.faction == senator_.faction;
    factors.topicInterest = rng_->uniform(0.0, policy.maxTopicInterest());

    decision.probability = policy.probability(factors);
    decision.roll = rng_->uniform();
    decision.react = decision.roll < decision.probability;
    if (!decision.react) {
        return decision;
    }

    auto own = stanceOn(payload->topic);
    bool agrees = own && *own == payload->stance;
    double strong = policy.strongRelationship();

    if (r > strong && agrees) {
        static const std::array<ReactionType, 2> favourable = {ReactionType::Agreement, ReactionType::Interest};
        decision.reactionType = favourable[pickIndex(*rng_, favourable.size())];
    } else if (r < -strong && !agrees) {
        static const std::array<ReactionType, 2> hostile = {ReactionType::Disagreement, ReactionType::Skepticism};
        decision.reactionType = hostile[pickIndex(*rng_, hostile.size())];
    } else {
        decision.reactionType = kAllReactions[pickIndex(*rng_, kAllReactions.size())];
    }
    return decision;
}

InterjectionDecision SenatorAgent::decideInterjection(const Event& speech) {
    InterjectionDecision decision;
    const auto* payload = speech.speech();
    if (!payload) return decision;

    double r = memory_.relationshipScore(payload->speaker.name);
    auto own = stanceOn(payload->topic);

    ports::InterjectionFactors factors;
    factors.relationship = r;
    factors.rank = senator_.rank;
    factors.stanceDiffers = own && *own != payload->stance;

    decision.probability = policy_->getInterjectionPolicy().probability(factors);
    decision.roll = rng_->uniform();
    decision.interject = decision.roll < decision.probability;
    if (!decision.interject) {
        return decision;
    }

    decision.orderViolation = currentSpeaker_ && currentSpeaker_->id != payload->speaker.id;
    if (decision.orderViolation) {
        decision.interjectionType = InterjectionType::Procedural;
        return decision;
    }

    bool agrees = own && *own == payload->stance;
    auto weights = interjectionWeights(r, policy_->getReactionPolicy().strongRelationship(),
                                       senator_.rank, agrees);
    decision.interjectionType = kInterjectionOrder[weightedIndex(*rng_, weights)];
    return decision;
}

StanceChangeDecision SenatorAgent::decideStanceChange(const Event& speech) {
    StanceChangeDecision decision;
    const auto* payload = speech.speech();
    if (!payload || payload->topic != activeTopic_) return decision;

    auto own = stanceOn(activeTopic_);
    if (!own) return decision;
    decision.oldStance = *own;
    decision.newStance = *own;

    ports::StanceChangeFactors factors;
    factors.relationship = memory_.relationshipScore(payload->speaker.name);
    factors.sameFaction = payload->speaker.faction == senator_.faction;
    factors.speakerRank = payload->speaker.rank;

    decision.probability = policy_->getStanceChangePolicy().probability(factors);
    decision.roll = rng_->uniform();
    if (decision.roll >= decision.probability) {
        return decision;
    }

    if (*own == Stance::Neutral) {
        decision.newStance = payload->stance;
    } else if (*own != payload->stance) {
        decision.newStance = Stance::Neutral;
    }
    decision.change = decision.newStance != decision.oldStance;
    return decision;
}

void SenatorAgent::react(const Event& speech) {
    auto decision = decideReaction(speech);
    if (!decision.react) return;

    const auto& speaker = speech.speech()->speaker;
    std::string content = pick(reactionLines(decision.reactionType, speaker.name));

    bus_->publish(factory_.reactionEvent(senator_, speech, decision.reactionType, content));

    std::string timestamp = clock_->iso8601();
    memory_.recordReaction(speech.id, decision.reactionType, content, timestamp);

    double impact = 0.0;
    if (decision.reactionType == ReactionType::Agreement) {
        impact = AGREEMENT_IMPACT;
    } else if (decision.reactionType == ReactionType::Disagreement) {
        impact = -AGREEMENT_IMPACT;
    }
    if (impact != 0.0) {
        memory_.recordRelationshipImpact(speaker.name, speech.id, impact,
                                         "Reaction to speech: " + reactionTypeToString(decision.reactionType),
                                         timestamp);
    }
}

void SenatorAgent::interject(const Event& speech) {
    auto decision = decideInterjection(speech);
    if (!decision.interject) return;

    const auto& speaker = speech.speech()->speaker;
    std::string latin = pick(latinInterjections(decision.interjectionType));
    std::string english = pick(englishInterjections(decision.interjectionType, speaker.name));

    auto event = factory_.interjectionEvent(senator_, speaker, decision.interjectionType,
                                            latin, english, speech.id);
    bus_->publish(event);
    memory_.recordEvent(*event);

    double impact = interjectionImpact(decision.interjectionType);
    if (impact != 0.0) {
        memory_.recordRelationshipImpact(speaker.name, speech.id, impact,
                                         "Interjection during speech: " + interjectionTypeToString(decision.interjectionType),
                                         event->timestamp);
    }
}

void SenatorAgent::considerStanceChange(const Event& speech) {
    auto decision = decideStanceChange(speech);
    if (!decision.change) return;

    const auto& speaker = speech.speech()->speaker;
    std::string reason = "Persuaded by " + speaker.name + "'s speech";

    stances_[activeTopic_] = decision.newStance;
    memory_.recordStanceChange(activeTopic_, decision.oldStance, decision.newStance,
                               reason, speech.id, clock_->iso8601());

    std::cout << logTag() << "Changed stance on " << activeTopic_
              << " from " << stanceToString(decision.oldStance)
              << " to " << stanceToString(decision.newStance)
              << " due to " << speaker.name << "'s speech" << std::endl;

    if (sink_) {
        ports::StanceChangeNotice notice;
        notice.senator = senator_;
        notice.topic = activeTopic_;
        notice.oldStance = decision.oldStance;
        notice.newStance = decision.newStance;
        notice.reason = reason;
        notice.eventId = speech.id;
        sink_->onStanceChange(notice);
    }
}

} // namespace senate::domain
