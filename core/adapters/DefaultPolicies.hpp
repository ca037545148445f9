#pragma once

#include "../ports/IDecisionPolicy.hpp"
#include <algorithm>
#include <cmath>

namespace senate::adapters {

struct ReactionSettings {
    double base = 0.3;
    double cap = 0.8;
    double relationshipWeight = 0.2;
    double factionBonus = 0.1;
    double maxTopicInterest = 0.3;
    double strongRelationship = 0.3;
};

struct InterjectionSettings {
    double base = 0.1;
    double cap = 0.5;
    double relationshipWeight = 0.15;
    double rankStep = 0.05;
    double rankCap = 0.2;
    double stanceBonus = 0.15;
};

struct StanceChangeSettings {
    double base = 0.05;
    double cap = 0.3;
    double relationshipWeight = 0.1;
    double factionBonus = 0.05;
    double rankStep = 0.025;
    double rankCap = 0.1;
};

struct PolicySettings {
    ReactionSettings reaction;
    InterjectionSettings interjection;
    StanceChangeSettings stanceChange;
};

// Clamp into [0, cap]; non-finite and negative sums become 0.
inline double clampProbability(double value, double cap) {
    if (!std::isfinite(value) || value <= 0.0 || !(cap > 0.0)) {
        return 0.0;
    }
    return std::min(value, cap);
}

class WeightedReactionPolicy : public ports::ReactionPolicy {
public:
    explicit WeightedReactionPolicy(ReactionSettings settings = {})
        : settings_(settings) {}

    double probability(const ports::ReactionFactors& factors) const override {
        double r = factors.relationship;
        // Allies react to their own faction, rivals to the other side.
        bool factionAligned = (factors.sameFaction && r >= 0.0) || (!factors.sameFaction && r < 0.0);

        double p = settings_.base
                 + std::abs(r) * settings_.relationshipWeight
                 + (factionAligned ? settings_.factionBonus : 0.0)
                 + factors.topicInterest;
        return clampProbability(p, settings_.cap);
    }

    double maxTopicInterest() const override { return settings_.maxTopicInterest; }
    double strongRelationship() const override { return settings_.strongRelationship; }
    double cap() const override { return settings_.cap; }

private:
    ReactionSettings settings_;
};

class WeightedInterjectionPolicy : public ports::InterjectionPolicy {
public:
    explicit WeightedInterjectionPolicy(InterjectionSettings settings = {})
        : settings_(settings) {}

    double probability(const ports::InterjectionFactors& factors) const override {
        double rankFactor = std::min(settings_.rankCap, std::max(0, factors.rank) * settings_.rankStep);
        double p = settings_.base
                 + std::abs(factors.relationship) * settings_.relationshipWeight
                 + rankFactor
                 + (factors.stanceDiffers ? settings_.stanceBonus : 0.0);
        return clampProbability(p, settings_.cap);
    }

    double cap() const override { return settings_.cap; }

private:
    InterjectionSettings settings_;
};

class PersuasionStanceChangePolicy : public ports::StanceChangePolicy {
public:
    explicit PersuasionStanceChangePolicy(StanceChangeSettings settings = {})
        : settings_(settings) {}

    double probability(const ports::StanceChangeFactors& factors) const override {
        double rankFactor = std::min(settings_.rankCap, std::max(0, factors.speakerRank) * settings_.rankStep);
        double p = settings_.base
                 + std::max(0.0, factors.relationship) * settings_.relationshipWeight
                 + (factors.sameFaction ? settings_.factionBonus : 0.0)
                 + rankFactor;
        return clampProbability(p, settings_.cap);
    }

    double cap() const override { return settings_.cap; }

private:
    StanceChangeSettings settings_;
};

class DefaultDecisionPolicy : public ports::IDecisionPolicy {
public:
    explicit DefaultDecisionPolicy(const PolicySettings& settings = {})
        : reactionPolicy_(settings.reaction),
          interjectionPolicy_(settings.interjection),
          stanceChangePolicy_(settings.stanceChange) {}

    const ports::ReactionPolicy& getReactionPolicy() const override {
        return reactionPolicy_;
    }

    const ports::InterjectionPolicy& getInterjectionPolicy() const override {
        return interjectionPolicy_;
    }

    const ports::StanceChangePolicy& getStanceChangePolicy() const override {
        return stanceChangePolicy_;
    }

private:
    WeightedReactionPolicy reactionPolicy_;
    WeightedInterjectionPolicy interjectionPolicy_;
    PersuasionStanceChangePolicy stanceChangePolicy_;
};

} // namespace senate::adapters
