#pragma once

namespace senate::ports {

struct ReactionFactors {
    double relationship = 0.0;
    bool sameFaction = false;
    double topicInterest = 0.0;
};

struct InterjectionFactors {
    double relationship = 0.0;
    int rank = 0;
    bool stanceDiffers = false;
};

struct StanceChangeFactors {
    double relationship = 0.0;
    bool sameFaction = false;
    int speakerRank = 0;
};

struct ReactionPolicy {
    virtual ~ReactionPolicy() = default;
    virtual double probability(const ReactionFactors& factors) const = 0;
    virtual double maxTopicInterest() const = 0;
    // |relationship| above which reaction and interjection types lean by polarity.
    virtual double strongRelationship() const = 0;
    virtual double cap() const = 0;
};

struct InterjectionPolicy {
    virtual ~InterjectionPolicy() = default;
    virtual double probability(const InterjectionFactors& factors) const = 0;
    virtual double cap() const = 0;
};

struct StanceChangePolicy {
    virtual ~StanceChangePolicy() = default;
    virtual double probability(const StanceChangeFactors& factors) const = 0;
    virtual double cap() const = 0;
};

class IDecisionPolicy {
public:
    virtual ~IDecisionPolicy() = default;

    virtual const ReactionPolicy& getReactionPolicy() const = 0;
    virtual const InterjectionPolicy& getInterjectionPolicy() const = 0;
    virtual const StanceChangePolicy& getStanceChangePolicy() const = 0;
};

} // namespace senate::ports
