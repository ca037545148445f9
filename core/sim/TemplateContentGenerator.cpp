#include "TemplateContentGenerator.hpp"
#include <array>
#include <vector>

namespace senate::sim {

namespace {

constexpr std::array<Stance, 3> kStances = {Stance::Support, Stance::Oppose, Stance::Neutral};

const std::vector<std::string>& openings(Stance stance) {
    static const std::vector<std::string> support = {
        "Patres conscripti, I rise in firm support of {topic}.",
        "The Republic would be strengthened by {topic}, and I urge you to embrace it.",
        "Let no one doubt that {topic} serves the interests of Rome."};
    static const std::vector<std::string> oppose = {
        "Patres conscripti, I cannot in good conscience support {topic}.",
        "{topic} threatens the traditions our ancestors bequeathed to us.",
        "I warn this chamber that {topic} will bring ruin upon the Republic."};
    static const std::vector<std::string> neutral = {
        "Patres conscripti, {topic} deserves more careful deliberation.",
        "There is merit on both sides of {topic}, and we must weigh it soberly.",
        "Before we decide on {topic}, let us hear every voice in this chamber."};
    switch (stance) {
        case Stance::Support: return support;
        case Stance::Oppose: return oppose;
        case Stance::Neutral: break;
    }
    return neutral;
}

const std::vector<std::string>& latinOpenings(Stance stance) {
    static const std::vector<std::string> support = {"Hoc consilium probo.", "Pro re publica suadeo."};
    static const std::vector<std::string> oppose = {"Hoc consilium improbo.", "Caveat senatus."};
    static const std::vector<std::string> neutral = {"Deliberandum est.", "Audiatur et altera pars."};
    switch (stance) {
        case Stance::Support: return support;
        case Stance::Oppose: return oppose;
        case Stance::Neutral: break;
    }
    return neutral;
}

const std::vector<std::string>& keyPointPool(Stance stance) {
    static const std::vector<std::string> support = {
        "It relieves the burden on the common citizens",
        "It secures the loyalty of our veterans",
        "It follows the precedent of our ancestors",
        "It strengthens the grain supply of the city"};
    static const std::vector<std::string> oppose = {
        "It endangers the rights of property holders",
        "It empties the treasury",
        "It breaks with the mos maiorum",
        "It invites unrest in the provinces"};
    static const std::vector<std::string> neutral = {
        "Its costs have not been fully reckoned",
        "A commission should study the matter",
        "The tribunes must be consulted",
        "A compromise may serve all factions"};
    switch (stance) {
        case Stance::Support: return support;
        case Stance::Oppose: return oppose;
        case Stance::Neutral: break;
    }
    return neutral;
}

std::string fill(std::string text, const std::string& topic) {
    const std::string placeholder = "{topic}";
    auto pos = text.find(placeholder);
    if (pos != std::string::npos) {
        text.replace(pos, placeholder.size(), topic);
    }
    return text;
}

} // namespace

TemplateContentGenerator::TemplateContentGenerator(std::shared_ptr<IRng> rng)
    : rng_(std::move(rng)) {
}

ports::GenerationResult TemplateContentGenerator::generate(const ports::SpeechRequest& request) {
    if (request.topic.empty()) {
        return ports::GenerationResult::failure(ports::GenerationStatus::Failed, "empty topic");
    }

    Stance stance = request.stanceHint ? *request.stanceHint : kStances[pickIndex(*rng_, kStances.size())];

    const auto& opening = openings(stance);
    std::string text = fill(opening[pickIndex(*rng_, opening.size())], request.topic);

    if (!request.context.empty()) {
        const auto& previous = request.context.back();
        if (previous.stance == stance) {
            text += " I stand with " + previous.speakerName + " on this matter.";
        } else {
            text += " I must answer the arguments of " + previous.speakerName + ".";
        }
    }

    const auto& latin = latinOpenings(stance);
    ports::GeneratedSpeech speech;
    speech.stance = stance;
    speech.content.text = text;
    speech.content.localizedText = latin[pickIndex(*rng_, latin.size())];

    // Two distinct key points
    const auto& pool = keyPointPool(stance);
    std::size_t first = pickIndex(*rng_, pool.size());
    std::size_t second = (first + 1 + pickIndex(*rng_, pool.size() - 1)) % pool.size();
    speech.keyPoints = {pool[first], pool[second]};

    ++generated_;
    return ports::GenerationResult::success(std::move(speech));
}

} // namespace senate::sim
