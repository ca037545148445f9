#pragma once

#include "../IRng.hpp"
#include "../ports/IContentGenerator.hpp"
#include <memory>

namespace senate::sim {

// Offline stand-in for the external speech generator. Builds a short speech
// from stock phrases; deterministic for a given RNG sequence.
class TemplateContentGenerator : public ports::IContentGenerator {
public:
    explicit TemplateContentGenerator(std::shared_ptr<IRng> rng);

    ports::GenerationResult generate(const ports::SpeechRequest& request) override;

    std::size_t generatedCount() const { return generated_; }

private:
    std::shared_ptr<IRng> rng_;
    std::size_t generated_ = 0;
};

} // namespace senate::sim
