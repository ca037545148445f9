#pragma once

#include "../Event.hpp"
#include "../Senator.hpp"
#include <optional>
#include <string>
#include <vector>

namespace senate::ports {

struct PriorSpeech {
    std::string speakerName;
    Stance stance = Stance::Neutral;
    std::vector<std::string> keyPoints;
};

struct SpeechRequest {
    Senator speaker;
    std::string topic;
    std::optional<Stance> stanceHint;
    std::vector<PriorSpeech> context;
};

struct GeneratedSpeech {
    SpeechContent content;
    Stance stance = Stance::Neutral;
    std::vector<std::string> keyPoints;
};

enum class GenerationStatus {
    Ok,
    Failed,
    TimedOut
};

inline std::string generationStatusToString(GenerationStatus status) {
    switch (status) {
        case GenerationStatus::Ok: return "ok";
        case GenerationStatus::Failed: return "failed";
        case GenerationStatus::TimedOut: return "timed_out";
    }
    return "failed";
}

struct GenerationResult {
    GenerationStatus status = GenerationStatus::Failed;
    GeneratedSpeech speech;
    std::string error;

    bool ok() const { return status == GenerationStatus::Ok; }

    static GenerationResult success(GeneratedSpeech speech) {
        GenerationResult result;
        result.status = GenerationStatus::Ok;
        result.speech = std::move(speech);
        return result;
    }

    static GenerationResult failure(GenerationStatus status, std::string error) {
        GenerationResult result;
        result.status = status;
        result.error = std::move(error);
        return result;
    }
};

class IContentGenerator {
public:
    virtual ~IContentGenerator() = default;

    virtual GenerationResult generate(const SpeechRequest& request) = 0;
};

} // namespace senate::ports
