#pragma once

#include "Event.hpp"
#include "domain/AgentMemory.hpp"
#include "ports/IDebateSink.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace senate {

class JsonCodec {
public:
    static std::string serialize(const Event& event);
    static Event deserialize(const std::string& json);

    static nlohmann::json eventToJson(const Event& event);
    // Throws std::invalid_argument on unknown enum names or a missing payload.
    static Event jsonToEvent(const nlohmann::json& json);

    static nlohmann::json senatorToJson(const Senator& senator);
    static Senator jsonToSenator(const nlohmann::json& json);

    static nlohmann::json memoryToJson(const domain::AgentMemory& memory);
    static nlohmann::json summaryToJson(const ports::DebateSummary& summary);
};

} // namespace senate
