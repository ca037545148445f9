#include "JsonCodec.hpp"
#include <stdexcept>

namespace senate {

namespace {

template<typename Enum>
Enum require(const std::optional<Enum>& value, const std::string& what, const std::string& raw) {
    if (!value) {
        throw std::invalid_argument("unknown " + what + ": '" + raw + "'");
    }
    return *value;
}

nlohmann::json payloadToJson(const Event& event) {
    nlohmann::json j;
    switch (event.type) {
        case EventType::Debate: {
            const auto& p = *event.debate();
            j["debateEventType"] = debateEventTypeToString(p.kind);
            j["topic"] = p.topic;
            j["participants"] = p.participants;
            if (!p.previousTopic.empty()) {
                j["previousTopic"] = p.previousTopic;
            }
            break;
        }
        case EventType::Speech: {
            const auto& p = *event.speech();
            j["speaker"] = JsonCodec::senatorToJson(p.speaker);
            j["topic"] = p.topic;
            j["content"] = {{"text", p.content.text}, {"localizedText", p.content.localizedText}};
            j["stance"] = stanceToString(p.stance);
            j["keyPoints"] = p.keyPoints;
            break;
        }
        case EventType::Reaction: {
            const auto& p = *event.reaction();
            j["reactor"] = JsonCodec::senatorToJson(p.reactor);
            j["targetEventId"] = p.targetEventId;
            j["targetEventType"] = eventTypeToString(p.targetEventType);
            j["reactionType"] = reactionTypeToString(p.reactionType);
            j["content"] = p.content;
            break;
        }
        case EventType::Interjection: {
            const auto& p = *event.interjection();
            j["interjector"] = JsonCodec::senatorToJson(p.interjector);
            j["targetSpeaker"] = JsonCodec::senatorToJson(p.targetSpeaker);
            j["interjectionType"] = interjectionTypeToString(p.interjectionType);
            j["latinText"] = p.latinText;
            j["englishText"] = p.englishText;
            j["targetSpeechId"] = p.targetSpeechId;
            j["causesDisruption"] = p.causesDisruption;
            break;
        }
    }
    return j;
}

EventPayload jsonToPayload(EventType type, const nlohmann::json& j) {
    switch (type) {
        case EventType::Debate: {
            DebatePayload p;
            std::string kind = j.value("debateEventType", "");
            p.kind = require(stringToDebateEventType(kind), "debate event type", kind);
            p.topic = j.value("topic", "");
            p.participants = j.value("participants", std::vector<std::string>{});
            p.previousTopic = j.value("previousTopic", "");
            return p;
        }
        case EventType::Speech: {
            SpeechPayload p;
            p.speaker = JsonCodec::jsonToSenator(j.at("speaker"));
            p.topic = j.value("topic", "");
            if (j.contains("content")) {
                p.content.text = j["content"].value("text", "");
                p.content.localizedText = j["content"].value("localizedText", "");
            }
            std::string stance = j.value("stance", "neutral");
            p.stance = require(stringToStance(stance), "stance", stance);
            p.keyPoints = j.value("keyPoints", std::vector<std::string>{});
            return p;
        }
        case EventType::Reaction: {
            ReactionPayload p;
            p.reactor = JsonCodec::jsonToSenator(j.at("reactor"));
            p.targetEventId = j.value("targetEventId", "");
            std::string target = j.value("targetEventType", "speech");
            p.targetEventType = require(stringToEventType(target), "event type", target);
            std::string reaction = j.value("reactionType", "neutral");
            p.reactionType = require(stringToReactionType(reaction), "reaction type", reaction);
            p.content = j.value("content", "");
            return p;
        }
        case EventType::Interjection: {
            InterjectionPayload p;
            p.interjector = JsonCodec::jsonToSenator(j.at("interjector"));
            p.targetSpeaker = JsonCodec::jsonToSenator(j.at("targetSpeaker"));
            std::string kind = j.value("interjectionType", "informational");
            p.interjectionType = require(stringToInterjectionType(kind), "interjection type", kind);
            p.latinText = j.value("latinText", "");
            p.englishText = j.value("englishText", "");
            p.targetSpeechId = j.value("targetSpeechId", "");
            p.causesDisruption = j.value("causesDisruption", causesDisruption(p.interjectionType));
            return p;
        }
    }
    throw std::invalid_argument("unhandled event type");
}

} // namespace

std::string JsonCodec::serialize(const Event& event) {
    return eventToJson(event).dump();
}

Event JsonCodec::deserialize(const std::string& json) {
    return jsonToEvent(nlohmann::json::parse(json));
}

nlohmann::json JsonCodec::eventToJson(const Event& event) {
    nlohmann::json j;

    j["id"] = event.id;
    j["type"] = eventTypeToString(event.type);
    j["ts"] = event.timestamp;
    j["priority"] = event.priority;
    j["source"] = event.source ? senatorToJson(*event.source) : nlohmann::json(nullptr);

    if (!event.metadata.empty()) {
        nlohmann::json metadata;
        for (const auto& [key, value] : event.metadata) {
            metadata[key] = value;
        }
        j["metadata"] = metadata;
    }

    j["payload"] = payloadToJson(event);
    return j;
}

Event JsonCodec::jsonToEvent(const nlohmann::json& json) {
    Event event;

    event.id = json.value("id", "");
    std::string type = json.value("type", "");
    event.type = require(stringToEventType(type), "event type", type);
    event.timestamp = json.value("ts", "");
    event.priority = json.value("priority", 0);

    if (json.contains("source") && json["source"].is_object()) {
        event.source = jsonToSenator(json["source"]);
    }

    if (json.contains("metadata") && json["metadata"].is_object()) {
        for (const auto& [key, value] : json["metadata"].items()) {
            event.metadata[key] = value.is_string() ? value.get<std::string>() : value.dump();
        }
    }

    if (!json.contains("payload") || !json["payload"].is_object()) {
        throw std::invalid_argument("event '" + event.id + "' has no payload");
    }
    event.payload = jsonToPayload(event.type, json["payload"]);
    return event;
}

nlohmann::json JsonCodec::senatorToJson(const Senator& senator) {
    return {
        {"id", senator.id},
        {"name", senator.name},
        {"faction", senator.faction},
        {"rank", senator.rank}
    };
}

Senator JsonCodec::jsonToSenator(const nlohmann::json& json) {
    Senator senator;
    senator.id = json.value("id", "");
    senator.name = json.value("name", "");
    senator.faction = json.value("faction", "");
    senator.rank = json.value("rank", 0);
    return senator;
}

nlohmann::json JsonCodec::memoryToJson(const domain::AgentMemory& memory) {
    nlohmann::json j;

    nlohmann::json events = nlohmann::json::array();
    for (const auto& record : memory.eventHistory()) {
        nlohmann::json metadata = nlohmann::json::object();
        for (const auto& [key, value] : record.metadata) {
            metadata[key] = value;
        }
        events.push_back({
            {"eventId", record.eventId},
            {"eventType", eventTypeToString(record.eventType)},
            {"ts", record.timestamp},
            {"source", record.sourceName},
            {"metadata", metadata}
        });
    }
    j["events"] = events;

    nlohmann::json reactions = nlohmann::json::array();
    for (const auto& record : memory.reactionHistory()) {
        reactions.push_back({
            {"eventId", record.eventId},
            {"reactionType", reactionTypeToString(record.reactionType)},
            {"content", record.content},
            {"ts", record.timestamp}
        });
    }
    j["reactions"] = reactions;

    nlohmann::json stanceChanges = nlohmann::json::object();
    for (const auto& [topic, changes] : memory.stanceChanges()) {
        nlohmann::json list = nlohmann::json::array();
        for (const auto& change : changes) {
            list.push_back({
                {"oldStance", stanceToString(change.oldStance)},
                {"newStance", stanceToString(change.newStance)},
                {"reason", change.reason},
                {"eventId", change.eventId},
                {"ts", change.timestamp}
            });
        }
        stanceChanges[topic] = list;
    }
    j["stanceChanges"] = stanceChanges;

    nlohmann::json impacts = nlohmann::json::object();
    for (const auto& [name, list] : memory.relationshipImpacts()) {
        nlohmann::json entries = nlohmann::json::array();
        for (const auto& impact : list) {
            entries.push_back({
                {"eventId", impact.eventId},
                {"impact", impact.impact},
                {"reason", impact.reason},
                {"ts", impact.timestamp}
            });
        }
        impacts[name] = entries;
    }
    j["relationshipImpacts"] = impacts;

    nlohmann::json scores = nlohmann::json::object();
    for (const auto& [name, score] : memory.relationshipScores()) {
        scores[name] = score;
    }
    j["relationshipScores"] = scores;

    return j;
}

nlohmann::json JsonCodec::summaryToJson(const ports::DebateSummary& summary) {
    return {
        {"topic", summary.topic},
        {"participants", summary.participants},
        {"speechCount", summary.speechCount},
        {"reactionCount", summary.reactionCount},
        {"interjectionCount", summary.interjectionCount},
        {"allowedInterjections", summary.allowedInterjections},
        {"mostActiveSpeaker", summary.mostActiveSpeaker},
        {"durationSeconds", summary.durationSeconds}
    };
}

} // namespace senate
