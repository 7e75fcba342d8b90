#include "queue/queue_json.hpp"

#include "utils/common.hpp"

namespace osintpipe::queue {

nlohmann::json EnvelopeToJson(const MessageEnvelope& envelope) {
    nlohmann::json metadata = nlohmann::json::object();
    for (const auto& [key, value] : envelope.raw_metadata) {
        metadata[key] = value;
    }
    return {
        {"sourceId", envelope.source_id},
        {"messageId", envelope.message_id},
        {"text", envelope.text},
        {"mediaRefs", envelope.media_refs},
        {"postedAtMs", utils::ToMs(envelope.posted_at)},
        {"rawMetadata", std::move(metadata)}
    };
}

MessageEnvelope EnvelopeFromJson(const nlohmann::json& json) {
    MessageEnvelope envelope{};
    if (!json.is_object()) {
        return envelope;
    }
    envelope.source_id = json.value("sourceId", "");
    envelope.message_id = json.value("messageId", "");
    envelope.text = json.value("text", "");
    if (json.contains("mediaRefs") && json["mediaRefs"].is_array()) {
        for (const auto& item : json["mediaRefs"]) {
            if (item.is_string()) {
                envelope.media_refs.push_back(item.get<std::string>());
            }
        }
    }
    envelope.posted_at = utils::FromMs(json.value("postedAtMs", 0LL));
    if (json.contains("rawMetadata") && json["rawMetadata"].is_object()) {
        for (const auto& item : json["rawMetadata"].items()) {
            if (item.value().is_string()) {
                envelope.raw_metadata[item.key()] = item.value().get<std::string>();
            } else {
                envelope.raw_metadata[item.key()] = item.value().dump();
            }
        }
    }
    return envelope;
}

nlohmann::json AttemptHistoryToJson(const std::vector<AttemptRecord>& history) {
    nlohmann::json json = nlohmann::json::array();
    for (const auto& attempt : history) {
        json.push_back({
            {"attempt", attempt.attempt_number},
            {"error", attempt.error},
            {"timestampMs", utils::ToMs(attempt.timestamp)}
        });
    }
    return json;
}

std::vector<AttemptRecord> AttemptHistoryFromJson(const nlohmann::json& json) {
    std::vector<AttemptRecord> history;
    if (!json.is_array()) {
        return history;
    }
    for (const auto& item : json) {
        AttemptRecord attempt{};
        attempt.attempt_number = item.value("attempt", 0);
        attempt.error = item.value("error", "");
        attempt.timestamp = utils::FromMs(item.value("timestampMs", 0LL));
        history.push_back(std::move(attempt));
    }
    return history;
}

nlohmann::json DeadLetterToJson(const DeadLetterEntry& entry) {
    return {
        {"envelope", EnvelopeToJson(entry.envelope)},
        {"consumerGroup", entry.consumer_group},
        {"attemptHistory", AttemptHistoryToJson(entry.attempt_history)},
        {"firstClaimedAtMs", utils::ToMs(entry.first_claimed_at)},
        {"promotedAtMs", utils::ToMs(entry.promoted_at)},
        {"promotedAt", utils::ToIso(entry.promoted_at)}
    };
}

DeadLetterEntry DeadLetterFromJson(const nlohmann::json& json) {
    DeadLetterEntry entry{};
    if (!json.is_object()) {
        return entry;
    }
    if (json.contains("envelope")) {
        entry.envelope = EnvelopeFromJson(json["envelope"]);
    }
    entry.consumer_group = json.value("consumerGroup", "");
    if (json.contains("attemptHistory")) {
        entry.attempt_history = AttemptHistoryFromJson(json["attemptHistory"]);
    }
    entry.first_claimed_at = utils::FromMs(json.value("firstClaimedAtMs", 0LL));
    entry.promoted_at = utils::FromMs(json.value("promotedAtMs", 0LL));
    return entry;
}

}  // namespace osintpipe::queue
