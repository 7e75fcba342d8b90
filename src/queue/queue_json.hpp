#pragma once

#include "nlohmann/json.hpp"
#include "queue/queue_types.hpp"

namespace osintpipe::queue {

nlohmann::json EnvelopeToJson(const MessageEnvelope& envelope);
MessageEnvelope EnvelopeFromJson(const nlohmann::json& json);

nlohmann::json AttemptHistoryToJson(const std::vector<AttemptRecord>& history);
std::vector<AttemptRecord> AttemptHistoryFromJson(const nlohmann::json& json);

nlohmann::json DeadLetterToJson(const DeadLetterEntry& entry);
DeadLetterEntry DeadLetterFromJson(const nlohmann::json& json);

}  // namespace osintpipe::queue
