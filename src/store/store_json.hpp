#pragma once

#include "nlohmann/json.hpp"
#include "store/store_types.hpp"

namespace osintpipe::store {

nlohmann::json SpamVerdictToJson(const spam::SpamVerdict& verdict);
spam::SpamVerdict SpamVerdictFromJson(const nlohmann::json& json);

nlohmann::json EnrichmentToJson(const enrichment::EnrichmentRecord& record);
enrichment::EnrichmentRecord EnrichmentFromJson(const nlohmann::json& json);

nlohmann::json RoutingToJson(const routing::RoutingDecision& decision);
routing::RoutingDecision RoutingFromJson(const nlohmann::json& json);

nlohmann::json StoredMessageToJson(const StoredMessage& message);
StoredMessage StoredMessageFromJson(const nlohmann::json& json);

}  // namespace osintpipe::store
