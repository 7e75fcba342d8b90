#include "store/store_json.hpp"

#include "queue/queue_json.hpp"
#include "utils/common.hpp"

namespace osintpipe::store {
namespace {

std::vector<std::string> StringList(const nlohmann::json& json, const char* key) {
    std::vector<std::string> items;
    if (json.contains(key) && json[key].is_array()) {
        for (const auto& item : json[key]) {
            if (item.is_string()) {
                items.push_back(item.get<std::string>());
            }
        }
    }
    return items;
}

}  // namespace

nlohmann::json SpamVerdictToJson(const spam::SpamVerdict& verdict) {
    return {
        {"isSpam", verdict.is_spam},
        {"confidence", verdict.confidence},
        {"matchedRules", verdict.matched_rules}
    };
}

spam::SpamVerdict SpamVerdictFromJson(const nlohmann::json& json) {
    spam::SpamVerdict verdict{};
    if (!json.is_object()) {
        return verdict;
    }
    verdict.is_spam = json.value("isSpam", false);
    verdict.confidence = json.value("confidence", 1.0);
    verdict.matched_rules = StringList(json, "matchedRules");
    return verdict;
}

nlohmann::json EnrichmentToJson(const enrichment::EnrichmentRecord& record) {
    nlohmann::json json = nlohmann::json::object();
    json["classification"] = nullptr;
    json["entities"] = nullptr;
    json["geolocations"] = nullptr;
    json["engagement"] = nullptr;

    if (record.classification) {
        const auto& c = *record.classification;
        json["classification"] = {
            {"osintScore", c.osint_score},
            {"topics", c.topics},
            {"sentiment", enrichment::ToString(c.sentiment)},
            {"reasoning", c.reasoning}
        };
    }
    if (record.entities) {
        const auto& e = *record.entities;
        json["entities"] = {
            {"people", e.people},
            {"organizations", e.organizations},
            {"locations", e.locations},
            {"militaryUnits", e.military_units},
            {"directions", e.directions}
        };
    }
    if (record.geolocations) {
        nlohmann::json items = nlohmann::json::array();
        for (const auto& g : *record.geolocations) {
            items.push_back({
                {"lat", g.lat},
                {"lon", g.lon},
                {"name", g.name},
                {"span", {g.source_span.begin, g.source_span.end}}
            });
        }
        json["geolocations"] = std::move(items);
    }
    if (record.engagement) {
        nlohmann::json metrics = nlohmann::json::object();
        for (const auto& [name, value] : *record.engagement) {
            metrics[name] = value;
        }
        json["engagement"] = std::move(metrics);
    }
    return json;
}

enrichment::EnrichmentRecord EnrichmentFromJson(const nlohmann::json& json) {
    enrichment::EnrichmentRecord record{};
    if (!json.is_object()) {
        return record;
    }
    if (json.contains("classification") && json["classification"].is_object()) {
        const auto& c = json["classification"];
        enrichment::Classification classification{};
        classification.osint_score = c.value("osintScore", 0);
        classification.topics = StringList(c, "topics");
        classification.sentiment = enrichment::ParseSentiment(c.value("sentiment", "unknown"));
        classification.reasoning = c.value("reasoning", "");
        record.classification = std::move(classification);
    }
    if (json.contains("entities") && json["entities"].is_object()) {
        const auto& e = json["entities"];
        enrichment::Entities entities{};
        entities.people = StringList(e, "people");
        entities.organizations = StringList(e, "organizations");
        entities.locations = StringList(e, "locations");
        entities.military_units = StringList(e, "militaryUnits");
        entities.directions = StringList(e, "directions");
        record.entities = std::move(entities);
    }
    if (json.contains("geolocations") && json["geolocations"].is_array()) {
        std::vector<enrichment::Geolocation> geolocations;
        for (const auto& item : json["geolocations"]) {
            enrichment::Geolocation g{};
            g.lat = item.value("lat", 0.0);
            g.lon = item.value("lon", 0.0);
            g.name = item.value("name", "");
            if (item.contains("span") && item["span"].is_array() && item["span"].size() == 2) {
                g.source_span.begin = item["span"][0].get<std::size_t>();
                g.source_span.end = item["span"][1].get<std::size_t>();
            }
            geolocations.push_back(std::move(g));
        }
        record.geolocations = std::move(geolocations);
    }
    if (json.contains("engagement") && json["engagement"].is_object()) {
        enrichment::Engagement engagement;
        for (const auto& item : json["engagement"].items()) {
            if (item.value().is_number()) {
                engagement[item.key()] = item.value().get<double>();
            }
        }
        record.engagement = std::move(engagement);
    }
    return record;
}

nlohmann::json RoutingToJson(const routing::RoutingDecision& decision) {
    nlohmann::json json = {
        {"targetPartition", decision.target_partition},
        {"matchedTrigger", nullptr},
        {"matchedPriority", nullptr},
        {"rulesVersion", decision.rules_version},
        {"decidedAtMs", utils::ToMs(decision.decided_at)}
    };
    if (decision.matched_trigger) {
        json["matchedTrigger"] = *decision.matched_trigger;
    }
    if (decision.matched_priority) {
        json["matchedPriority"] = *decision.matched_priority;
    }
    return json;
}

routing::RoutingDecision RoutingFromJson(const nlohmann::json& json) {
    routing::RoutingDecision decision{};
    if (!json.is_object()) {
        return decision;
    }
    decision.target_partition = json.value("targetPartition", "");
    if (json.contains("matchedTrigger") && json["matchedTrigger"].is_string()) {
        decision.matched_trigger = json["matchedTrigger"].get<std::string>();
    }
    if (json.contains("matchedPriority") && json["matchedPriority"].is_number_integer()) {
        decision.matched_priority = json["matchedPriority"].get<int>();
    }
    decision.rules_version = json.value("rulesVersion", static_cast<std::uint64_t>(0));
    decision.decided_at = utils::FromMs(json.value("decidedAtMs", 0LL));
    return decision;
}

nlohmann::json StoredMessageToJson(const StoredMessage& message) {
    nlohmann::json media = nlohmann::json::array();
    for (const auto& item : message.media) {
        media.push_back({
            {"uri", item.uri},
            {"sha256", item.address.sha256},
            {"storageKey", item.address.storage_key},
            {"size", item.address.size}
        });
    }
    return {
        {"envelope", queue::EnvelopeToJson(message.envelope)},
        {"spam", SpamVerdictToJson(message.spam)},
        {"enrichment", message.enrichment ? EnrichmentToJson(*message.enrichment) : nlohmann::json(nullptr)},
        {"failedSteps", message.failed_steps},
        {"skippedSteps", message.skipped_steps},
        {"routing", message.routing ? RoutingToJson(*message.routing) : nlohmann::json(nullptr)},
        {"media", std::move(media)},
        {"state", ToString(message.state)},
        {"storedAtMs", utils::ToMs(message.stored_at)}
    };
}

StoredMessage StoredMessageFromJson(const nlohmann::json& json) {
    StoredMessage message{};
    if (!json.is_object()) {
        return message;
    }
    if (json.contains("envelope")) {
        message.envelope = queue::EnvelopeFromJson(json["envelope"]);
    }
    if (json.contains("spam")) {
        message.spam = SpamVerdictFromJson(json["spam"]);
    }
    if (json.contains("enrichment") && json["enrichment"].is_object()) {
        message.enrichment = EnrichmentFromJson(json["enrichment"]);
    }
    message.failed_steps = StringList(json, "failedSteps");
    message.skipped_steps = StringList(json, "skippedSteps");
    if (json.contains("routing") && json["routing"].is_object()) {
        message.routing = RoutingFromJson(json["routing"]);
    }
    if (json.contains("media") && json["media"].is_array()) {
        for (const auto& item : json["media"]) {
            StoredMedia media{};
            media.uri = item.value("uri", "");
            media.address.sha256 = item.value("sha256", "");
            media.address.storage_key = item.value("storageKey", "");
            media.address.size = item.value("size", 0LL);
            message.media.push_back(std::move(media));
        }
    }
    message.state = ParseEnrichmentState(json.value("state", "full")).value_or(EnrichmentState::kFull);
    message.stored_at = utils::FromMs(json.value("storedAtMs", 0LL));
    return message;
}

}  // namespace osintpipe::store
