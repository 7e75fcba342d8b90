#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "enrichment/enrichment_types.hpp"
#include "media/media_store.hpp"
#include "queue/queue_types.hpp"
#include "routing/routing_types.hpp"
#include "spam/spam_types.hpp"

namespace osintpipe::store {

enum class EnrichmentState {
    kSpam,
    kPartial,
    kFull
};

const char* ToString(EnrichmentState state);
std::optional<EnrichmentState> ParseEnrichmentState(const std::string& value);

struct StoredMedia {
    std::string uri;
    media::ContentAddress address;

    bool operator==(const StoredMedia&) const = default;
};

struct StoredMessage {
    queue::MessageEnvelope envelope;
    spam::SpamVerdict spam;
    // Absent for spam.
    std::optional<enrichment::EnrichmentRecord> enrichment;
    std::vector<std::string> failed_steps;
    // Steps disabled for this run. kFull means every enabled step succeeded.
    std::vector<std::string> skipped_steps;
    std::optional<routing::RoutingDecision> routing;
    std::vector<StoredMedia> media;
    EnrichmentState state = EnrichmentState::kFull;
    std::chrono::system_clock::time_point stored_at;
};

}  // namespace osintpipe::store
