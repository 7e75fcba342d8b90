#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace osintpipe::enrichment {

inline const std::vector<std::string>& ValidTopics() {
    static const std::vector<std::string> topics = {
        "combat", "civilian", "diplomatic", "equipment", "general"};
    return topics;
}

enum class Sentiment {
    kPositive,
    kNegative,
    kNeutral,
    kUnknown
};

const char* ToString(Sentiment sentiment);
Sentiment ParseSentiment(const std::string& value);

struct Classification {
    int osint_score = 0;
    std::vector<std::string> topics;
    Sentiment sentiment = Sentiment::kUnknown;
    std::string reasoning;

    bool operator==(const Classification&) const = default;
};

// Each list holds distinct values in order of first appearance.
struct Entities {
    std::vector<std::string> people;
    std::vector<std::string> organizations;
    std::vector<std::string> locations;
    std::vector<std::string> military_units;
    std::vector<std::string> directions;

    bool operator==(const Entities&) const = default;
};

// Byte offsets into the message text, end exclusive.
struct TextSpan {
    std::size_t begin = 0;
    std::size_t end = 0;

    bool operator==(const TextSpan&) const = default;
};

struct Geolocation {
    double lat = 0.0;
    double lon = 0.0;
    TextSpan source_span;
    std::string name;

    bool operator==(const Geolocation&) const = default;
};

using Engagement = std::map<std::string, double>;

struct EnrichmentRecord {
    std::optional<Classification> classification;
    std::optional<Entities> entities;
    std::optional<std::vector<Geolocation>> geolocations;
    std::optional<Engagement> engagement;

    bool operator==(const EnrichmentRecord&) const = default;
};

enum class Step {
    kClassification,
    kEntities,
    kGeolocation,
    kEngagement
};

const char* ToString(Step step);

struct StepFailure {
    Step step;
    std::string error;
};

struct EnrichmentOutcome {
    EnrichmentRecord record;
    std::vector<StepFailure> failures;
    std::size_t enabled_steps = 0;
    // Switched off in options or without a service; never attempted.
    std::vector<Step> disabled_steps;

    bool AllFailed() const {
        return enabled_steps > 0 && failures.size() >= enabled_steps;
    }
    bool Partial() const { return !failures.empty() && !AllFailed(); }
};

}  // namespace osintpipe::enrichment
