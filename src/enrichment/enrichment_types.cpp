#include "enrichment/enrichment_types.hpp"

#include "utils/common.hpp"

namespace osintpipe::enrichment {

const char* ToString(Sentiment sentiment) {
    switch (sentiment) {
        case Sentiment::kPositive: return "positive";
        case Sentiment::kNegative: return "negative";
        case Sentiment::kNeutral: return "neutral";
        case Sentiment::kUnknown: return "unknown";
    }
    return "unknown";
}

Sentiment ParseSentiment(const std::string& value) {
    const auto lowered = utils::ToLower(utils::Trim(value));
    if (lowered == "positive") {
        return Sentiment::kPositive;
    }
    if (lowered == "negative") {
        return Sentiment::kNegative;
    }
    if (lowered == "neutral") {
        return Sentiment::kNeutral;
    }
    return Sentiment::kUnknown;
}

const char* ToString(Step step) {
    switch (step) {
        case Step::kClassification: return "classification";
        case Step::kEntities: return "entities";
        case Step::kGeolocation: return "geolocation";
        case Step::kEngagement: return "engagement";
    }
    return "unknown";
}

}  // namespace osintpipe::enrichment
