#include "enrichment/engagement_scorer.hpp"

#include <cmath>
#include <optional>

#include "core/errors.hpp"
#include "utils/common.hpp"

namespace osintpipe::enrichment {
namespace {

std::optional<double> ReadCounter(const queue::Metadata& metadata, const std::string& key) {
    const auto it = metadata.find(key);
    if (it == metadata.end()) {
        return std::nullopt;
    }
    const auto value = utils::Trim(it->second);
    if (value.empty()) {
        return std::nullopt;
    }
    std::size_t consumed = 0;
    double parsed = 0.0;
    try {
        parsed = std::stod(value, &consumed);
    } catch (const std::exception&) {
        throw ServiceError("engagement counter " + key + " is not numeric: " + value);
    }
    if (consumed != value.size() || !std::isfinite(parsed) || parsed < 0.0) {
        throw ServiceError("engagement counter " + key + " is malformed: " + value);
    }
    return parsed;
}

}  // namespace

Engagement MetadataEngagementScorer::Score(const std::string& /*text*/, const queue::Metadata& metadata) {
    Engagement engagement;
    const auto views = ReadCounter(metadata, "views");
    if (views) {
        engagement["views"] = *views;
    }
    for (const auto* key : {"forwards", "replies", "reactions"}) {
        const auto counter = ReadCounter(metadata, key);
        if (!counter) {
            continue;
        }
        engagement[key] = *counter;
        if (views && *views > 0.0) {
            engagement[std::string(key) + "_reach_er"] = *counter / *views;
        }
    }
    return engagement;
}

}  // namespace osintpipe::enrichment
