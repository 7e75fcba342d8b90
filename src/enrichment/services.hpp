#pragma once

#include <string>
#include <vector>

#include "enrichment/enrichment_types.hpp"
#include "queue/queue_types.hpp"

namespace osintpipe::enrichment {

// Sub-service seams. Implementations throw ServiceError or TimeoutError when
// they cannot produce a result; any other exception is treated the same way.

class Classifier {
public:
    virtual ~Classifier() = default;
    virtual Classification Classify(const std::string& text) = 0;
};

class EntityExtractor {
public:
    virtual ~EntityExtractor() = default;
    virtual Entities Extract(const std::string& text) = 0;
};

class Geolocator {
public:
    virtual ~Geolocator() = default;
    virtual std::vector<Geolocation> Locate(const std::string& text) = 0;
};

class EngagementScorer {
public:
    virtual ~EngagementScorer() = default;
    virtual Engagement Score(const std::string& text, const queue::Metadata& metadata) = 0;
};

}  // namespace osintpipe::enrichment
