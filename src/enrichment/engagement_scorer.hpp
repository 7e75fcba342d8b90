#pragma once

#include <string>

#include "enrichment/services.hpp"

namespace osintpipe::enrichment {

// Reads the Telegram counters the listener stores in envelope metadata
// ("views", "forwards", "replies", "reactions") and derives reach rates
// relative to views. Missing counters are simply absent from the result.
class MetadataEngagementScorer : public EngagementScorer {
public:
    Engagement Score(const std::string& text, const queue::Metadata& metadata) override;
};

}  // namespace osintpipe::enrichment
