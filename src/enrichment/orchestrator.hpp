#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include "enrichment/enrichment_types.hpp"
#include "enrichment/service_call_runner.hpp"
#include "enrichment/services.hpp"
#include "queue/queue_types.hpp"

namespace osintpipe::enrichment {

struct OrchestratorOptions {
    bool enable_classification = true;
    bool enable_entities = true;
    bool enable_geolocation = true;
    bool enable_engagement = true;
    std::chrono::milliseconds classification_timeout{30000};
    std::chrono::milliseconds entities_timeout{5000};
    std::chrono::milliseconds geolocation_timeout{5000};
    std::chrono::milliseconds engagement_timeout{5000};
    // Whole-call deadline as a multiple of the slowest step timeout.
    double outer_timeout_multiplier = 2.0;
    bool retry_failed_steps = true;
    // Cap on sub-service calls still running, overrunning ones included.
    std::size_t max_in_flight_calls = 64;
};

template <typename T>
struct StepResult {
    std::optional<T> value;
    std::string error;
    int attempts = 0;

    bool Ok() const { return value.has_value(); }
};

// Runs the four sub-services concurrently and joins them into one record.
// A step that fails or overruns its timeout leaves its sub-result empty.
// An overrunning call finishes in the background and its answer is
// discarded; the orchestrator joins such calls before it is destroyed.
class EnrichmentOrchestrator {
public:
    EnrichmentOrchestrator(std::shared_ptr<Classifier> classifier,
                           std::shared_ptr<EntityExtractor> extractor,
                           std::shared_ptr<Geolocator> geolocator,
                           std::shared_ptr<EngagementScorer> scorer,
                           OrchestratorOptions options = {});

    EnrichmentOutcome Enrich(const std::string& text, const queue::Metadata& metadata = {}) const;

    std::chrono::milliseconds OuterTimeout() const;
    std::size_t InFlightCalls() const;
    const OrchestratorOptions& Options() const { return options_; }

private:
    std::shared_ptr<Classifier> classifier_;
    std::shared_ptr<EntityExtractor> extractor_;
    std::shared_ptr<Geolocator> geolocator_;
    std::shared_ptr<EngagementScorer> scorer_;
    OrchestratorOptions options_;
    std::unique_ptr<ServiceCallRunner> runner_;
};

}  // namespace osintpipe::enrichment
