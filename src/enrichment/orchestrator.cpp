#include "enrichment/orchestrator.hpp"

#include <algorithm>
#include <functional>
#include <future>
#include <string>

#include "core/errors.hpp"
#include "utils/logging.hpp"

namespace osintpipe::enrichment {
namespace {

using SteadyClock = std::chrono::steady_clock;

template <typename T>
struct StepRun {
    Step step = Step::kClassification;
    bool enabled = false;
    std::chrono::milliseconds timeout{0};
    std::function<T()> call;
    std::future<T> future;
    SteadyClock::time_point deadline;
    StepResult<T> result;
};

template <typename T>
void Launch(StepRun<T>& run, ServiceCallRunner& runner, SteadyClock::time_point outer_deadline) {
    auto promise = std::make_shared<std::promise<T>>();
    run.future = promise->get_future();
    run.deadline = std::min(SteadyClock::now() + run.timeout, outer_deadline);
    ++run.result.attempts;
    const bool started = runner.Run([promise, call = run.call]() {
        try {
            promise->set_value(call());
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    });
    if (!started) {
        promise->set_exception(std::make_exception_ptr(
            ServiceError(std::string(ToString(run.step)) + " not started: too many service calls in flight")));
    }
}

template <typename T>
bool Collect(StepRun<T>& run) {
    if (run.future.wait_until(run.deadline) != std::future_status::ready) {
        run.result.error = std::string(ToString(run.step)) + " timed out";
        return false;
    }
    try {
        run.result.value = run.future.get();
        run.result.error.clear();
        return true;
    } catch (const std::exception& ex) {
        run.result.error = ex.what();
        return false;
    }
}

template <typename T>
void Finish(StepRun<T>& run, ServiceCallRunner& runner, SteadyClock::time_point outer_deadline, bool retry) {
    if (!run.enabled) {
        return;
    }
    if (Collect(run)) {
        return;
    }
    utils::Log(utils::LogLevel::kWarn, "enrichment", "step failed",
               {{"step", ToString(run.step)},
                {"attempt", std::to_string(run.result.attempts)},
                {"error", run.result.error}});
    if (!retry || SteadyClock::now() >= outer_deadline) {
        return;
    }
    Launch(run, runner, outer_deadline);
    if (!Collect(run)) {
        utils::Log(utils::LogLevel::kWarn, "enrichment", "step failed after retry",
                   {{"step", ToString(run.step)}, {"error", run.result.error}});
    }
}

template <typename T>
void Absorb(StepRun<T>& run, std::optional<T>& slot, EnrichmentOutcome& outcome) {
    if (!run.enabled) {
        outcome.disabled_steps.push_back(run.step);
        return;
    }
    ++outcome.enabled_steps;
    if (run.result.Ok()) {
        slot = std::move(run.result.value);
    } else {
        outcome.failures.push_back(StepFailure{run.step, run.result.error});
    }
}

}  // namespace

EnrichmentOrchestrator::EnrichmentOrchestrator(std::shared_ptr<Classifier> classifier,
                                               std::shared_ptr<EntityExtractor> extractor,
                                               std::shared_ptr<Geolocator> geolocator,
                                               std::shared_ptr<EngagementScorer> scorer,
                                               OrchestratorOptions options)
    : classifier_(std::move(classifier)),
      extractor_(std::move(extractor)),
      geolocator_(std::move(geolocator)),
      scorer_(std::move(scorer)),
      options_(options),
      runner_(std::make_unique<ServiceCallRunner>(options.max_in_flight_calls)) {}

std::size_t EnrichmentOrchestrator::InFlightCalls() const {
    return runner_->InFlight();
}

std::chrono::milliseconds EnrichmentOrchestrator::OuterTimeout() const {
    const auto slowest = std::max({options_.classification_timeout,
                                   options_.entities_timeout,
                                   options_.geolocation_timeout,
                                   options_.engagement_timeout});
    const auto multiplier = std::max(1.0, options_.outer_timeout_multiplier);
    return std::chrono::milliseconds(
        static_cast<long long>(static_cast<double>(slowest.count()) * multiplier));
}

EnrichmentOutcome EnrichmentOrchestrator::Enrich(const std::string& text,
                                                 const queue::Metadata& metadata) const {
    const auto started = SteadyClock::now();
    const auto outer_deadline = started + OuterTimeout();

    StepRun<Classification> classification{};
    classification.step = Step::kClassification;
    classification.enabled = options_.enable_classification && classifier_ != nullptr;
    classification.timeout = options_.classification_timeout;
    classification.call = [service = classifier_, text]() { return service->Classify(text); };

    StepRun<Entities> entities{};
    entities.step = Step::kEntities;
    entities.enabled = options_.enable_entities && extractor_ != nullptr;
    entities.timeout = options_.entities_timeout;
    entities.call = [service = extractor_, text]() { return service->Extract(text); };

    StepRun<std::vector<Geolocation>> geolocations{};
    geolocations.step = Step::kGeolocation;
    geolocations.enabled = options_.enable_geolocation && geolocator_ != nullptr;
    geolocations.timeout = options_.geolocation_timeout;
    geolocations.call = [service = geolocator_, text]() { return service->Locate(text); };

    StepRun<Engagement> engagement{};
    engagement.step = Step::kEngagement;
    engagement.enabled = options_.enable_engagement && scorer_ != nullptr;
    engagement.timeout = options_.engagement_timeout;
    engagement.call = [service = scorer_, text, metadata]() { return service->Score(text, metadata); };

    if (classification.enabled) {
        Launch(classification, *runner_, outer_deadline);
    }
    if (entities.enabled) {
        Launch(entities, *runner_, outer_deadline);
    }
    if (geolocations.enabled) {
        Launch(geolocations, *runner_, outer_deadline);
    }
    if (engagement.enabled) {
        Launch(engagement, *runner_, outer_deadline);
    }

    const bool retry = options_.retry_failed_steps;
    Finish(classification, *runner_, outer_deadline, retry);
    Finish(entities, *runner_, outer_deadline, retry);
    Finish(geolocations, *runner_, outer_deadline, retry);
    Finish(engagement, *runner_, outer_deadline, retry);

    EnrichmentOutcome outcome{};
    Absorb(classification, outcome.record.classification, outcome);
    Absorb(entities, outcome.record.entities, outcome);
    Absorb(geolocations, outcome.record.geolocations, outcome);
    Absorb(engagement, outcome.record.engagement, outcome);

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        SteadyClock::now() - started);
    utils::Log(utils::LogLevel::kDebug, "enrichment", "enrich finished",
               {{"steps", std::to_string(outcome.enabled_steps)},
                {"failed", std::to_string(outcome.failures.size())},
                {"elapsed_ms", std::to_string(elapsed.count())}});
    return outcome;
}

}  // namespace osintpipe::enrichment
