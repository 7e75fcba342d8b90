#include "pipeline/worker.hpp"

#include <thread>
#include <vector>

#include "core/errors.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace osintpipe::pipeline {
namespace {

std::string DescribeFailures(const std::vector<enrichment::StepFailure>& failures) {
    std::vector<std::string> parts;
    parts.reserve(failures.size());
    for (const auto& failure : failures) {
        parts.push_back(std::string(enrichment::ToString(failure.step)) + ": " + failure.error);
    }
    return utils::Join(parts, "; ");
}

}  // namespace

WorkerStats& WorkerStats::operator+=(const WorkerStats& other) {
    processed += other.processed;
    spam += other.spam;
    partial += other.partial;
    full += other.full;
    failed += other.failed;
    dead_lettered += other.dead_lettered;
    return *this;
}

Worker::Worker(WorkerContext context, WorkerOptions options)
    : context_(context)
    , options_(std::move(options)) {}

void Worker::Run() {
    utils::Log(utils::LogLevel::kInfo, "worker", "started",
        {{"worker", options_.worker_id}, {"group", options_.consumer_group}});
    while (!stopping_) {
        try {
            RunOnce();
        } catch (const QueueUnavailable& ex) {
            utils::Log(utils::LogLevel::kError, "worker", "queue unavailable",
                {{"worker", options_.worker_id}, {"error", ex.what()}});
            std::this_thread::sleep_for(options_.block_timeout);
        }
    }
    utils::Log(utils::LogLevel::kInfo, "worker", "stopped", {{"worker", options_.worker_id}});
}

void Worker::Stop() {
    stopping_ = true;
}

std::size_t Worker::RunOnce() {
    auto batch = context_.queue.Claim(
        options_.consumer_group, options_.worker_id, options_.batch_size, options_.block_timeout);
    std::size_t handled = 0;
    for (std::size_t i = 0; i < batch.size(); ++i) {
        if (stopping_) {
            ReleaseFrom(batch, i, "worker " + options_.worker_id + " stopping");
            break;
        }
        try {
            Handle(batch[i]);
        } catch (const QueueUnavailable& ex) {
            // The current envelope's ack or nack may not have landed; it is
            // handed back with the rest and its store write is idempotent.
            ReleaseFrom(batch, i, std::string("queue unavailable: ") + ex.what());
            throw;
        }
        ++handled;
    }
    return handled;
}

void Worker::ReleaseFrom(const std::vector<queue::ClaimedEnvelope>& batch,
                         std::size_t first,
                         const std::string& reason) {
    std::vector<std::string> abandoned;
    for (std::size_t j = first; j < batch.size(); ++j) {
        try {
            context_.queue.Release(batch[j].token, reason);
        } catch (const QueueUnavailable& ex) {
            utils::Log(utils::LogLevel::kDebug, "worker", "release failed",
                {{"worker", options_.worker_id}, {"key", batch[j].envelope.Key()}, {"error", ex.what()}});
            abandoned.push_back(batch[j].envelope.Key());
        }
    }
    if (!abandoned.empty()) {
        utils::Log(utils::LogLevel::kWarn, "worker", "claims abandoned; redelivered after claim timeout",
            {{"worker", options_.worker_id},
             {"count", std::to_string(abandoned.size())},
             {"keys", utils::Join(abandoned, ",")}});
    }
}

void Worker::Handle(const queue::ClaimedEnvelope& claimed) {
    const auto key = claimed.envelope.Key();
    try {
        const auto stored = Process(claimed.envelope);
        if (!context_.queue.Ack(claimed.token)) {
            utils::Log(utils::LogLevel::kWarn, "worker", "ack rejected; envelope will be redelivered",
                {{"worker", options_.worker_id}, {"key", key}});
        }
        ++processed_;
        switch (stored.state) {
            case store::EnrichmentState::kSpam: ++spam_; break;
            case store::EnrichmentState::kPartial: ++partial_; break;
            case store::EnrichmentState::kFull: ++full_; break;
        }
    } catch (const QueueUnavailable&) {
        throw;
    } catch (const std::exception& ex) {
        ++failed_;
        const auto outcome = context_.queue.Nack(claimed.token, ex.what());
        if (outcome == queue::NackOutcome::kDeadLettered) {
            ++dead_lettered_;
        }
        utils::Log(utils::LogLevel::kWarn, "worker", "attempt failed",
            {{"worker", options_.worker_id},
             {"key", key},
             {"attempt", std::to_string(claimed.attempt_count + 1)},
             {"outcome", queue::ToString(outcome)},
             {"error", ex.what()}});
    }
}

store::StoredMessage Worker::Process(const queue::MessageEnvelope& envelope) {
    store::StoredMessage stored{};
    stored.envelope = envelope;
    stored.spam = context_.spam_filter.Check(envelope.text, envelope.raw_metadata);

    if (stored.spam.is_spam) {
        stored.state = store::EnrichmentState::kSpam;
        stored.stored_at = utils::Now();
        context_.store.UpsertMessage(stored);
        utils::Log(utils::LogLevel::kDebug, "worker", "spam stored",
            {{"key", envelope.Key()}, {"rules", utils::Join(stored.spam.matched_rules, ",")}});
        return stored;
    }

    stored.media = StoreMedia(envelope);

    auto outcome = context_.orchestrator.Enrich(envelope.text, envelope.raw_metadata);
    if (outcome.AllFailed()) {
        throw TotalEnrichmentFailure("all enrichment steps failed: " + DescribeFailures(outcome.failures));
    }
    for (const auto& failure : outcome.failures) {
        stored.failed_steps.push_back(enrichment::ToString(failure.step));
    }
    for (const auto step : outcome.disabled_steps) {
        stored.skipped_steps.push_back(enrichment::ToString(step));
    }

    std::vector<std::string> topics;
    if (outcome.record.classification) {
        topics = outcome.record.classification->topics;
    }
    stored.routing = context_.router.Route(envelope.text, topics);
    stored.enrichment = std::move(outcome.record);
    stored.state = stored.failed_steps.empty() ? store::EnrichmentState::kFull
                                               : store::EnrichmentState::kPartial;
    stored.stored_at = utils::Now();
    context_.store.UpsertMessage(stored);

    utils::Log(utils::LogLevel::kDebug, "worker", "stored",
        {{"key", envelope.Key()},
         {"partition", stored.routing->target_partition},
         {"state", store::ToString(stored.state)}});
    return stored;
}

std::vector<store::StoredMedia> Worker::StoreMedia(const queue::MessageEnvelope& envelope) {
    std::vector<store::StoredMedia> media;
    media.reserve(envelope.media_refs.size());
    for (const auto& uri : envelope.media_refs) {
        const auto bytes = context_.fetcher.Fetch(uri);
        media.push_back(store::StoredMedia{uri, context_.media_store.Put(bytes)});
    }
    return media;
}

WorkerStats Worker::Stats() const {
    WorkerStats stats{};
    stats.processed = processed_;
    stats.spam = spam_;
    stats.partial = partial_;
    stats.full = full_;
    stats.failed = failed_;
    stats.dead_lettered = dead_lettered_;
    return stats;
}

}  // namespace osintpipe::pipeline
