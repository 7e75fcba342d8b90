#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

#include "enrichment/orchestrator.hpp"
#include "media/media_fetcher.hpp"
#include "media/media_store.hpp"
#include "queue/message_queue.hpp"
#include "routing/message_router.hpp"
#include "spam/spam_filter.hpp"
#include "store/message_store.hpp"

namespace osintpipe::pipeline {

// Everything a worker talks to. Owned by the caller and shared by all workers.
struct WorkerContext {
    queue::MessageQueue& queue;
    store::MessageStore& store;
    media::MediaStore& media_store;
    media::MediaFetcher& fetcher;
    const spam::SpamFilter& spam_filter;
    const enrichment::EnrichmentOrchestrator& orchestrator;
    const routing::MessageRouter& router;
};

struct WorkerOptions {
    std::string consumer_group = "enrichment";
    std::string worker_id = "worker-1";
    std::size_t batch_size = 8;
    std::chrono::milliseconds block_timeout{1000};
};

struct WorkerStats {
    long long processed = 0;
    long long spam = 0;
    long long partial = 0;
    long long full = 0;
    long long failed = 0;
    long long dead_lettered = 0;

    WorkerStats& operator+=(const WorkerStats& other);
};

class Worker {
public:
    Worker(WorkerContext context, WorkerOptions options);

    // Claims and processes batches until Stop().
    void Run();
    // The envelope in flight finishes; the rest of its batch is released.
    void Stop();

    // One claim round; returns the number of envelopes handled.
    std::size_t RunOnce();

    // Spam gate, media, enrichment, routing and upsert for one envelope.
    // Throws on any failure that should count as an attempt.
    store::StoredMessage Process(const queue::MessageEnvelope& envelope);

    WorkerStats Stats() const;
    const WorkerOptions& Options() const { return options_; }

private:
    void Handle(const queue::ClaimedEnvelope& claimed);
    // Returns batch[first..] to the group without charging an attempt.
    void ReleaseFrom(const std::vector<queue::ClaimedEnvelope>& batch,
                     std::size_t first,
                     const std::string& reason);
    std::vector<store::StoredMedia> StoreMedia(const queue::MessageEnvelope& envelope);

    WorkerContext context_;
    WorkerOptions options_;
    std::atomic<bool> stopping_{false};

    std::atomic<long long> processed_{0};
    std::atomic<long long> spam_{0};
    std::atomic<long long> partial_{0};
    std::atomic<long long> full_{0};
    std::atomic<long long> failed_{0};
    std::atomic<long long> dead_lettered_{0};
};

}  // namespace osintpipe::pipeline
