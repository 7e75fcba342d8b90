#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "queue/queue_types.hpp"
#include "utils/sqlite.hpp"

namespace osintpipe::queue {

struct QueueOptions {
    std::filesystem::path db_path;
    int max_retries = 3;
    std::chrono::milliseconds backoff_base{500};
    std::chrono::milliseconds backoff_max{60000};
    std::chrono::milliseconds claim_timeout{300000};
    std::chrono::milliseconds poll_interval{200};
};

// Durable work queue with consumer groups. Every group keeps a cursor over
// the append-only entry log plus a table of open deliveries (pending, ready
// for retry, or poisoned awaiting dead-letter promotion).
class MessageQueue {
public:
    using DeadLetterSink = std::function<void(const DeadLetterEntry&)>;

    explicit MessageQueue(QueueOptions options);
    ~MessageQueue();

    MessageQueue(const MessageQueue&) = delete;
    MessageQueue& operator=(const MessageQueue&) = delete;

    // The sink persists promoted entries; if it throws the delivery stays
    // poisoned and promotion is retried on the next claim.
    void SetDeadLetterSink(DeadLetterSink sink);

    long long Enqueue(const MessageEnvelope& envelope);

    std::vector<ClaimedEnvelope> Claim(const std::string& group,
                                       const std::string& worker_id,
                                       std::size_t max_batch,
                                       std::chrono::milliseconds block_timeout);

    bool Ack(const std::string& token);
    NackOutcome Nack(const std::string& token, const std::string& error);
    // Returns a claim without counting an attempt.
    bool Release(const std::string& token, const std::string& reason);

    QueueStats Stats(const std::string& group);

    // Wakes blocked claimers; they return empty.
    void Shutdown();

    const QueueOptions& Options() const { return options_; }

private:
    struct OpenDelivery {
        std::string group;
        long long position = 0;
        std::string worker_id;
        int attempt_count = 0;
        long long first_claimed_at_ms = 0;
        std::vector<AttemptRecord> history;
    };

    void Init();
    std::vector<ClaimedEnvelope> TryClaimLocked(const std::string& group,
                                                const std::string& worker_id,
                                                std::size_t max_batch);
    void EnsureGroupLocked(const std::string& group);
    void ReclaimStaleLocked(const std::string& group, long long now_ms);
    void PromotePoisonedLocked(const std::string& group);
    std::optional<OpenDelivery> FindPendingLocked(const std::string& token);
    NackOutcome RecordFailureLocked(OpenDelivery delivery,
                                    const std::string& error,
                                    long long now_ms);
    bool PromoteLocked(const OpenDelivery& delivery, long long now_ms);
    std::optional<MessageEnvelope> LoadEnvelopeLocked(long long position);
    long long BackoffMs(int attempt) const;

    QueueOptions options_;
    utils::SqliteDatabase db_;
    DeadLetterSink sink_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::atomic<bool> shutdown_{false};
};

}  // namespace osintpipe::queue
