#pragma once

#include <chrono>
#include <map>
#include <string>
#include <vector>

namespace osintpipe::queue {

using Metadata = std::map<std::string, std::string>;

struct MessageEnvelope {
    std::string source_id;
    std::string message_id;
    std::string text;
    std::vector<std::string> media_refs;
    std::chrono::system_clock::time_point posted_at = std::chrono::system_clock::now();
    Metadata raw_metadata;

    std::string Key() const {
        return source_id + ":" + message_id;
    }
};

struct ClaimedEnvelope {
    std::string token;
    long long position = 0;
    int attempt_count = 0;
    MessageEnvelope envelope;
};

struct AttemptRecord {
    int attempt_number = 0;
    std::string error;
    std::chrono::system_clock::time_point timestamp;
};

struct DeadLetterEntry {
    MessageEnvelope envelope;
    std::string consumer_group;
    std::vector<AttemptRecord> attempt_history;
    std::chrono::system_clock::time_point first_claimed_at;
    std::chrono::system_clock::time_point promoted_at;
};

enum class NackOutcome {
    kRetryScheduled,
    kDeadLettered,
    // Attempts exhausted but the dead-letter sink did not take the entry;
    // promotion is retried on later claims.
    kPoisoned,
    kUnknownToken
};

inline const char* ToString(NackOutcome outcome) {
    switch (outcome) {
        case NackOutcome::kRetryScheduled: return "retry_scheduled";
        case NackOutcome::kDeadLettered: return "dead_lettered";
        case NackOutcome::kPoisoned: return "poisoned";
        case NackOutcome::kUnknownToken: return "unknown_token";
    }
    return "unknown";
}

struct QueueStats {
    long long entries = 0;
    long long backlog = 0;
    long long pending = 0;
    long long retry_ready = 0;
    long long retry_waiting = 0;
    long long poisoned = 0;
    long long acked = 0;
    long long dead_lettered = 0;
};

}  // namespace osintpipe::queue
