#include <gtest/gtest.h>

#include <chrono>
#include <thread>
#include <vector>

#include "core/errors.hpp"
#include "queue/message_queue.hpp"
#include "test_support.hpp"

namespace osintpipe::queue {
namespace {

using osintpipe::testing::MakeEnvelope;
using osintpipe::testing::TempDir;
using namespace std::chrono_literals;

QueueOptions FastOptions(const std::filesystem::path& path = ":memory:") {
    QueueOptions options{};
    options.db_path = path;
    options.max_retries = 2;
    options.backoff_base = 0ms;
    options.backoff_max = 0ms;
    options.claim_timeout = 60s;
    options.poll_interval = 10ms;
    return options;
}

TEST(MessageQueueTest, ClaimReturnsEntriesInEnqueueOrder) {
    MessageQueue queue(FastOptions());
    queue.Enqueue(MakeEnvelope("chan", "1", "first"));
    queue.Enqueue(MakeEnvelope("chan", "2", "second"));
    queue.Enqueue(MakeEnvelope("chan", "3", "third"));

    const auto claimed = queue.Claim("g", "w1", 10, 0ms);
    ASSERT_EQ(claimed.size(), 3u);
    EXPECT_EQ(claimed[0].envelope.message_id, "1");
    EXPECT_EQ(claimed[1].envelope.message_id, "2");
    EXPECT_EQ(claimed[2].envelope.message_id, "3");
    EXPECT_LT(claimed[0].position, claimed[1].position);
    EXPECT_EQ(claimed[0].attempt_count, 0);
    EXPECT_EQ(claimed[0].envelope.text, "first");
}

TEST(MessageQueueTest, EnqueueRejectsMissingIdentity) {
    MessageQueue queue(FastOptions());
    EXPECT_THROW(queue.Enqueue(MakeEnvelope("", "1", "x")), std::invalid_argument);
    EXPECT_THROW(queue.Enqueue(MakeEnvelope("chan", "", "x")), std::invalid_argument);
}

TEST(MessageQueueTest, ClaimedEntryIsInvisibleToOtherWorkersOfTheGroup) {
    MessageQueue queue(FastOptions());
    queue.Enqueue(MakeEnvelope("chan", "1", "only"));

    const auto first = queue.Claim("g", "w1", 5, 0ms);
    ASSERT_EQ(first.size(), 1u);
    EXPECT_TRUE(queue.Claim("g", "w2", 5, 0ms).empty());
}

TEST(MessageQueueTest, GroupsConsumeIndependently) {
    MessageQueue queue(FastOptions());
    queue.Enqueue(MakeEnvelope("chan", "1", "shared"));

    const auto a = queue.Claim("archive", "w1", 5, 0ms);
    const auto b = queue.Claim("enrichment", "w1", 5, 0ms);
    ASSERT_EQ(a.size(), 1u);
    ASSERT_EQ(b.size(), 1u);
    EXPECT_NE(a[0].token, b[0].token);
}

TEST(MessageQueueTest, AckRemovesDelivery) {
    MessageQueue queue(FastOptions());
    queue.Enqueue(MakeEnvelope("chan", "1", "x"));
    const auto claimed = queue.Claim("g", "w1", 1, 0ms);
    ASSERT_EQ(claimed.size(), 1u);

    EXPECT_TRUE(queue.Ack(claimed[0].token));
    EXPECT_FALSE(queue.Ack(claimed[0].token));
    EXPECT_TRUE(queue.Claim("g", "w1", 1, 0ms).empty());

    const auto stats = queue.Stats("g");
    EXPECT_EQ(stats.acked, 1);
    EXPECT_EQ(stats.pending, 0);
    EXPECT_EQ(stats.backlog, 0);
}

TEST(MessageQueueTest, NackSchedulesRetryWithIncrementedAttempt) {
    MessageQueue queue(FastOptions());
    queue.Enqueue(MakeEnvelope("chan", "1", "x"));
    auto claimed = queue.Claim("g", "w1", 1, 0ms);
    ASSERT_EQ(claimed.size(), 1u);

    EXPECT_EQ(queue.Nack(claimed[0].token, "boom"), NackOutcome::kRetryScheduled);
    claimed = queue.Claim("g", "w1", 1, 500ms);
    ASSERT_EQ(claimed.size(), 1u);
    EXPECT_EQ(claimed[0].attempt_count, 1);
}

TEST(MessageQueueTest, BackoffDelaysRedelivery) {
    auto options = FastOptions();
    options.backoff_base = 60s;
    options.backoff_max = 60s;
    MessageQueue queue(options);
    queue.Enqueue(MakeEnvelope("chan", "1", "x"));
    const auto claimed = queue.Claim("g", "w1", 1, 0ms);
    ASSERT_EQ(claimed.size(), 1u);

    queue.Nack(claimed[0].token, "boom");
    EXPECT_TRUE(queue.Claim("g", "w1", 1, 50ms).empty());
    EXPECT_EQ(queue.Stats("g").retry_waiting, 1);
}

TEST(MessageQueueTest, UnknownTokenIsReportedNotThrown) {
    MessageQueue queue(FastOptions());
    EXPECT_FALSE(queue.Ack("nope"));
    EXPECT_EQ(queue.Nack("nope", "err"), NackOutcome::kUnknownToken);
    EXPECT_FALSE(queue.Release("nope", "shutdown"));
}

TEST(MessageQueueTest, ExhaustedRetriesPromoteToDeadLetterWithFullHistory) {
    MessageQueue queue(FastOptions());
    std::vector<DeadLetterEntry> dead;
    queue.SetDeadLetterSink([&dead](const DeadLetterEntry& entry) { dead.push_back(entry); });
    queue.Enqueue(MakeEnvelope("chan", "7", "poison"));

    // max_retries = 2: attempts 1 and 2 retry, attempt 3 dead-letters.
    for (int attempt = 1; attempt <= 3; ++attempt) {
        const auto claimed = queue.Claim("g", "w1", 1, 500ms);
        ASSERT_EQ(claimed.size(), 1u) << "attempt " << attempt;
        const auto outcome = queue.Nack(claimed[0].token, "failure " + std::to_string(attempt));
        if (attempt < 3) {
            EXPECT_EQ(outcome, NackOutcome::kRetryScheduled);
        } else {
            EXPECT_EQ(outcome, NackOutcome::kDeadLettered);
        }
    }

    ASSERT_EQ(dead.size(), 1u);
    EXPECT_EQ(dead[0].envelope.Key(), "chan:7");
    EXPECT_EQ(dead[0].consumer_group, "g");
    ASSERT_EQ(dead[0].attempt_history.size(), 3u);
    EXPECT_EQ(dead[0].attempt_history[0].attempt_number, 1);
    EXPECT_EQ(dead[0].attempt_history[2].error, "failure 3");
    EXPECT_TRUE(queue.Claim("g", "w1", 1, 0ms).empty());
    EXPECT_EQ(queue.Stats("g").dead_lettered, 1);
}

TEST(MessageQueueTest, FailingSinkKeepsEntryPoisonedUntilItSucceeds) {
    MessageQueue queue(FastOptions());
    bool sink_up = false;
    int delivered = 0;
    queue.SetDeadLetterSink([&](const DeadLetterEntry&) {
        if (!sink_up) {
            throw StoreUnavailable("store down");
        }
        ++delivered;
    });
    queue.Enqueue(MakeEnvelope("chan", "1", "x"));

    for (int attempt = 1; attempt <= 3; ++attempt) {
        const auto claimed = queue.Claim("g", "w1", 1, 500ms);
        ASSERT_EQ(claimed.size(), 1u);
        const auto outcome = queue.Nack(claimed[0].token, "err");
        EXPECT_EQ(outcome, attempt < 3 ? NackOutcome::kRetryScheduled : NackOutcome::kPoisoned);
    }
    EXPECT_EQ(delivered, 0);
    EXPECT_EQ(queue.Stats("g").dead_lettered, 0);
    EXPECT_EQ(queue.Stats("g").poisoned, 1);

    sink_up = true;
    EXPECT_TRUE(queue.Claim("g", "w1", 1, 0ms).empty());
    EXPECT_EQ(delivered, 1);
    EXPECT_EQ(queue.Stats("g").poisoned, 0);
}

TEST(MessageQueueTest, ExhaustedRetriesWithoutSinkReportPoisoned) {
    auto options = FastOptions();
    options.max_retries = 0;
    MessageQueue queue(options);
    queue.Enqueue(MakeEnvelope("chan", "1", "x"));

    const auto claimed = queue.Claim("g", "w1", 1, 500ms);
    ASSERT_EQ(claimed.size(), 1u);
    EXPECT_EQ(queue.Nack(claimed[0].token, "err"), NackOutcome::kPoisoned);
    const auto stats = queue.Stats("g");
    EXPECT_EQ(stats.dead_lettered, 0);
    EXPECT_EQ(stats.poisoned, 1);
}

TEST(MessageQueueTest, StaleClaimIsReclaimedAndCountsAsAttempt) {
    auto options = FastOptions();
    options.claim_timeout = 50ms;
    MessageQueue queue(options);
    queue.Enqueue(MakeEnvelope("chan", "1", "x"));

    const auto first = queue.Claim("g", "crashed", 1, 0ms);
    ASSERT_EQ(first.size(), 1u);
    std::this_thread::sleep_for(120ms);

    const auto second = queue.Claim("g", "w2", 1, 500ms);
    ASSERT_EQ(second.size(), 1u);
    EXPECT_EQ(second[0].envelope.message_id, "1");
    EXPECT_EQ(second[0].attempt_count, 1);
    EXPECT_FALSE(queue.Ack(first[0].token));
    EXPECT_TRUE(queue.Ack(second[0].token));
}

TEST(MessageQueueTest, ReleaseDoesNotCountAnAttempt) {
    MessageQueue queue(FastOptions());
    queue.Enqueue(MakeEnvelope("chan", "1", "x"));
    auto claimed = queue.Claim("g", "w1", 1, 0ms);
    ASSERT_EQ(claimed.size(), 1u);

    EXPECT_TRUE(queue.Release(claimed[0].token, "shutting down"));
    claimed = queue.Claim("g", "w2", 1, 0ms);
    ASSERT_EQ(claimed.size(), 1u);
    EXPECT_EQ(claimed[0].attempt_count, 0);
}

TEST(MessageQueueTest, ClaimBlocksUntilEnqueue) {
    MessageQueue queue(FastOptions());
    std::thread producer([&queue] {
        std::this_thread::sleep_for(50ms);
        queue.Enqueue(MakeEnvelope("chan", "late", "x"));
    });
    const auto claimed = queue.Claim("g", "w1", 1, 2s);
    producer.join();
    ASSERT_EQ(claimed.size(), 1u);
    EXPECT_EQ(claimed[0].envelope.message_id, "late");
}

TEST(MessageQueueTest, ShutdownWakesBlockedClaimers) {
    MessageQueue queue(FastOptions());
    std::thread stopper([&queue] {
        std::this_thread::sleep_for(50ms);
        queue.Shutdown();
    });
    const auto start = std::chrono::steady_clock::now();
    const auto claimed = queue.Claim("g", "w1", 1, 10s);
    stopper.join();
    EXPECT_TRUE(claimed.empty());
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
}

TEST(MessageQueueTest, EntriesSurviveReopen) {
    TempDir dir;
    const auto path = dir / "queue.db";
    {
        MessageQueue queue(FastOptions(path));
        queue.Enqueue(MakeEnvelope("chan", "1", "durable", {{"views", "10"}}));
        const auto claimed = queue.Claim("g", "w1", 1, 0ms);
        ASSERT_EQ(claimed.size(), 1u);
        queue.Nack(claimed[0].token, "crash");
    }
    MessageQueue reopened(FastOptions(path));
    const auto claimed = reopened.Claim("g", "w1", 1, 500ms);
    ASSERT_EQ(claimed.size(), 1u);
    EXPECT_EQ(claimed[0].envelope.text, "durable");
    EXPECT_EQ(claimed[0].envelope.raw_metadata.at("views"), "10");
    EXPECT_EQ(claimed[0].attempt_count, 1);
}

TEST(MessageQueueTest, StatsReportBacklogAndPending) {
    MessageQueue queue(FastOptions());
    for (int i = 0; i < 4; ++i) {
        queue.Enqueue(MakeEnvelope("chan", std::to_string(i), "x"));
    }
    queue.Claim("g", "w1", 1, 0ms);

    const auto stats = queue.Stats("g");
    EXPECT_EQ(stats.entries, 4);
    EXPECT_EQ(stats.backlog, 3);
    EXPECT_EQ(stats.pending, 1);
}

}  // namespace
}  // namespace osintpipe::queue
