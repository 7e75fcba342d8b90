#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <thread>

#include "core/errors.hpp"
#include "enrichment/orchestrator.hpp"
#include "pipeline/worker.hpp"
#include "pipeline/worker_pool.hpp"
#include "queue/message_queue.hpp"
#include "routing/message_router.hpp"
#include "spam/spam_filter.hpp"
#include "test_support.hpp"

namespace osintpipe::pipeline {
namespace {

using namespace std::chrono_literals;
using osintpipe::testing::CountingMediaStore;
using osintpipe::testing::FakeClassifier;
using osintpipe::testing::FakeEngagementScorer;
using osintpipe::testing::FakeEntityExtractor;
using osintpipe::testing::FakeGeolocator;
using osintpipe::testing::FakeMediaFetcher;
using osintpipe::testing::FlakyMessageStore;
using osintpipe::testing::MakeEnvelope;
using osintpipe::testing::Unavailable;

constexpr int kMaxRetries = 3;

queue::QueueOptions TestQueueOptions() {
    queue::QueueOptions options{};
    options.db_path = ":memory:";
    options.max_retries = kMaxRetries;
    options.backoff_base = 0ms;
    options.backoff_max = 0ms;
    options.poll_interval = 10ms;
    return options;
}

enrichment::OrchestratorOptions TestOrchestratorOptions() {
    enrichment::OrchestratorOptions options{};
    options.classification_timeout = 500ms;
    options.entities_timeout = 500ms;
    options.geolocation_timeout = 500ms;
    options.engagement_timeout = 500ms;
    options.retry_failed_steps = false;
    return options;
}

class WorkerTest : public ::testing::Test {
protected:
    WorkerTest()
        : queue_(TestQueueOptions()),
          store_(":memory:"),
          orchestrator_(classifier_, extractor_, geolocator_, scorer_, TestOrchestratorOptions()) {
        queue_.SetDeadLetterSink([this](const queue::DeadLetterEntry& entry) { store_.InsertDeadLetter(entry); });
        classifier_->handler = [](const std::string&) {
            enrichment::Classification classification{};
            classification.osint_score = 75;
            classification.topics = {"equipment"};
            classification.sentiment = enrichment::Sentiment::kNeutral;
            return classification;
        };
    }

    WorkerContext Context() {
        return WorkerContext{queue_, store_, media_store_, fetcher_, spam_filter_, orchestrator_, router_};
    }

    WorkerOptions Options(const std::string& id = "worker-1") const {
        WorkerOptions options{};
        options.worker_id = id;
        options.block_timeout = 50ms;
        return options;
    }

    queue::MessageQueue queue_;
    FlakyMessageStore store_;
    CountingMediaStore media_store_;
    FakeMediaFetcher fetcher_;
    spam::SpamFilter spam_filter_;
    routing::MessageRouter router_;
    std::shared_ptr<FakeClassifier> classifier_ = std::make_shared<FakeClassifier>();
    std::shared_ptr<FakeEntityExtractor> extractor_ = std::make_shared<FakeEntityExtractor>();
    std::shared_ptr<FakeGeolocator> geolocator_ = std::make_shared<FakeGeolocator>();
    std::shared_ptr<FakeEngagementScorer> scorer_ = std::make_shared<FakeEngagementScorer>();
    enrichment::EnrichmentOrchestrator orchestrator_;
};

TEST_F(WorkerTest, TriggerRoutedMessageIsStoredInItsPartition) {
    queue_.Enqueue(MakeEnvelope("ch1", "42", "HIMARS delivered to front line"));
    Worker worker(Context(), Options());

    EXPECT_EQ(worker.RunOnce(), 1u);

    const auto stored = store_.GetMessage("ch1", "42");
    ASSERT_TRUE(stored.has_value());
    EXPECT_FALSE(stored->spam.is_spam);
    EXPECT_EQ(stored->state, store::EnrichmentState::kFull);
    ASSERT_TRUE(stored->routing.has_value());
    EXPECT_EQ(stored->routing->target_partition, "messages_equipment");
    EXPECT_EQ(stored->routing->matched_trigger, std::optional<std::string>("HIMARS"));
    EXPECT_EQ(stored->routing->matched_priority, std::optional<int>(4));
    ASSERT_TRUE(stored->enrichment.has_value());
    EXPECT_EQ(stored->enrichment->classification->topics, std::vector<std::string>{"equipment"});

    EXPECT_EQ(queue_.Stats("enrichment").acked, 1);
    EXPECT_EQ(worker.Stats().full, 1);
}

TEST_F(WorkerTest, SpamSkipsEnrichmentAndMedia) {
    auto envelope = MakeEnvelope("ch1", "1", "Please donate to 4149 4393 1234 5678");
    envelope.media_refs = {"file:///spool/promo.jpg"};
    queue_.Enqueue(envelope);
    Worker worker(Context(), Options());

    EXPECT_EQ(worker.RunOnce(), 1u);

    const auto stored = store_.GetMessage("ch1", "1");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->state, store::EnrichmentState::kSpam);
    EXPECT_TRUE(stored->spam.is_spam);
    EXPECT_FALSE(stored->enrichment.has_value());
    EXPECT_FALSE(stored->routing.has_value());
    EXPECT_EQ(classifier_->calls.load(), 0);
    EXPECT_EQ(extractor_->calls.load(), 0);
    EXPECT_EQ(fetcher_.Fetches(), 0);
    EXPECT_EQ(worker.Stats().spam, 1);
}

TEST_F(WorkerTest, FailedStepYieldsPartialRecord) {
    geolocator_->handler = Unavailable<std::vector<enrichment::Geolocation>>("geocoder");
    queue_.Enqueue(MakeEnvelope("ch1", "5", "Quiet day in the city"));
    Worker worker(Context(), Options());

    worker.RunOnce();

    const auto stored = store_.GetMessage("ch1", "5");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->state, store::EnrichmentState::kPartial);
    EXPECT_EQ(stored->failed_steps, std::vector<std::string>{"geolocation"});
    EXPECT_FALSE(stored->enrichment->geolocations.has_value());
    EXPECT_EQ(stored->routing->target_partition, "messages_equipment");
    EXPECT_EQ(queue_.Stats("enrichment").acked, 1);
}

TEST_F(WorkerTest, UnclassifiedMessageRoutesByTriggerOrDefault) {
    classifier_->handler = Unavailable<enrichment::Classification>("llm");
    queue_.Enqueue(MakeEnvelope("ch1", "6", "Quiet day in the city"));
    Worker worker(Context(), Options());

    worker.RunOnce();

    const auto stored = store_.GetMessage("ch1", "6");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->routing->target_partition, "messages_general");
    EXPECT_EQ(stored->failed_steps, std::vector<std::string>{"classification"});
}

TEST_F(WorkerTest, TotalFailureIsRetriedThenDeadLettered) {
    classifier_->handler = Unavailable<enrichment::Classification>("llm");
    extractor_->handler = Unavailable<enrichment::Entities>("ner");
    geolocator_->handler = Unavailable<std::vector<enrichment::Geolocation>>("geocoder");
    scorer_->handler = [](const std::string&, const queue::Metadata&) -> enrichment::Engagement {
        throw ServiceError("scorer unavailable");
    };
    queue_.Enqueue(MakeEnvelope("ch1", "13", "Quiet day in the city"));
    Worker worker(Context(), Options());

    for (int attempt = 0; attempt <= kMaxRetries; ++attempt) {
        EXPECT_EQ(worker.RunOnce(), 1u) << "attempt " << attempt;
    }
    EXPECT_EQ(worker.RunOnce(), 0u);

    EXPECT_FALSE(store_.GetMessage("ch1", "13").has_value());
    EXPECT_EQ(store_.CountDeadLetters(), 1);
    const auto dead = store_.GetDeadLetter("ch1", "13");
    ASSERT_TRUE(dead.has_value());
    ASSERT_EQ(dead->attempt_history.size(), static_cast<std::size_t>(kMaxRetries + 1));
    EXPECT_NE(dead->attempt_history.back().error.find("all enrichment steps failed"), std::string::npos);

    const auto stats = worker.Stats();
    EXPECT_EQ(stats.failed, kMaxRetries + 1);
    EXPECT_EQ(stats.dead_lettered, 1);
    EXPECT_EQ(stats.processed, 0);
}

TEST_F(WorkerTest, StoreOutageIsRetriedWithoutDuplicates) {
    store_.fail_next_upserts = 1;
    queue_.Enqueue(MakeEnvelope("ch1", "8", "HIMARS delivered to front line"));
    Worker worker(Context(), Options());

    worker.RunOnce();
    EXPECT_EQ(store_.CountMessages(), 0);
    EXPECT_EQ(worker.Stats().failed, 1);

    worker.RunOnce();
    EXPECT_EQ(store_.CountMessages(), 1);
    EXPECT_EQ(worker.Stats().processed, 1);
}

TEST_F(WorkerTest, ReprocessingSameEnvelopeKeepsOneRecord) {
    Worker worker(Context(), Options());
    const auto envelope = MakeEnvelope("ch1", "42", "HIMARS delivered to front line");
    const auto first = worker.Process(envelope);
    const auto second = worker.Process(envelope);

    EXPECT_EQ(store_.CountMessages(), 1);
    EXPECT_EQ(first.routing, second.routing);
    EXPECT_EQ(first.enrichment, second.enrichment);
}

TEST_F(WorkerTest, DuplicateDeliveryThroughQueueKeepsOneRecord) {
    const auto envelope = MakeEnvelope("ch1", "42", "HIMARS delivered to front line");
    queue_.Enqueue(envelope);
    queue_.Enqueue(envelope);
    Worker worker(Context(), Options());

    std::size_t handled = 0;
    for (int i = 0; i < 4 && handled < 2; ++i) {
        handled += worker.RunOnce();
    }

    EXPECT_EQ(handled, 2u);
    EXPECT_EQ(store_.CountMessages(), 1);
    EXPECT_EQ(store_.upserts.load(), 2);
    EXPECT_EQ(queue_.Stats("enrichment").acked, 2);
    EXPECT_EQ(worker.Stats().processed, 2);
    const auto stored = store_.GetMessage("ch1", "42");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->routing->target_partition, "messages_equipment");
}

TEST_F(WorkerTest, QueueOutageMidBatchReleasesUnfinishedClaims) {
    for (int i = 0; i < 3; ++i) {
        queue_.Enqueue(MakeEnvelope("ch1", std::to_string(i), "HIMARS delivered to front line"));
    }
    store_.queue_down_next_upserts = 1;
    Worker worker(Context(), Options());

    EXPECT_THROW(worker.RunOnce(), QueueUnavailable);
    auto stats = queue_.Stats("enrichment");
    EXPECT_EQ(stats.pending, 0);
    EXPECT_EQ(stats.acked, 0);

    const auto redelivered = queue_.Claim("enrichment", "worker-2", 10, 500ms);
    ASSERT_EQ(redelivered.size(), 3u);
    for (const auto& claimed : redelivered) {
        EXPECT_EQ(claimed.attempt_count, 0) << claimed.envelope.Key();
        EXPECT_TRUE(queue_.Ack(claimed.token));
    }
    EXPECT_EQ(worker.Stats().failed, 0);
}

TEST_F(WorkerTest, IdenticalMediaIsStoredOnce) {
    fetcher_.files = {{"file:///spool/a.jpg", "same-bytes"}, {"file:///spool/b.jpg", "same-bytes"}};
    auto first = MakeEnvelope("ch1", "1", "Photo from the front");
    first.media_refs = {"file:///spool/a.jpg"};
    auto second = MakeEnvelope("ch2", "9", "Reposted photo");
    second.media_refs = {"file:///spool/b.jpg"};
    queue_.Enqueue(first);
    queue_.Enqueue(second);
    Worker worker(Context(), Options());

    EXPECT_EQ(worker.RunOnce(), 2u);

    const auto a = store_.GetMessage("ch1", "1");
    const auto b = store_.GetMessage("ch2", "9");
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    ASSERT_EQ(a->media.size(), 1u);
    ASSERT_EQ(b->media.size(), 1u);
    EXPECT_EQ(a->media[0].address, b->media[0].address);
    EXPECT_EQ(a->media[0].uri, "file:///spool/a.jpg");
    EXPECT_EQ(media_store_.Writes(), 1);
}

TEST_F(WorkerTest, MediaFetchFailureCountsAsAttempt) {
    auto envelope = MakeEnvelope("ch1", "3", "Photo from the front");
    envelope.media_refs = {"file:///spool/gone.jpg"};
    queue_.Enqueue(envelope);
    Worker worker(Context(), Options());

    worker.RunOnce();
    EXPECT_FALSE(store_.GetMessage("ch1", "3").has_value());
    EXPECT_EQ(worker.Stats().failed, 1);
    EXPECT_EQ(classifier_->calls.load(), 0);

    fetcher_.files["file:///spool/gone.jpg"] = "found-later";
    worker.RunOnce();
    EXPECT_TRUE(store_.GetMessage("ch1", "3").has_value());
}

TEST_F(WorkerTest, StoppedWorkerReleasesClaimedBatch) {
    for (int i = 0; i < 3; ++i) {
        queue_.Enqueue(MakeEnvelope("ch1", std::to_string(i), "Quiet day"));
    }
    Worker worker(Context(), Options());
    worker.Stop();

    EXPECT_EQ(worker.RunOnce(), 0u);
    EXPECT_EQ(store_.CountMessages(), 0);

    const auto reclaimed = queue_.Claim("enrichment", "worker-2", 10, 0ms);
    ASSERT_EQ(reclaimed.size(), 3u);
    for (const auto& item : reclaimed) {
        EXPECT_EQ(item.attempt_count, 0);
    }
}

TEST_F(WorkerTest, DisabledClassificationIsRecordedAsSkipped) {
    enrichment::EnrichmentOrchestrator without_classifier(
        nullptr, extractor_, geolocator_, scorer_, TestOrchestratorOptions());
    Worker worker(WorkerContext{queue_, store_, media_store_, fetcher_, spam_filter_, without_classifier, router_},
                  Options());
    queue_.Enqueue(MakeEnvelope("ch1", "5", "Quiet day in the city"));

    EXPECT_EQ(worker.RunOnce(), 1u);

    const auto stored = store_.GetMessage("ch1", "5");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->state, store::EnrichmentState::kFull);
    EXPECT_TRUE(stored->failed_steps.empty());
    EXPECT_EQ(stored->skipped_steps, std::vector<std::string>{"classification"});
    ASSERT_TRUE(stored->enrichment.has_value());
    EXPECT_FALSE(stored->enrichment->classification.has_value());
    EXPECT_EQ(stored->routing->target_partition, "messages_general");
}

TEST(WorkerPoolTest, DrainsQueueAcrossWorkers) {
    queue::MessageQueue queue(TestQueueOptions());
    FlakyMessageStore store(":memory:");
    CountingMediaStore media_store;
    FakeMediaFetcher fetcher;
    spam::SpamFilter spam_filter;
    routing::MessageRouter router;
    enrichment::EnrichmentOrchestrator orchestrator(
        std::make_shared<FakeClassifier>(), std::make_shared<FakeEntityExtractor>(),
        std::make_shared<FakeGeolocator>(), std::make_shared<FakeEngagementScorer>(),
        TestOrchestratorOptions());

    constexpr int kMessages = 20;
    for (int i = 0; i < kMessages; ++i) {
        queue.Enqueue(MakeEnvelope("ch1", std::to_string(i), "Update number " + std::to_string(i)));
    }

    PoolOptions options{};
    options.count = 3;
    options.batch_size = 2;
    options.block_timeout = 50ms;
    WorkerPool pool(WorkerContext{queue, store, media_store, fetcher, spam_filter, orchestrator, router}, options);
    EXPECT_EQ(pool.Size(), 3u);
    pool.Start();
    EXPECT_TRUE(pool.Running());

    const auto deadline = std::chrono::steady_clock::now() + 10s;
    while (store.CountMessages() < kMessages && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(20ms);
    }
    pool.Stop();

    EXPECT_FALSE(pool.Running());
    EXPECT_EQ(store.CountMessages(), kMessages);
    EXPECT_EQ(pool.Stats().processed, kMessages);
    EXPECT_EQ(queue.Stats("enrichment").acked, kMessages);
}

}  // namespace
}  // namespace osintpipe::pipeline
