#include <gtest/gtest.h>

#include "core/errors.hpp"
#include "store/sqlite_message_store.hpp"
#include "test_support.hpp"
#include "utils/common.hpp"

namespace osintpipe::store {
namespace {

using osintpipe::testing::MakeEnvelope;
using osintpipe::testing::TempDir;

StoredMessage EnrichedMessage(const std::string& message_id, const std::string& partition) {
    StoredMessage message{};
    message.envelope = MakeEnvelope("ch1", message_id, "HIMARS delivered to front line", {{"views", "120"}});
    message.envelope.media_refs = {"file:///spool/a.jpg"};
    message.spam = spam::SpamVerdict{.is_spam = false, .confidence = 1.0};

    enrichment::EnrichmentRecord record{};
    record.classification = enrichment::Classification{
        .osint_score = 80, .topics = {"equipment"}, .sentiment = enrichment::Sentiment::kNeutral, .reasoning = "r"};
    record.entities = enrichment::Entities{.locations = {"Bakhmut"}};
    record.geolocations = std::vector<enrichment::Geolocation>{
        enrichment::Geolocation{.lat = 48.5953, .lon = 38.0003, .source_span = {3, 10}, .name = "Bakhmut"}};
    message.enrichment = record;

    routing::RoutingDecision decision{};
    decision.target_partition = partition;
    decision.matched_trigger = "HIMARS";
    decision.matched_priority = 4;
    decision.rules_version = 3;
    message.routing = decision;

    message.media = {StoredMedia{.uri = "file:///spool/a.jpg",
                                 .address = media::ContentAddress{.sha256 = utils::Sha256Hex("a"),
                                                                  .storage_key = media::StorageKeyFor(utils::Sha256Hex("a")),
                                                                  .size = 1}}};
    message.failed_steps = {"engagement"};
    message.skipped_steps = {"classification"};
    message.state = EnrichmentState::kPartial;
    message.stored_at = utils::FromMs(1700000001000LL);
    return message;
}

queue::DeadLetterEntry DeadLetter(const std::string& message_id, long long promoted_ms) {
    queue::DeadLetterEntry entry{};
    entry.envelope = MakeEnvelope("ch1", message_id, "poison");
    entry.consumer_group = "enrichment";
    entry.attempt_history = {
        queue::AttemptRecord{1, "boom", utils::FromMs(promoted_ms - 2000)},
        queue::AttemptRecord{2, "boom again", utils::FromMs(promoted_ms - 1000)},
    };
    entry.first_claimed_at = utils::FromMs(promoted_ms - 3000);
    entry.promoted_at = utils::FromMs(promoted_ms);
    return entry;
}

TEST(SqliteMessageStoreTest, UpsertThenGetPreservesRecord) {
    SqliteMessageStore store(":memory:");
    const auto message = EnrichedMessage("42", "messages_equipment");
    store.UpsertMessage(message);

    const auto loaded = store.GetMessage("ch1", "42");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->envelope.text, message.envelope.text);
    EXPECT_EQ(loaded->envelope.raw_metadata, message.envelope.raw_metadata);
    EXPECT_EQ(loaded->envelope.media_refs, message.envelope.media_refs);
    EXPECT_EQ(loaded->enrichment, message.enrichment);
    EXPECT_EQ(loaded->routing, message.routing);
    EXPECT_EQ(loaded->media, message.media);
    EXPECT_EQ(loaded->failed_steps, message.failed_steps);
    EXPECT_EQ(loaded->skipped_steps, message.skipped_steps);
    EXPECT_EQ(loaded->state, EnrichmentState::kPartial);
    EXPECT_EQ(utils::ToMs(loaded->stored_at), 1700000001000LL);
    EXPECT_FALSE(store.GetMessage("ch1", "43").has_value());
}

TEST(SqliteMessageStoreTest, UpsertIsIdempotentPerIdentity) {
    SqliteMessageStore store(":memory:");
    store.UpsertMessage(EnrichedMessage("42", "messages_general"));
    store.UpsertMessage(EnrichedMessage("42", "messages_equipment"));

    EXPECT_EQ(store.CountMessages(), 1);
    EXPECT_EQ(store.GetMessage("ch1", "42")->routing->target_partition, "messages_equipment");
}

TEST(SqliteMessageStoreTest, SpamRowsCountUnderSpamPartition) {
    SqliteMessageStore store(":memory:");
    StoredMessage spam_message{};
    spam_message.envelope = MakeEnvelope("ch1", "1", "please donate");
    spam_message.spam = spam::SpamVerdict{.is_spam = true, .confidence = 1.0, .matched_rules = {"donation_keywords"}};
    spam_message.state = EnrichmentState::kSpam;
    store.UpsertMessage(spam_message);
    store.UpsertMessage(EnrichedMessage("2", "messages_equipment"));
    store.UpsertMessage(EnrichedMessage("3", "messages_equipment"));

    const auto counts = store.CountByPartition();
    ASSERT_EQ(counts.size(), 2u);
    EXPECT_EQ(counts[0], (std::pair<std::string, long long>{"messages_equipment", 2}));
    EXPECT_EQ(counts[1], (std::pair<std::string, long long>{"spam", 1}));

    const auto loaded = store.GetMessage("ch1", "1");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_TRUE(loaded->spam.is_spam);
    EXPECT_FALSE(loaded->enrichment.has_value());
    EXPECT_FALSE(loaded->routing.has_value());
    EXPECT_EQ(loaded->spam.matched_rules, std::vector<std::string>{"donation_keywords"});
}

TEST(SqliteMessageStoreTest, DeadLettersAreWriteOnce) {
    SqliteMessageStore store(":memory:");
    EXPECT_TRUE(store.InsertDeadLetter(DeadLetter("9", 1700000005000LL)));
    EXPECT_FALSE(store.InsertDeadLetter(DeadLetter("9", 1700000009000LL)));
    EXPECT_EQ(store.CountDeadLetters(), 1);

    const auto loaded = store.GetDeadLetter("ch1", "9");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(utils::ToMs(loaded->promoted_at), 1700000005000LL);
    ASSERT_EQ(loaded->attempt_history.size(), 2u);
    EXPECT_EQ(loaded->attempt_history[1].error, "boom again");
    EXPECT_EQ(loaded->consumer_group, "enrichment");
}

TEST(SqliteMessageStoreTest, ListDeadLettersNewestFirstWithLimit) {
    SqliteMessageStore store(":memory:");
    store.InsertDeadLetter(DeadLetter("1", 1000));
    store.InsertDeadLetter(DeadLetter("2", 3000));
    store.InsertDeadLetter(DeadLetter("3", 2000));

    const auto listed = store.ListDeadLetters(2);
    ASSERT_EQ(listed.size(), 2u);
    EXPECT_EQ(listed[0].envelope.message_id, "2");
    EXPECT_EQ(listed[1].envelope.message_id, "3");
}

TEST(SqliteMessageStoreTest, DeleteAllowsLaterPromotion) {
    SqliteMessageStore store(":memory:");
    store.InsertDeadLetter(DeadLetter("9", 1000));
    EXPECT_TRUE(store.DeleteDeadLetter("ch1", "9"));
    EXPECT_FALSE(store.DeleteDeadLetter("ch1", "9"));
    EXPECT_TRUE(store.InsertDeadLetter(DeadLetter("9", 2000)));
}

TEST(SqliteMessageStoreTest, PersistsAcrossReopen) {
    TempDir dir;
    {
        SqliteMessageStore store(dir / "store.db");
        store.UpsertMessage(EnrichedMessage("42", "messages_equipment"));
    }
    SqliteMessageStore reopened(dir / "store.db");
    EXPECT_EQ(reopened.CountMessages(), 1);
}

TEST(SqliteMessageStoreTest, UnopenableDatabaseIsStoreUnavailable) {
    TempDir dir;
    // A directory cannot be opened as a database file.
    EXPECT_THROW(SqliteMessageStore store(dir.Path()), StoreUnavailable);
}

}  // namespace
}  // namespace osintpipe::store
