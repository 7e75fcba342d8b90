#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "core/errors.hpp"
#include "enrichment/services.hpp"
#include "media/media_fetcher.hpp"
#include "media/media_store.hpp"
#include "queue/queue_types.hpp"
#include "store/sqlite_message_store.hpp"
#include "utils/common.hpp"
#include "utils/hash.hpp"

namespace osintpipe::testing {

// Unique scratch directory removed on destruction.
class TempDir {
public:
    TempDir()
        : path_(std::filesystem::temp_directory_path() / ("osintpipe-test-" + utils::GenerateId(12))) {
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& Path() const { return path_; }
    std::filesystem::path operator/(const std::string& name) const { return path_ / name; }

private:
    std::filesystem::path path_;
};

inline queue::MessageEnvelope MakeEnvelope(const std::string& source_id,
                                           const std::string& message_id,
                                           const std::string& text,
                                           queue::Metadata metadata = {}) {
    queue::MessageEnvelope envelope{};
    envelope.source_id = source_id;
    envelope.message_id = message_id;
    envelope.text = text;
    envelope.posted_at = utils::FromMs(1700000000000LL);
    envelope.raw_metadata = std::move(metadata);
    return envelope;
}

class FakeClassifier : public enrichment::Classifier {
public:
    std::function<enrichment::Classification(const std::string&)> handler = [](const std::string&) {
        enrichment::Classification classification{};
        classification.osint_score = 50;
        classification.topics = {"general"};
        classification.sentiment = enrichment::Sentiment::kNeutral;
        return classification;
    };
    std::atomic<int> calls{0};

    enrichment::Classification Classify(const std::string& text) override {
        ++calls;
        return handler(text);
    }
};

class FakeEntityExtractor : public enrichment::EntityExtractor {
public:
    std::function<enrichment::Entities(const std::string&)> handler = [](const std::string&) {
        return enrichment::Entities{};
    };
    std::atomic<int> calls{0};

    enrichment::Entities Extract(const std::string& text) override {
        ++calls;
        return handler(text);
    }
};

class FakeGeolocator : public enrichment::Geolocator {
public:
    std::function<std::vector<enrichment::Geolocation>(const std::string&)> handler =
        [](const std::string&) { return std::vector<enrichment::Geolocation>{}; };
    std::atomic<int> calls{0};

    std::vector<enrichment::Geolocation> Locate(const std::string& text) override {
        ++calls;
        return handler(text);
    }
};

class FakeEngagementScorer : public enrichment::EngagementScorer {
public:
    std::function<enrichment::Engagement(const std::string&, const queue::Metadata&)> handler =
        [](const std::string&, const queue::Metadata&) { return enrichment::Engagement{{"views", 1.0}}; };
    std::atomic<int> calls{0};

    enrichment::Engagement Score(const std::string& text, const queue::Metadata& metadata) override {
        ++calls;
        return handler(text, metadata);
    }
};

// Handler that always fails the way an unreachable sub-service does.
template <typename T>
std::function<T(const std::string&)> Unavailable(const std::string& what) {
    return [what](const std::string&) -> T { throw ServiceError(what + " unavailable"); };
}

class FakeMediaFetcher : public media::MediaFetcher {
public:
    std::map<std::string, std::string> files;

    std::string Fetch(const std::string& uri) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++fetches_;
        const auto it = files.find(uri);
        if (it == files.end()) {
            throw MediaFetchError("no such media: " + uri);
        }
        return it->second;
    }

    int Fetches() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return fetches_;
    }

private:
    mutable std::mutex mutex_;
    int fetches_ = 0;
};

// In-memory content-addressed store counting physical writes.
class CountingMediaStore : public media::MediaStore {
public:
    media::ContentAddress Put(const std::string& bytes) override {
        media::ContentAddress address{};
        address.sha256 = utils::Sha256Hex(bytes);
        address.storage_key = media::StorageKeyFor(address.sha256);
        address.size = static_cast<long long>(bytes.size());
        std::lock_guard<std::mutex> lock(mutex_);
        if (blobs_.emplace(address.sha256, bytes).second) {
            ++writes_;
        }
        return address;
    }

    bool Exists(const std::string& sha256) override {
        std::lock_guard<std::mutex> lock(mutex_);
        return blobs_.count(sha256) > 0;
    }

    int Writes() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return writes_;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::string> blobs_;
    int writes_ = 0;
};

// SQLite store that can be told to fail its next N message upserts.
class FlakyMessageStore : public store::MessageStore {
public:
    explicit FlakyMessageStore(const std::filesystem::path& path)
        : inner_(path) {}

    std::atomic<int> fail_next_upserts{0};
    // Surfaces a queue outage in the middle of handling an envelope.
    std::atomic<int> queue_down_next_upserts{0};
    std::atomic<int> upserts{0};

    void UpsertMessage(const store::StoredMessage& message) override {
        if (queue_down_next_upserts > 0) {
            --queue_down_next_upserts;
            throw QueueUnavailable("queue offline");
        }
        if (fail_next_upserts > 0) {
            --fail_next_upserts;
            throw StoreUnavailable("store offline");
        }
        ++upserts;
        inner_.UpsertMessage(message);
    }
    bool InsertDeadLetter(const queue::DeadLetterEntry& entry) override {
        return inner_.InsertDeadLetter(entry);
    }
    std::optional<store::StoredMessage> GetMessage(const std::string& source_id,
                                                   const std::string& message_id) override {
        return inner_.GetMessage(source_id, message_id);
    }
    std::vector<queue::DeadLetterEntry> ListDeadLetters(std::size_t limit) override {
        return inner_.ListDeadLetters(limit);
    }
    std::optional<queue::DeadLetterEntry> GetDeadLetter(const std::string& source_id,
                                                        const std::string& message_id) override {
        return inner_.GetDeadLetter(source_id, message_id);
    }
    bool DeleteDeadLetter(const std::string& source_id, const std::string& message_id) override {
        return inner_.DeleteDeadLetter(source_id, message_id);
    }
    long long CountMessages() override { return inner_.CountMessages(); }
    long long CountDeadLetters() override { return inner_.CountDeadLetters(); }

private:
    store::SqliteMessageStore inner_;
};

}  // namespace osintpipe::testing
