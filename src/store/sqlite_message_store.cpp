#include "store/sqlite_message_store.hpp"

#include "core/errors.hpp"
#include "nlohmann/json.hpp"
#include "queue/queue_json.hpp"
#include "store/store_json.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace osintpipe::store {
namespace {

constexpr const char* kSchema = R"SQL(
CREATE TABLE IF NOT EXISTS messages (
  source_id TEXT NOT NULL,
  message_id TEXT NOT NULL,
  target_partition TEXT NOT NULL,
  state TEXT NOT NULL,
  body TEXT NOT NULL,
  stored_at_ms INTEGER NOT NULL,
  PRIMARY KEY (source_id, message_id)
);
CREATE INDEX IF NOT EXISTS idx_messages_partition ON messages(target_partition);
CREATE TABLE IF NOT EXISTS dead_letters (
  source_id TEXT NOT NULL,
  message_id TEXT NOT NULL,
  consumer_group TEXT NOT NULL,
  body TEXT NOT NULL,
  promoted_at_ms INTEGER NOT NULL,
  PRIMARY KEY (source_id, message_id)
);
)SQL";

std::string PartitionOf(const StoredMessage& message) {
    if (message.state == EnrichmentState::kSpam) {
        return "spam";
    }
    return message.routing ? message.routing->target_partition : std::string();
}

std::optional<queue::DeadLetterEntry> ParseDeadLetter(const std::string& body) {
    const auto json = nlohmann::json::parse(body, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        return std::nullopt;
    }
    return queue::DeadLetterFromJson(json);
}

}  // namespace

SqliteMessageStore::SqliteMessageStore(const std::filesystem::path& db_path) {
    try {
        db_.Open(db_path);
        db_.Exec(kSchema);
    } catch (const utils::SqliteError& ex) {
        throw StoreUnavailable(ex.what());
    }
}

void SqliteMessageStore::UpsertMessage(const StoredMessage& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        utils::SqliteStatement stmt(
            db_,
            "INSERT INTO messages (source_id, message_id, target_partition, state, body, stored_at_ms) "
            "VALUES (?, ?, ?, ?, ?, ?) "
            "ON CONFLICT(source_id, message_id) DO UPDATE SET "
            "target_partition = excluded.target_partition, state = excluded.state, "
            "body = excluded.body, stored_at_ms = excluded.stored_at_ms;");
        stmt.Bind(1, message.envelope.source_id)
            .Bind(2, message.envelope.message_id)
            .Bind(3, PartitionOf(message))
            .Bind(4, ToString(message.state))
            .Bind(5, StoredMessageToJson(message).dump())
            .Bind(6, utils::ToMs(message.stored_at));
        stmt.Step();
    } catch (const utils::SqliteError& ex) {
        throw StoreUnavailable(std::string("upsert failed: ") + ex.what());
    }
}

bool SqliteMessageStore::InsertDeadLetter(const queue::DeadLetterEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    bool inserted = false;
    try {
        utils::SqliteStatement stmt(
            db_,
            "INSERT OR IGNORE INTO dead_letters "
            "(source_id, message_id, consumer_group, body, promoted_at_ms) "
            "VALUES (?, ?, ?, ?, ?);");
        stmt.Bind(1, entry.envelope.source_id)
            .Bind(2, entry.envelope.message_id)
            .Bind(3, entry.consumer_group)
            .Bind(4, queue::DeadLetterToJson(entry).dump())
            .Bind(5, utils::ToMs(entry.promoted_at));
        stmt.Step();
        inserted = db_.Changes() > 0;
    } catch (const utils::SqliteError& ex) {
        throw StoreUnavailable(std::string("dead-letter insert failed: ") + ex.what());
    }
    if (!inserted) {
        utils::Log(utils::LogLevel::kInfo, "store", "dead-letter already recorded",
            {{"key", entry.envelope.Key()}});
    }
    return inserted;
}

std::optional<StoredMessage> SqliteMessageStore::GetMessage(const std::string& source_id,
                                                            const std::string& message_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        utils::SqliteStatement stmt(
            db_, "SELECT body FROM messages WHERE source_id = ? AND message_id = ?;");
        stmt.Bind(1, source_id).Bind(2, message_id);
        if (!stmt.Step()) {
            return std::nullopt;
        }
        const auto json = nlohmann::json::parse(stmt.ColumnText(0), nullptr, false);
        if (json.is_discarded()) {
            throw StoreUnavailable("stored message " + source_id + ":" + message_id + " is corrupt");
        }
        return StoredMessageFromJson(json);
    } catch (const utils::SqliteError& ex) {
        throw StoreUnavailable(std::string("get failed: ") + ex.what());
    }
}

std::vector<queue::DeadLetterEntry> SqliteMessageStore::ListDeadLetters(std::size_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<queue::DeadLetterEntry> entries;
    try {
        utils::SqliteStatement stmt(
            db_, "SELECT body FROM dead_letters ORDER BY promoted_at_ms DESC LIMIT ?;");
        stmt.Bind(1, static_cast<long long>(limit));
        while (stmt.Step()) {
            auto entry = ParseDeadLetter(stmt.ColumnText(0));
            if (entry) {
                entries.push_back(std::move(*entry));
            }
        }
    } catch (const utils::SqliteError& ex) {
        throw StoreUnavailable(std::string("dead-letter list failed: ") + ex.what());
    }
    return entries;
}

std::optional<queue::DeadLetterEntry> SqliteMessageStore::GetDeadLetter(const std::string& source_id,
                                                                        const std::string& message_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        utils::SqliteStatement stmt(
            db_, "SELECT body FROM dead_letters WHERE source_id = ? AND message_id = ?;");
        stmt.Bind(1, source_id).Bind(2, message_id);
        if (!stmt.Step()) {
            return std::nullopt;
        }
        return ParseDeadLetter(stmt.ColumnText(0));
    } catch (const utils::SqliteError& ex) {
        throw StoreUnavailable(std::string("dead-letter get failed: ") + ex.what());
    }
}

bool SqliteMessageStore::DeleteDeadLetter(const std::string& source_id, const std::string& message_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        utils::SqliteStatement stmt(
            db_, "DELETE FROM dead_letters WHERE source_id = ? AND message_id = ?;");
        stmt.Bind(1, source_id).Bind(2, message_id);
        stmt.Step();
        return db_.Changes() > 0;
    } catch (const utils::SqliteError& ex) {
        throw StoreUnavailable(std::string("dead-letter delete failed: ") + ex.what());
    }
}

long long SqliteMessageStore::CountMessages() {
    std::lock_guard<std::mutex> lock(mutex_);
    return CountLocked("SELECT COUNT(*) FROM messages;");
}

long long SqliteMessageStore::CountDeadLetters() {
    std::lock_guard<std::mutex> lock(mutex_);
    return CountLocked("SELECT COUNT(*) FROM dead_letters;");
}

std::vector<std::pair<std::string, long long>> SqliteMessageStore::CountByPartition() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::pair<std::string, long long>> counts;
    try {
        utils::SqliteStatement stmt(
            db_, "SELECT target_partition, COUNT(*) FROM messages GROUP BY target_partition ORDER BY target_partition;");
        while (stmt.Step()) {
            counts.emplace_back(stmt.ColumnText(0), stmt.ColumnInt64(1));
        }
    } catch (const utils::SqliteError& ex) {
        throw StoreUnavailable(std::string("count failed: ") + ex.what());
    }
    return counts;
}

long long SqliteMessageStore::CountLocked(const char* sql) {
    try {
        utils::SqliteStatement stmt(db_, sql);
        return stmt.Step() ? stmt.ColumnInt64(0) : 0;
    } catch (const utils::SqliteError& ex) {
        throw StoreUnavailable(std::string("count failed: ") + ex.what());
    }
}

}  // namespace osintpipe::store
