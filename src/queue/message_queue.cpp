#include "queue/message_queue.hpp"

#include <algorithm>
#include <stdexcept>

#include "core/errors.hpp"
#include "nlohmann/json.hpp"
#include "queue/queue_json.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace osintpipe::queue {
namespace {

constexpr const char* kSchema = R"SQL(
CREATE TABLE IF NOT EXISTS entries (
  position INTEGER PRIMARY KEY AUTOINCREMENT,
  source_id TEXT NOT NULL,
  message_id TEXT NOT NULL,
  envelope TEXT NOT NULL,
  enqueued_at_ms INTEGER NOT NULL
);
CREATE TABLE IF NOT EXISTS groups (
  name TEXT PRIMARY KEY,
  last_position INTEGER NOT NULL DEFAULT 0,
  acked INTEGER NOT NULL DEFAULT 0,
  dead_lettered INTEGER NOT NULL DEFAULT 0
);
CREATE TABLE IF NOT EXISTS deliveries (
  group_name TEXT NOT NULL,
  position INTEGER NOT NULL,
  state TEXT NOT NULL,
  token TEXT UNIQUE,
  worker_id TEXT,
  claimed_at_ms INTEGER,
  available_at_ms INTEGER NOT NULL DEFAULT 0,
  attempt_count INTEGER NOT NULL DEFAULT 0,
  first_claimed_at_ms INTEGER NOT NULL,
  last_error TEXT,
  history TEXT NOT NULL DEFAULT '[]',
  PRIMARY KEY (group_name, position)
);
CREATE INDEX IF NOT EXISTS idx_deliveries_state
  ON deliveries(group_name, state, available_at_ms);
)SQL";

void LogEvent(utils::LogLevel level,
              const std::string& message,
              std::vector<std::pair<std::string, std::string>> fields = {}) {
    utils::Log(level, "queue", message, std::move(fields));
}

std::vector<AttemptRecord> ParseHistory(const std::string& text) {
    const auto json = nlohmann::json::parse(text, nullptr, false);
    if (json.is_discarded()) {
        return {};
    }
    return AttemptHistoryFromJson(json);
}

}  // namespace

MessageQueue::MessageQueue(QueueOptions options)
    : options_(std::move(options)) {
    Init();
}

MessageQueue::~MessageQueue() {
    Shutdown();
}

void MessageQueue::Init() {
    try {
        db_.Open(options_.db_path);
        db_.Exec(kSchema);
    } catch (const utils::SqliteError& ex) {
        throw QueueUnavailable(ex.what());
    }
}

void MessageQueue::SetDeadLetterSink(DeadLetterSink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
}

long long MessageQueue::Enqueue(const MessageEnvelope& envelope) {
    if (envelope.source_id.empty() || envelope.message_id.empty()) {
        throw std::invalid_argument("envelope identity requires source_id and message_id");
    }
    long long position = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        try {
            utils::SqliteStatement stmt(
                db_,
                "INSERT INTO entries (source_id, message_id, envelope, enqueued_at_ms) "
                "VALUES (?, ?, ?, ?);");
            stmt.Bind(1, envelope.source_id)
                .Bind(2, envelope.message_id)
                .Bind(3, EnvelopeToJson(envelope).dump())
                .Bind(4, utils::NowMs());
            stmt.Step();
            position = db_.LastInsertRowId();
        } catch (const utils::SqliteError& ex) {
            throw QueueUnavailable(std::string("enqueue failed: ") + ex.what());
        }
    }
    cv_.notify_all();
    LogEvent(utils::LogLevel::kDebug, "enqueued",
        {{"key", envelope.Key()}, {"position", std::to_string(position)}});
    return position;
}

std::vector<ClaimedEnvelope> MessageQueue::Claim(const std::string& group,
                                                 const std::string& worker_id,
                                                 std::size_t max_batch,
                                                 std::chrono::milliseconds block_timeout) {
    if (max_batch == 0) {
        return {};
    }
    const auto deadline = std::chrono::steady_clock::now() + block_timeout;
    std::unique_lock<std::mutex> lock(mutex_);
    while (!shutdown_) {
        auto claimed = TryClaimLocked(group, worker_id, max_batch);
        if (!claimed.empty()) {
            return claimed;
        }
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            break;
        }
        // Other processes may append to the same file, so poll as well as wait.
        cv_.wait_until(lock, std::min(deadline, now + options_.poll_interval));
    }
    return {};
}

std::vector<ClaimedEnvelope> MessageQueue::TryClaimLocked(const std::string& group,
                                                          const std::string& worker_id,
                                                          std::size_t max_batch) {
    std::vector<ClaimedEnvelope> claimed;
    try {
        utils::SqliteTransaction tx(db_);
        EnsureGroupLocked(group);
        const auto now_ms = utils::NowMs();
        ReclaimStaleLocked(group, now_ms);
        PromotePoisonedLocked(group);

        std::vector<long long> positions;
        {
            utils::SqliteStatement stmt(
                db_,
                "SELECT position FROM deliveries "
                "WHERE group_name = ? AND state = 'ready' AND available_at_ms <= ? "
                "ORDER BY available_at_ms, position LIMIT ?;");
            stmt.Bind(1, group).Bind(2, now_ms).Bind(3, static_cast<long long>(max_batch));
            while (stmt.Step()) {
                positions.push_back(stmt.ColumnInt64(0));
            }
        }

        if (positions.size() < max_batch) {
            long long last_position = 0;
            {
                utils::SqliteStatement stmt(db_, "SELECT last_position FROM groups WHERE name = ?;");
                stmt.Bind(1, group);
                if (stmt.Step()) {
                    last_position = stmt.ColumnInt64(0);
                }
            }
            std::vector<long long> fresh;
            {
                utils::SqliteStatement stmt(
                    db_,
                    "SELECT position FROM entries WHERE position > ? ORDER BY position LIMIT ?;");
                stmt.Bind(1, last_position)
                    .Bind(2, static_cast<long long>(max_batch - positions.size()));
                while (stmt.Step()) {
                    fresh.push_back(stmt.ColumnInt64(0));
                }
            }
            if (!fresh.empty()) {
                utils::SqliteStatement insert(
                    db_,
                    "INSERT OR IGNORE INTO deliveries "
                    "(group_name, position, state, first_claimed_at_ms, available_at_ms) "
                    "VALUES (?, ?, 'ready', ?, 0);");
                for (const auto position : fresh) {
                    insert.Reset();
                    insert.Bind(1, group).Bind(2, position).Bind(3, now_ms);
                    insert.Step();
                    positions.push_back(position);
                }
                utils::SqliteStatement advance(
                    db_, "UPDATE groups SET last_position = ? WHERE name = ?;");
                advance.Bind(1, fresh.back()).Bind(2, group);
                advance.Step();
            }
        }

        for (const auto position : positions) {
            auto envelope = LoadEnvelopeLocked(position);
            if (!envelope) {
                LogEvent(utils::LogLevel::kError, "entry payload unreadable; dropping delivery",
                    {{"group", group}, {"position", std::to_string(position)}});
                utils::SqliteStatement drop(
                    db_, "DELETE FROM deliveries WHERE group_name = ? AND position = ?;");
                drop.Bind(1, group).Bind(2, position);
                drop.Step();
                continue;
            }
            ClaimedEnvelope item{};
            item.token = utils::GenerateId(24);
            item.position = position;
            item.envelope = std::move(*envelope);
            {
                utils::SqliteStatement stmt(
                    db_,
                    "UPDATE deliveries SET state = 'pending', token = ?, worker_id = ?, "
                    "claimed_at_ms = ? WHERE group_name = ? AND position = ?;");
                stmt.Bind(1, item.token)
                    .Bind(2, worker_id)
                    .Bind(3, now_ms)
                    .Bind(4, group)
                    .Bind(5, position);
                stmt.Step();
            }
            {
                utils::SqliteStatement stmt(
                    db_,
                    "SELECT attempt_count FROM deliveries WHERE group_name = ? AND position = ?;");
                stmt.Bind(1, group).Bind(2, position);
                if (stmt.Step()) {
                    item.attempt_count = static_cast<int>(stmt.ColumnInt64(0));
                }
            }
            claimed.push_back(std::move(item));
        }
        tx.Commit();
    } catch (const utils::SqliteError& ex) {
        throw QueueUnavailable(std::string("claim failed: ") + ex.what());
    }
    return claimed;
}

void MessageQueue::EnsureGroupLocked(const std::string& group) {
    utils::SqliteStatement stmt(db_, "INSERT OR IGNORE INTO groups (name) VALUES (?);");
    stmt.Bind(1, group);
    stmt.Step();
}

void MessageQueue::ReclaimStaleLocked(const std::string& group, long long now_ms) {
    std::vector<OpenDelivery> stale;
    {
        utils::SqliteStatement stmt(
            db_,
            "SELECT position, worker_id, attempt_count, first_claimed_at_ms, history "
            "FROM deliveries WHERE group_name = ? AND state = 'pending' AND claimed_at_ms <= ?;");
        stmt.Bind(1, group).Bind(2, now_ms - options_.claim_timeout.count());
        while (stmt.Step()) {
            OpenDelivery delivery{};
            delivery.group = group;
            delivery.position = stmt.ColumnInt64(0);
            delivery.worker_id = stmt.ColumnText(1);
            delivery.attempt_count = static_cast<int>(stmt.ColumnInt64(2));
            delivery.first_claimed_at_ms = stmt.ColumnInt64(3);
            delivery.history = ParseHistory(stmt.ColumnText(4));
            stale.push_back(std::move(delivery));
        }
    }
    for (auto& delivery : stale) {
        const auto worker_id = delivery.worker_id;
        const auto position = delivery.position;
        const auto outcome = RecordFailureLocked(
            std::move(delivery), "claim timed out (worker " + worker_id + ")", now_ms);
        LogEvent(utils::LogLevel::kWarn, "reclaimed stale claim",
            {{"group", group},
             {"position", std::to_string(position)},
             {"worker", worker_id},
             {"outcome", ToString(outcome)}});
    }
}

void MessageQueue::PromotePoisonedLocked(const std::string& group) {
    std::vector<OpenDelivery> poisoned;
    {
        utils::SqliteStatement stmt(
            db_,
            "SELECT position, worker_id, attempt_count, first_claimed_at_ms, history "
            "FROM deliveries WHERE group_name = ? AND state = 'poisoned' ORDER BY position;");
        stmt.Bind(1, group);
        while (stmt.Step()) {
            OpenDelivery delivery{};
            delivery.group = group;
            delivery.position = stmt.ColumnInt64(0);
            delivery.worker_id = stmt.ColumnText(1);
            delivery.attempt_count = static_cast<int>(stmt.ColumnInt64(2));
            delivery.first_claimed_at_ms = stmt.ColumnInt64(3);
            delivery.history = ParseHistory(stmt.ColumnText(4));
            poisoned.push_back(std::move(delivery));
        }
    }
    const auto now_ms = utils::NowMs();
    for (const auto& delivery : poisoned) {
        PromoteLocked(delivery, now_ms);
    }
}

std::optional<MessageQueue::OpenDelivery> MessageQueue::FindPendingLocked(const std::string& token) {
    utils::SqliteStatement stmt(
        db_,
        "SELECT group_name, position, worker_id, attempt_count, first_claimed_at_ms, history "
        "FROM deliveries WHERE token = ? AND state = 'pending';");
    stmt.Bind(1, token);
    if (!stmt.Step()) {
        return std::nullopt;
    }
    OpenDelivery delivery{};
    delivery.group = stmt.ColumnText(0);
    delivery.position = stmt.ColumnInt64(1);
    delivery.worker_id = stmt.ColumnText(2);
    delivery.attempt_count = static_cast<int>(stmt.ColumnInt64(3));
    delivery.first_claimed_at_ms = stmt.ColumnInt64(4);
    delivery.history = ParseHistory(stmt.ColumnText(5));
    return delivery;
}

NackOutcome MessageQueue::RecordFailureLocked(OpenDelivery delivery,
                                              const std::string& error,
                                              long long now_ms) {
    delivery.attempt_count += 1;
    delivery.history.push_back(AttemptRecord{delivery.attempt_count, error, utils::FromMs(now_ms)});
    const auto history = AttemptHistoryToJson(delivery.history).dump();

    if (delivery.attempt_count > options_.max_retries) {
        utils::SqliteStatement stmt(
            db_,
            "UPDATE deliveries SET state = 'poisoned', token = NULL, attempt_count = ?, "
            "last_error = ?, history = ? WHERE group_name = ? AND position = ?;");
        stmt.Bind(1, delivery.attempt_count)
            .Bind(2, error)
            .Bind(3, history)
            .Bind(4, delivery.group)
            .Bind(5, delivery.position);
        stmt.Step();
        return PromoteLocked(delivery, now_ms) ? NackOutcome::kDeadLettered : NackOutcome::kPoisoned;
    }

    utils::SqliteStatement stmt(
        db_,
        "UPDATE deliveries SET state = 'ready', token = NULL, attempt_count = ?, "
        "last_error = ?, history = ?, available_at_ms = ? "
        "WHERE group_name = ? AND position = ?;");
    stmt.Bind(1, delivery.attempt_count)
        .Bind(2, error)
        .Bind(3, history)
        .Bind(4, now_ms + BackoffMs(delivery.attempt_count))
        .Bind(5, delivery.group)
        .Bind(6, delivery.position);
    stmt.Step();
    return NackOutcome::kRetryScheduled;
}

bool MessageQueue::PromoteLocked(const OpenDelivery& delivery, long long now_ms) {
    const auto position = std::to_string(delivery.position);
    if (!sink_) {
        LogEvent(utils::LogLevel::kWarn, "no dead-letter sink; delivery stays poisoned",
            {{"group", delivery.group}, {"position", position}});
        return false;
    }
    auto envelope = LoadEnvelopeLocked(delivery.position);
    if (!envelope) {
        LogEvent(utils::LogLevel::kError, "poisoned entry payload unreadable",
            {{"group", delivery.group}, {"position", position}});
        return false;
    }
    DeadLetterEntry entry{};
    entry.envelope = std::move(*envelope);
    entry.consumer_group = delivery.group;
    entry.attempt_history = delivery.history;
    entry.first_claimed_at = utils::FromMs(delivery.first_claimed_at_ms);
    entry.promoted_at = utils::FromMs(now_ms);
    try {
        sink_(entry);
    } catch (const std::exception& ex) {
        LogEvent(utils::LogLevel::kError, "dead-letter promotion failed; delivery stays poisoned",
            {{"group", delivery.group}, {"key", entry.envelope.Key()}, {"error", ex.what()}});
        return false;
    }
    {
        utils::SqliteStatement stmt(
            db_, "DELETE FROM deliveries WHERE group_name = ? AND position = ?;");
        stmt.Bind(1, delivery.group).Bind(2, delivery.position);
        stmt.Step();
    }
    {
        utils::SqliteStatement stmt(
            db_, "UPDATE groups SET dead_lettered = dead_lettered + 1 WHERE name = ?;");
        stmt.Bind(1, delivery.group);
        stmt.Step();
    }
    const auto last_error = delivery.history.empty() ? std::string() : delivery.history.back().error;
    LogEvent(utils::LogLevel::kWarn, "promoted to dead-letter",
        {{"group", delivery.group},
         {"key", entry.envelope.Key()},
         {"attempts", std::to_string(delivery.history.size())},
         {"error", last_error}});
    return true;
}

std::optional<MessageEnvelope> MessageQueue::LoadEnvelopeLocked(long long position) {
    utils::SqliteStatement stmt(db_, "SELECT envelope FROM entries WHERE position = ?;");
    stmt.Bind(1, position);
    if (!stmt.Step()) {
        return std::nullopt;
    }
    const auto json = nlohmann::json::parse(stmt.ColumnText(0), nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        return std::nullopt;
    }
    return EnvelopeFromJson(json);
}

long long MessageQueue::BackoffMs(int attempt) const {
    long long delay = options_.backoff_base.count();
    const long long cap = options_.backoff_max.count();
    for (int i = 1; i < attempt && delay < cap; ++i) {
        delay *= 2;
    }
    return std::min(delay, cap);
}

bool MessageQueue::Ack(const std::string& token) {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        utils::SqliteTransaction tx(db_);
        auto delivery = FindPendingLocked(token);
        if (!delivery) {
            LogEvent(utils::LogLevel::kWarn, "ack for unknown or reclaimed token", {{"token", token}});
            return false;
        }
        {
            utils::SqliteStatement stmt(
                db_, "DELETE FROM deliveries WHERE group_name = ? AND position = ?;");
            stmt.Bind(1, delivery->group).Bind(2, delivery->position);
            stmt.Step();
        }
        {
            utils::SqliteStatement stmt(db_, "UPDATE groups SET acked = acked + 1 WHERE name = ?;");
            stmt.Bind(1, delivery->group);
            stmt.Step();
        }
        tx.Commit();
    } catch (const utils::SqliteError& ex) {
        throw QueueUnavailable(std::string("ack failed: ") + ex.what());
    }
    return true;
}

NackOutcome MessageQueue::Nack(const std::string& token, const std::string& error) {
    NackOutcome outcome = NackOutcome::kUnknownToken;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        try {
            utils::SqliteTransaction tx(db_);
            auto delivery = FindPendingLocked(token);
            if (!delivery) {
                LogEvent(utils::LogLevel::kWarn, "nack for unknown or reclaimed token",
                    {{"token", token}, {"error", error}});
                return NackOutcome::kUnknownToken;
            }
            outcome = RecordFailureLocked(std::move(*delivery), error, utils::NowMs());
            tx.Commit();
        } catch (const utils::SqliteError& ex) {
            throw QueueUnavailable(std::string("nack failed: ") + ex.what());
        }
    }
    cv_.notify_all();
    return outcome;
}

bool MessageQueue::Release(const std::string& token, const std::string& reason) {
    bool released = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        try {
            utils::SqliteStatement stmt(
                db_,
                "UPDATE deliveries SET state = 'ready', token = NULL, available_at_ms = ?, "
                "last_error = ? WHERE token = ? AND state = 'pending';");
            stmt.Bind(1, utils::NowMs()).Bind(2, reason).Bind(3, token);
            stmt.Step();
            released = db_.Changes() > 0;
        } catch (const utils::SqliteError& ex) {
            throw QueueUnavailable(std::string("release failed: ") + ex.what());
        }
    }
    if (released) {
        cv_.notify_all();
    } else {
        LogEvent(utils::LogLevel::kWarn, "release for unknown or reclaimed token", {{"token", token}});
    }
    return released;
}

QueueStats MessageQueue::Stats(const std::string& group) {
    std::lock_guard<std::mutex> lock(mutex_);
    QueueStats stats{};
    try {
        {
            utils::SqliteStatement stmt(db_, "SELECT COUNT(*) FROM entries;");
            if (stmt.Step()) {
                stats.entries = stmt.ColumnInt64(0);
            }
        }
        long long last_position = 0;
        {
            utils::SqliteStatement stmt(
                db_, "SELECT last_position, acked, dead_lettered FROM groups WHERE name = ?;");
            stmt.Bind(1, group);
            if (stmt.Step()) {
                last_position = stmt.ColumnInt64(0);
                stats.acked = stmt.ColumnInt64(1);
                stats.dead_lettered = stmt.ColumnInt64(2);
            }
        }
        {
            utils::SqliteStatement stmt(db_, "SELECT COUNT(*) FROM entries WHERE position > ?;");
            stmt.Bind(1, last_position);
            if (stmt.Step()) {
                stats.backlog = stmt.ColumnInt64(0);
            }
        }
        {
            utils::SqliteStatement stmt(
                db_,
                "SELECT state, available_at_ms <= ?, COUNT(*) FROM deliveries "
                "WHERE group_name = ? GROUP BY 1, 2;");
            stmt.Bind(1, utils::NowMs()).Bind(2, group);
            while (stmt.Step()) {
                const auto state = stmt.ColumnText(0);
                const auto due = stmt.ColumnInt64(1) != 0;
                const auto count = stmt.ColumnInt64(2);
                if (state == "pending") {
                    stats.pending += count;
                } else if (state == "poisoned") {
                    stats.poisoned += count;
                } else if (due) {
                    stats.retry_ready += count;
                } else {
                    stats.retry_waiting += count;
                }
            }
        }
    } catch (const utils::SqliteError& ex) {
        throw QueueUnavailable(std::string("stats failed: ") + ex.what());
    }
    return stats;
}

void MessageQueue::Shutdown() {
    shutdown_ = true;
    cv_.notify_all();
}

}  // namespace osintpipe::queue
