#pragma once

#include <filesystem>
#include <mutex>
#include <utility>
#include <vector>

#include "store/message_store.hpp"
#include "utils/sqlite.hpp"

namespace osintpipe::store {

class SqliteMessageStore : public MessageStore {
public:
    explicit SqliteMessageStore(const std::filesystem::path& db_path);

    void UpsertMessage(const StoredMessage& message) override;
    bool InsertDeadLetter(const queue::DeadLetterEntry& entry) override;

    std::optional<StoredMessage> GetMessage(const std::string& source_id,
                                            const std::string& message_id) override;
    std::vector<queue::DeadLetterEntry> ListDeadLetters(std::size_t limit) override;
    std::optional<queue::DeadLetterEntry> GetDeadLetter(const std::string& source_id,
                                                        const std::string& message_id) override;
    bool DeleteDeadLetter(const std::string& source_id, const std::string& message_id) override;
    long long CountMessages() override;
    long long CountDeadLetters() override;

    // Messages per target partition, spam rows counted under "spam".
    std::vector<std::pair<std::string, long long>> CountByPartition();

private:
    long long CountLocked(const char* sql);

    utils::SqliteDatabase db_;
    std::mutex mutex_;
};

}  // namespace osintpipe::store
