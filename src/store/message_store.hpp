#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "queue/queue_types.hpp"
#include "store/store_types.hpp"

namespace osintpipe::store {

// All operations throw StoreUnavailable when the backing store fails.
class MessageStore {
public:
    virtual ~MessageStore() = default;

    // Insert or overwrite by (source_id, message_id).
    virtual void UpsertMessage(const StoredMessage& message) = 0;
    // Write-once per envelope identity; returns false if one already exists.
    virtual bool InsertDeadLetter(const queue::DeadLetterEntry& entry) = 0;

    virtual std::optional<StoredMessage> GetMessage(const std::string& source_id,
                                                    const std::string& message_id) = 0;
    virtual std::vector<queue::DeadLetterEntry> ListDeadLetters(std::size_t limit) = 0;
    virtual std::optional<queue::DeadLetterEntry> GetDeadLetter(const std::string& source_id,
                                                                const std::string& message_id) = 0;
    // Used by replay; a later promotion of the same identity can then be written.
    virtual bool DeleteDeadLetter(const std::string& source_id, const std::string& message_id) = 0;
    virtual long long CountMessages() = 0;
    virtual long long CountDeadLetters() = 0;
};

}  // namespace osintpipe::store
