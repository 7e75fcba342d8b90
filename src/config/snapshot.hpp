#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <utility>

namespace osintpipe::config {

// Holds an immutable rule set. Readers take a shared_ptr to the current
// version and keep using it even if a reload swaps in a newer one.
template <typename T>
class VersionedSnapshot {
public:
    struct Entry {
        std::uint64_t version = 0;
        T value;
    };

    explicit VersionedSnapshot(T initial)
        : current_(std::make_shared<const Entry>(Entry{1, std::move(initial)})) {}

    std::shared_ptr<const Entry> Current() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return current_;
    }

    std::uint64_t Swap(T next) {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto version = current_->version + 1;
        current_ = std::make_shared<const Entry>(Entry{version, std::move(next)});
        return version;
    }

private:
    mutable std::mutex mutex_;
    std::shared_ptr<const Entry> current_;
};

}  // namespace osintpipe::config
