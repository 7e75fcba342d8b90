#include "channels/channel_base.hpp"

#include <algorithm>

#include "core/errors.hpp"
#include "utils/logging.hpp"

namespace osintpipe::channels {

ChannelBase::ChannelBase(std::string name,
                         EnqueueFn enqueue,
                         std::vector<std::string> allow_from,
                         std::size_t buffer_limit)
    : name_(std::move(name))
    , allow_from_(std::move(allow_from))
    , enqueue_(std::move(enqueue))
    , buffer_limit_(buffer_limit) {}

bool ChannelBase::IsAllowed(const std::string& source_id) const {
    if (allow_from_.empty()) {
        return true;
    }
    return std::find(allow_from_.begin(), allow_from_.end(), source_id) != allow_from_.end();
}

bool ChannelBase::HandleMessage(queue::MessageEnvelope envelope) {
    if (!IsAllowed(envelope.source_id)) {
        utils::Log(utils::LogLevel::kDebug, name_, "post ignored; source not in allow_from",
            {{"source", envelope.source_id}});
        return false;
    }
    std::lock_guard<std::mutex> lock(buffer_mutex_);
    FlushLocked();
    if (buffer_.empty()) {
        try {
            enqueue_(envelope);
            return true;
        } catch (const QueueUnavailable& ex) {
            utils::Log(utils::LogLevel::kWarn, name_, "queue unavailable; buffering",
                {{"key", envelope.Key()}, {"error", ex.what()}});
        }
    }
    if (buffer_.size() >= buffer_limit_) {
        utils::Log(utils::LogLevel::kError, name_, "buffer full; dropping post",
            {{"key", envelope.Key()}, {"limit", std::to_string(buffer_limit_)}});
        return false;
    }
    buffer_.push_back(std::move(envelope));
    return true;
}

std::size_t ChannelBase::FlushBuffer() {
    std::lock_guard<std::mutex> lock(buffer_mutex_);
    return FlushLocked();
}

std::size_t ChannelBase::FlushLocked() {
    std::size_t flushed = 0;
    while (!buffer_.empty()) {
        try {
            enqueue_(buffer_.front());
        } catch (const QueueUnavailable&) {
            break;
        }
        buffer_.pop_front();
        ++flushed;
    }
    if (flushed > 0) {
        utils::Log(utils::LogLevel::kInfo, name_, "flushed buffered posts",
            {{"count", std::to_string(flushed)}, {"remaining", std::to_string(buffer_.size())}});
    }
    return flushed;
}

std::size_t ChannelBase::Buffered() const {
    std::lock_guard<std::mutex> lock(buffer_mutex_);
    return buffer_.size();
}

}  // namespace osintpipe::channels
