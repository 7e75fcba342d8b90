#pragma once

#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "queue/queue_types.hpp"

namespace osintpipe::channels {

// A listener that turns source posts into envelopes and hands them to the
// queue. While the queue is unavailable envelopes are held in a bounded
// local buffer and retried in arrival order.
class ChannelBase {
public:
    // Returns the queue position; throws QueueUnavailable when the queue is down.
    using EnqueueFn = std::function<long long(const queue::MessageEnvelope&)>;

    ChannelBase(std::string name,
                EnqueueFn enqueue,
                std::vector<std::string> allow_from,
                std::size_t buffer_limit);
    virtual ~ChannelBase() = default;
    virtual std::string Name() const { return name_; }
    virtual void Start() = 0;
    virtual void Stop() = 0;

    bool IsAllowed(const std::string& source_id) const;
    // False when the envelope was rejected or the buffer was full.
    bool HandleMessage(queue::MessageEnvelope envelope);
    // Retries buffered envelopes in order; stops at the first failure.
    std::size_t FlushBuffer();
    std::size_t Buffered() const;

    bool IsRunning() const { return running_; }

protected:
    std::string name_;
    std::vector<std::string> allow_from_;
    bool running_ = false;

private:
    std::size_t FlushLocked();

    EnqueueFn enqueue_;
    std::size_t buffer_limit_;
    std::deque<queue::MessageEnvelope> buffer_;
    mutable std::mutex buffer_mutex_;
};

}  // namespace osintpipe::channels
