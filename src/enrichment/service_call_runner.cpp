#include "enrichment/service_call_runner.hpp"

#include <string>
#include <system_error>

#include "utils/logging.hpp"

namespace osintpipe::enrichment {

ServiceCallRunner::ServiceCallRunner(std::size_t max_in_flight)
    : max_in_flight_(max_in_flight == 0 ? 1 : max_in_flight) {}

ServiceCallRunner::~ServiceCallRunner() {
    std::list<Call> remaining;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        remaining.swap(calls_);
    }
    if (!remaining.empty()) {
        utils::Log(utils::LogLevel::kInfo, "enrichment", "waiting for in-flight service calls",
                   {{"count", std::to_string(remaining.size())}});
    }
    for (auto& call : remaining) {
        call.thread.join();
    }
}

bool ServiceCallRunner::Run(std::function<void()> task) {
    std::lock_guard<std::mutex> lock(mutex_);
    ReapLocked();
    if (calls_.size() >= max_in_flight_) {
        utils::Log(utils::LogLevel::kWarn, "enrichment", "service call rejected; too many in flight",
                   {{"in_flight", std::to_string(calls_.size())}});
        return false;
    }
    auto done = std::make_shared<std::atomic<bool>>(false);
    try {
        std::thread thread([task = std::move(task), done]() {
            task();
            done->store(true);
        });
        calls_.push_back(Call{std::move(thread), std::move(done)});
    } catch (const std::system_error& ex) {
        utils::Log(utils::LogLevel::kError, "enrichment", "cannot start service call thread",
                   {{"error", ex.what()}});
        return false;
    }
    return true;
}

std::size_t ServiceCallRunner::InFlight() {
    std::lock_guard<std::mutex> lock(mutex_);
    ReapLocked();
    return calls_.size();
}

void ServiceCallRunner::ReapLocked() {
    for (auto it = calls_.begin(); it != calls_.end();) {
        if (it->done->load()) {
            it->thread.join();
            it = calls_.erase(it);
        } else {
            ++it;
        }
    }
}

}  // namespace osintpipe::enrichment
