#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <thread>

namespace osintpipe::enrichment {

// Owns the threads that run sub-service calls. A call that overruns its
// step timeout keeps running here after Enrich has moved on; finished
// threads are joined on the next Run and the destructor joins the rest.
class ServiceCallRunner {
public:
    explicit ServiceCallRunner(std::size_t max_in_flight);
    ~ServiceCallRunner();

    ServiceCallRunner(const ServiceCallRunner&) = delete;
    ServiceCallRunner& operator=(const ServiceCallRunner&) = delete;

    // Starts task on its own thread. Returns false without running it when
    // max_in_flight calls are still running or no thread could be started.
    // task must not throw.
    bool Run(std::function<void()> task);

    std::size_t InFlight();

private:
    struct Call {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void ReapLocked();

    std::size_t max_in_flight_;
    std::mutex mutex_;
    std::list<Call> calls_;
};

}  // namespace osintpipe::enrichment
