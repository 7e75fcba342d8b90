#include "pipeline/worker_pool.hpp"

#include "utils/logging.hpp"

namespace osintpipe::pipeline {

WorkerPool::WorkerPool(WorkerContext context, PoolOptions options)
    : options_(std::move(options)) {
    for (std::size_t i = 0; i < options_.count; ++i) {
        WorkerOptions worker{};
        worker.consumer_group = options_.consumer_group;
        worker.worker_id = options_.id_prefix + "-" + std::to_string(i + 1);
        worker.batch_size = options_.batch_size;
        worker.block_timeout = options_.block_timeout;
        workers_.push_back(std::make_unique<Worker>(context, std::move(worker)));
    }
}

WorkerPool::~WorkerPool() {
    Stop();
}

void WorkerPool::Start() {
    if (!threads_.empty()) {
        return;
    }
    for (auto& worker : workers_) {
        threads_.emplace_back([w = worker.get()] { w->Run(); });
    }
    utils::Log(utils::LogLevel::kInfo, "pool", "workers started",
        {{"count", std::to_string(workers_.size())}, {"group", options_.consumer_group}});
}

void WorkerPool::Stop() {
    if (threads_.empty()) {
        return;
    }
    for (auto& worker : workers_) {
        worker->Stop();
    }
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();
    const auto stats = Stats();
    utils::Log(utils::LogLevel::kInfo, "pool", "workers stopped",
        {{"processed", std::to_string(stats.processed)},
         {"failed", std::to_string(stats.failed)},
         {"dead_lettered", std::to_string(stats.dead_lettered)}});
}

WorkerStats WorkerPool::Stats() const {
    WorkerStats total{};
    for (const auto& worker : workers_) {
        total += worker->Stats();
    }
    return total;
}

}  // namespace osintpipe::pipeline
