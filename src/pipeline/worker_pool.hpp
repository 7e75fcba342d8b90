#pragma once

#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "pipeline/worker.hpp"

namespace osintpipe::pipeline {

struct PoolOptions {
    std::size_t count = 4;
    std::string id_prefix = "worker";
    std::string consumer_group = "enrichment";
    std::size_t batch_size = 8;
    std::chrono::milliseconds block_timeout{1000};
};

// N workers on one consumer group, one thread each.
class WorkerPool {
public:
    WorkerPool(WorkerContext context, PoolOptions options);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    void Start();
    // Blocks until every worker has finished its in-flight envelope.
    void Stop();

    WorkerStats Stats() const;
    std::size_t Size() const { return workers_.size(); }
    bool Running() const { return !threads_.empty(); }

private:
    PoolOptions options_;
    std::vector<std::unique_ptr<Worker>> workers_;
    std::vector<std::thread> threads_;
};

}  // namespace osintpipe::pipeline
