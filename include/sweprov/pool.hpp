/*
 * sweprov - Container Artifact Provisioning
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

#include "sweprov/types.hpp"

namespace sweprov {

using ItemProcessor = std::function<void(const WorkItem&, int workerId)>;

// Fixed-size worker pool. Each worker runs one item to completion before
// taking the next, so at most workerCount() items are in flight.
class Pool {
public:
    explicit Pool(int workers) noexcept;
    ~Pool();

    Pool(const Pool&) = delete;
    Pool& operator=(const Pool&) = delete;
    Pool(Pool&&) = delete;
    Pool& operator=(Pool&&) = delete;

    [[nodiscard]] bool start(ItemProcessor processor);
    void stop() noexcept;
    [[nodiscard]] bool submit(const WorkItem& item) noexcept;

    // Blocks until the queue is empty and no worker is busy.
    void waitIdle();
    
    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }
    [[nodiscard]] std::size_t queueSize() const noexcept;
    [[nodiscard]] std::size_t activeCount() const noexcept;
    [[nodiscard]] int workerCount() const noexcept { return workers_; }

private:
    void workerLoop(int workerId);
    void joinAll() noexcept;
    
    int workers_;
    ItemProcessor processor_;
    
    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};
    
    mutable std::mutex queueMutex_;
    std::condition_variable itemAvailable_;
    std::condition_variable idle_;
    std::queue<WorkItem> itemQueue_;
    std::size_t active_ = 0;
    
    std::vector<std::thread> workerThreads_;
};

}
