/*
 * sweprov - Container Artifact Provisioning
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sweprov/pool.hpp"
#include "sweprov/logger.hpp"

namespace sweprov {

Pool::Pool(int workers) noexcept : workers_(workers < 1 ? 1 : workers) {
    LOG_DEBUG("Pool created with " + std::to_string(workers_) + " workers");
}

Pool::~Pool() {
    stop();
}

bool Pool::start(ItemProcessor processor) {
    if (running_.load()) {
        LOG_WARN("Pool already running");
        return false;
    }

    if (!processor) {
        LOG_ERROR("Invalid item processor provided");
        return false;
    }

    processor_ = std::move(processor);
    running_.store(true);
    shutdown_.store(false);

    try {
        workerThreads_.reserve(workers_);
        for (int i = 0; i < workers_; ++i) {
            workerThreads_.emplace_back(&Pool::workerLoop, this, i);
        }
        
        LOG_DEBUG("Pool started with " + std::to_string(workers_) + " worker threads");
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start pool: " + std::string(e.what()));
        shutdown_.store(true);
        running_.store(false);
        itemAvailable_.notify_all();
        joinAll();
        return false;
    }
}

void Pool::stop() noexcept {
    if (!running_.load()) {
        return;
    }

    LOG_DEBUG("Stopping pool...");
    
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        shutdown_.store(true);
        running_.store(false);
    }
    itemAvailable_.notify_all();
    joinAll();
    
    std::size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        dropped = itemQueue_.size();
        while (!itemQueue_.empty()) {
            itemQueue_.pop();
        }
    }
    idle_.notify_all();

    if (dropped > 0) {
        LOG_WARN("Pool stopped with " + std::to_string(dropped) + " queued items not run");
    } else {
        LOG_DEBUG("Pool stopped");
    }
}

bool Pool::submit(const WorkItem& item) noexcept {
    if (!running_.load() || shutdown_.load()) {
        LOG_ERROR("Cannot submit item to stopped pool: " + item.id);
        return false;
    }

    try {
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            itemQueue_.push(item);
        }
        
        itemAvailable_.notify_one();
        LOG_TRACE("Item queued: " + item.id);
        return true;
    } catch (...) {
        LOG_ERROR("Failed to queue item: " + item.id);
        return false;
    }
}

void Pool::waitIdle() {
    std::unique_lock<std::mutex> lock(queueMutex_);
    idle_.wait(lock, [this] {
        return (itemQueue_.empty() && active_ == 0) || !running_.load();
    });
}

std::size_t Pool::queueSize() const noexcept {
    std::lock_guard<std::mutex> lock(queueMutex_);
    return itemQueue_.size();
}

std::size_t Pool::activeCount() const noexcept {
    std::lock_guard<std::mutex> lock(queueMutex_);
    return active_;
}

void Pool::workerLoop(int workerId) {
    setThreadName(getThreadName(workerId));
    LOG_TRACE("Worker-" + std::to_string(workerId) + " thread started");
    
    while (true) {
        WorkItem item;
        
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            itemAvailable_.wait(lock, [this] { 
                return !itemQueue_.empty() || shutdown_.load(); 
            });
            
            if (shutdown_.load()) {
                break;
            }
            
            item = std::move(itemQueue_.front());
            itemQueue_.pop();
            ++active_;
        }
        
        // Run outside of the lock
        try {
            processor_(item, workerId);
        } catch (const std::exception& e) {
            LOG_ERROR("Worker " + std::to_string(workerId) + " item processing error: " + 
                     std::string(e.what()) + " (item: " + item.id + ")");
        } catch (...) {
            LOG_ERROR("Worker " + std::to_string(workerId) + " unknown item processing error (item: " + item.id + ")");
        }

        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            --active_;
            if (itemQueue_.empty() && active_ == 0) {
                idle_.notify_all();
            }
        }
    }
    
    LOG_TRACE("Worker " + std::to_string(workerId) + " stopped");
}

void Pool::joinAll() noexcept {
    for (auto& thread : workerThreads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    workerThreads_.clear();
}

}
