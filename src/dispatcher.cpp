/*
 * sweprov - Container Artifact Provisioning
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sweprov/dispatcher.hpp"
#include "sweprov/logger.hpp"
#include <algorithm>
#include <system_error>

namespace sweprov {

Dispatcher::Dispatcher(ProvisionFn provision, DispatchMode preferred) noexcept
    : provision_(std::move(provision)), preferred_(preferred), lastMode_(preferred) {
}

void Dispatcher::run(const std::vector<WorkItem>& items, int concurrencyLimit) {
    const int limit = std::max(1, concurrencyLimit);
    std::size_t dispatched = 0;
    DispatchMode mode = preferred_;

    LOG_INFO("Dispatching " + std::to_string(items.size()) + " items (" + dispatchModeToString(mode) +
             ", limit " + std::to_string(limit) + ")");

    if (mode == DispatchMode::Pool && dispatched < items.size()) {
        lastMode_ = DispatchMode::Pool;
        dispatched += runPool(items, dispatched, limit);
        if (dispatched < items.size()) {
            LOG_WARN("Worker pool unavailable, falling back to async dispatch");
            mode = DispatchMode::Async;
        }
    }

    if (mode == DispatchMode::Async && dispatched < items.size()) {
        lastMode_ = DispatchMode::Async;
        dispatched += runAsync(items, dispatched, limit);
        if (dispatched < items.size()) {
            LOG_WARN("Async dispatch unavailable, running remaining items sequentially");
            mode = DispatchMode::Sequential;
        }
    }

    if (dispatched < items.size()) {
        lastMode_ = DispatchMode::Sequential;
        runSequential(items, dispatched);
    }

    RunStats s = stats();
    LOG_INFO("Run finished: " + std::to_string(s.attempted) + " attempted, " +
             std::to_string(s.skipped) + " skipped, " + std::to_string(s.succeeded) + " succeeded, " +
             std::to_string(s.failed) + " failed");
}

RunStats Dispatcher::stats() const noexcept {
    RunStats s;
    s.attempted = attempted_.load();
    s.skipped = skipped_.load();
    s.succeeded = succeeded_.load();
    s.failed = failed_.load();
    return s;
}

std::size_t Dispatcher::runPool(const std::vector<WorkItem>& items, std::size_t first, int limit) {
    const std::size_t remaining = items.size() - first;
    Pool pool(static_cast<int>(std::min<std::size_t>(static_cast<std::size_t>(limit), remaining)));

    try {
        if (!startPool(pool, [this](const WorkItem& item, int) { execute(item); })) {
            return 0;
        }
    } catch (const std::system_error& e) {
        LOG_WARN("Worker pool failed to start: " + std::string(e.what()));
        return 0;
    }

    std::size_t submitted = 0;
    for (std::size_t i = first; i < items.size(); ++i) {
        if (!submitToPool(pool, items[i])) {
            LOG_WARN("Worker pool refused " + items[i].id + " after " + std::to_string(submitted) + " items");
            break;
        }
        ++submitted;
    }

    pool.waitIdle();
    pool.stop();
    return submitted;
}

std::size_t Dispatcher::runAsync(const std::vector<WorkItem>& items, std::size_t first, int limit) {
    const std::size_t remaining = items.size() - first;
    const std::size_t lanes = std::min<std::size_t>(static_cast<std::size_t>(limit), remaining);
    std::atomic<std::size_t> next{first};

    auto lane = [this, &items, &next](std::size_t laneId) {
        setThreadName(getThreadName(static_cast<int>(laneId)));
        for (std::size_t i = next.fetch_add(1); i < items.size(); i = next.fetch_add(1)) {
            execute(items[i]);
        }
    };

    std::vector<std::future<void>> futures;
    futures.reserve(lanes);
    for (std::size_t l = 0; l < lanes; ++l) {
        try {
            futures.push_back(launchLane([&lane, l] { lane(l); }));
        } catch (const std::system_error& e) {
            LOG_WARN("Could only start " + std::to_string(l) + " of " + std::to_string(lanes) +
                     " async lanes: " + e.what());
            break;
        }
    }

    if (futures.empty()) {
        return 0;
    }

    // Running lanes drain every remaining index
    for (auto& future : futures) {
        future.get();
    }
    return remaining;
}

void Dispatcher::runSequential(const std::vector<WorkItem>& items, std::size_t first) {
    for (std::size_t i = first; i < items.size(); ++i) {
        execute(items[i]);
    }
}

bool Dispatcher::startPool(Pool& pool, ItemProcessor processor) {
    return pool.start(std::move(processor));
}

bool Dispatcher::submitToPool(Pool& pool, const WorkItem& item) {
    return pool.submit(item);
}

std::future<void> Dispatcher::launchLane(std::function<void()> lane) {
    return std::async(std::launch::async, std::move(lane));
}

void Dispatcher::execute(const WorkItem& item) noexcept {
    ++attempted_;
    ProvisionResult result;
    try {
        result = provision_(item);
    } catch (const std::exception& e) {
        LOG_ERROR("Provisioning " + item.id + " threw: " + std::string(e.what()));
        result.outcome = Outcome::Failed;
    } catch (...) {
        LOG_ERROR("Provisioning " + item.id + " threw an unknown exception");
        result.outcome = Outcome::Failed;
    }

    switch (result.outcome) {
        case Outcome::Skipped: ++skipped_; break;
        case Outcome::Succeeded: ++succeeded_; break;
        case Outcome::Failed: ++failed_; break;
    }
}

}
