/*
 * sweprov - Container Artifact Provisioning
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <cstddef>
#include <functional>
#include <future>
#include <vector>

#include "sweprov/config.hpp"
#include "sweprov/pool.hpp"
#include "sweprov/types.hpp"

namespace sweprov {

using ProvisionFn = std::function<ProvisionResult(const WorkItem&)>;

// Counts for the current run only; the store stays the source of truth.
struct RunStats {
    std::size_t attempted = 0;
    std::size_t skipped = 0;
    std::size_t succeeded = 0;
    std::size_t failed = 0;
};

// Runs every item exactly once with at most `concurrencyLimit` in flight and
// returns only when all of them reached a terminal outcome. The preferred
// mechanism degrades pool -> async -> sequential when it cannot start.
class Dispatcher {
public:
    explicit Dispatcher(ProvisionFn provision, DispatchMode preferred = DispatchMode::Pool) noexcept;
    virtual ~Dispatcher() = default;

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    void run(const std::vector<WorkItem>& items, int concurrencyLimit);

    [[nodiscard]] RunStats stats() const noexcept;
    [[nodiscard]] DispatchMode lastMode() const noexcept { return lastMode_; }

protected:
    // Mechanism start points. A false return or a std::system_error means
    // the mechanism could not take the work.
    [[nodiscard]] virtual bool startPool(Pool& pool, ItemProcessor processor);
    [[nodiscard]] virtual bool submitToPool(Pool& pool, const WorkItem& item);
    [[nodiscard]] virtual std::future<void> launchLane(std::function<void()> lane);

private:
    // Each returns how many items, starting at `first`, it took ownership of.
    [[nodiscard]] std::size_t runPool(const std::vector<WorkItem>& items, std::size_t first, int limit);
    [[nodiscard]] std::size_t runAsync(const std::vector<WorkItem>& items, std::size_t first, int limit);
    void runSequential(const std::vector<WorkItem>& items, std::size_t first);

    void execute(const WorkItem& item) noexcept;

    ProvisionFn provision_;
    DispatchMode preferred_;
    DispatchMode lastMode_;

    std::atomic<std::size_t> attempted_{0};
    std::atomic<std::size_t> skipped_{0};
    std::atomic<std::size_t> succeeded_{0};
    std::atomic<std::size_t> failed_{0};
};

}
