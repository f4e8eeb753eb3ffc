/*
 * sweprov - Container Artifact Provisioning
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <iostream>
#include <string>
#include <vector>

#include "sweprov/config.hpp"
#include "sweprov/dispatcher.hpp"
#include "sweprov/fetcher.hpp"
#include "sweprov/reporter.hpp"
#include "sweprov/types.hpp"

namespace sweprov {

constexpr int kExitMaxFailures = 253;
constexpr int kExitConfigurationError = 254;
constexpr int kExitAggregationError = 255;

struct PipelineResult {
    bool ok = false;
    Summary summary;
    RunStats stats;
    ErrorKind error = ErrorKind::None;
    std::string message;

    // Instances still missing, clamped, or one of the fatal codes.
    [[nodiscard]] int exitCode() const noexcept;
};

// resolve -> dispatch -> re-scan -> report
class Pipeline final {
public:
    Pipeline(const Config& config, Fetcher& fetcher, std::ostream& out = std::cout);

    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;
    Pipeline(Pipeline&&) = delete;
    Pipeline& operator=(Pipeline&&) = delete;

    [[nodiscard]] PipelineResult run();

private:
    [[nodiscard]] bool createDirectories(std::string& error) noexcept;
    [[nodiscard]] std::vector<WorkItem> resolveAll(const std::vector<InstanceId>& instances);
    void printPlan(const std::vector<WorkItem>& items);

    const Config& config_;
    Fetcher& fetcher_;
    std::ostream& out_;
};

}
