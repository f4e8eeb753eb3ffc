/*
 * sweprov - Container Artifact Provisioning
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <ostream>
#include <string>

#include "sweprov/fetcher.hpp"
#include "sweprov/scanner.hpp"
#include "sweprov/types.hpp"

namespace sweprov {

// Provisions a single work item: skip when the store already holds it,
// otherwise fetch into a partial file and publish it with a rename.
class Processor {
public:
    Processor(const Scanner& scanner, Fetcher& fetcher, std::ostream& progress);
    
    Processor(const Processor&) = delete;
    Processor& operator=(const Processor&) = delete;
    Processor(Processor&&) = delete;
    Processor& operator=(Processor&&) = delete;

    [[nodiscard]] ProvisionResult provision(const WorkItem& item) noexcept;

private:
    const Scanner& scanner_;
    Fetcher& fetcher_;
    std::ostream& progress_;
    bool color_;

    [[nodiscard]] bool publish(const std::filesystem::path& partial, const std::filesystem::path& artifact) noexcept;
    void discardPartial(const std::filesystem::path& partial) noexcept;
    void removeLog(const std::filesystem::path& log) noexcept;
    void appendToLog(const std::filesystem::path& log, const std::string& message) noexcept;
    void report(const InstanceId& id, const std::string& state, const char* colorCode, const std::string& detail = "") noexcept;
};

}
