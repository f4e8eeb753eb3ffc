/*
 * sweprov - Container Artifact Provisioning
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <filesystem>
#include <ostream>
#include <string>
#include <vector>

#include "sweprov/config.hpp"
#include "sweprov/scanner.hpp"
#include "sweprov/types.hpp"

namespace sweprov {

struct MissingInstance {
    InstanceId id;
    std::filesystem::path log;   // empty when no failure log is on disk
    std::string reason;
};

struct Summary {
    std::size_t total = 0;
    std::size_t successful = 0;
    std::size_t failed = 0;
    std::vector<ArtifactFile> artifacts;   // everything in the store
    std::vector<MissingInstance> missing;
};

struct SummaryResult {
    bool ok = false;
    Summary summary;
    ErrorKind error = ErrorKind::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

class Reporter {
public:
    explicit Reporter(const Config& config);

    // Counts are derived from a fresh scan of the store, never from what
    // the current run did.
    [[nodiscard]] SummaryResult summarize(const Scanner& scanner, const std::vector<InstanceId>& instances) const noexcept;

    void print(const Summary& summary, std::ostream& out) const;
    [[nodiscard]] std::string environmentSnippet() const;

    [[nodiscard]] static std::string humanSize(std::uintmax_t bytes);

private:
    const Config& config_;
};

}
