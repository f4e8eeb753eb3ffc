/*
 * sweprov - Container Artifact Provisioning
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <string>

#include "sweprov/config.hpp"
#include "sweprov/process.hpp"
#include "sweprov/types.hpp"

namespace sweprov {

struct FetchResult {
    bool ok = false;
    std::string error;
};

// Pulls one remote image and converts it into a file at `destination`,
// writing all tool output to `log`. Implementations must be safe to call
// from several worker threads for distinct items.
class Fetcher {
public:
    virtual ~Fetcher() = default;

    [[nodiscard]] virtual FetchResult fetch(const WorkItem& item,
                                            const std::filesystem::path& destination,
                                            const std::filesystem::path& log) noexcept = 0;
};

// Runs `<apptainer> pull --force <destination> docker://<reference>`.
class ApptainerFetcher final : public Fetcher {
public:
    explicit ApptainerFetcher(const Config& config);

    [[nodiscard]] FetchResult fetch(const WorkItem& item,
                                    const std::filesystem::path& destination,
                                    const std::filesystem::path& log) noexcept override;

    [[nodiscard]] ProcessSpec buildCommand(const WorkItem& item, const std::filesystem::path& destination) const;

private:
    std::string executable_;
    std::filesystem::path cacheDirectory_;
    std::string httpProxy_;
    std::string httpsProxy_;
    Environment environment_;
};

}
