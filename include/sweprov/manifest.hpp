/*
 * sweprov - Container Artifact Provisioning
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <string>
#include <vector>

#include "sweprov/config.hpp"
#include "sweprov/types.hpp"

namespace sweprov {

struct ManifestResult {
    bool ok = false;
    std::vector<InstanceId> instances;   // ordered, duplicates removed
    std::size_t duplicates = 0;
    ErrorKind error = ErrorKind::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

// "a, b,,c" -> {a, b, c}
[[nodiscard]] ManifestResult parseInstanceList(const std::string& csv);

// One id per line; blank lines and '#' comments are ignored.
[[nodiscard]] ManifestResult readManifest(const std::filesystem::path& file);

// Whichever source the configuration names.
[[nodiscard]] ManifestResult loadInstances(const Config& config);

}
