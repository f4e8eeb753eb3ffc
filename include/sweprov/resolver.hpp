/*
 * sweprov - Container Artifact Provisioning
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <string>

#include "sweprov/config.hpp"
#include "sweprov/types.hpp"

namespace sweprov {

struct ResolveResult {
    bool ok = false;
    WorkItem item;
    ErrorKind error = ErrorKind::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

// "__" -> "_s_", left to right, non-overlapping.
[[nodiscard]] std::string escapeInstanceId(const std::string& id);
// "_s_" -> "__", the inverse on every id accepted by resolve().
[[nodiscard]] std::string unescapeInstanceId(const std::string& escaped);

// <prefix>.<arch>.<escaped-id>, case preserved
[[nodiscard]] std::string artifactBaseName(const InstanceId& id, const Config& config);

// Maps an instance id to its remote reference, store path and failure log
// path. Pure: touches neither the filesystem nor the network.
[[nodiscard]] ResolveResult resolve(const InstanceId& id, const Config& config);

}
