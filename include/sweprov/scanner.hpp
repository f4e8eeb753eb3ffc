/*
 * sweprov - Container Artifact Provisioning
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "sweprov/types.hpp"

namespace sweprov {

struct ArtifactFile {
    std::string name;
    std::filesystem::path path;
    std::uintmax_t size = 0;
};

struct ScanResult {
    bool ok = false;
    std::vector<ArtifactFile> artifacts;
    ErrorKind error = ErrorKind::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

// Read-only view of the store directory. The store is the only persisted
// state: an artifact that passes exists() is provisioned.
class Scanner {
public:
    static constexpr const char* kPartialSuffix = ".partial";
    static constexpr const char* kArtifactSuffix = ".sif";

    Scanner(const std::filesystem::path& store, const std::string& namePrefix, bool verifySif = false) noexcept;
    
    Scanner(const Scanner&) = delete;
    Scanner& operator=(const Scanner&) = delete;
    Scanner(Scanner&&) noexcept = default;
    Scanner& operator=(Scanner&&) noexcept = default;

    // Regular, non-empty, fully published file (optionally with a SIF header).
    [[nodiscard]] bool exists(const std::filesystem::path& artifact) const noexcept;

    // Every well-formed artifact in the store, sorted by name.
    [[nodiscard]] ScanResult scan() const noexcept;

    [[nodiscard]] const std::filesystem::path& store() const noexcept { return store_; }
    [[nodiscard]] bool verifiesSif() const noexcept { return verifySif_; }

    [[nodiscard]] static std::filesystem::path partialPath(const std::filesystem::path& artifact);
    [[nodiscard]] static bool hasSifHeader(const std::filesystem::path& file) noexcept;

private:
    std::filesystem::path store_;
    std::string namePrefix_;
    bool verifySif_;

    [[nodiscard]] bool isArtifactName(const std::string& name) const noexcept;
};

}
