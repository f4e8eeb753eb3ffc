/*
 * sweprov - Container Artifact Provisioning
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sweprov/scanner.hpp"
#include "sweprov/logger.hpp"
#include <algorithm>
#include <array>
#include <cstring>
#include <fstream>

namespace sweprov {

namespace {

// SIF global header: 32 byte launch script, then the magic.
constexpr std::size_t kSifMagicOffset = 32;
constexpr const char kSifMagic[] = "SIF_MAGIC";

bool endsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}

Scanner::Scanner(const std::filesystem::path& store, const std::string& namePrefix, bool verifySif) noexcept
    : store_(store), namePrefix_(namePrefix + "."), verifySif_(verifySif) {
}

bool Scanner::exists(const std::filesystem::path& artifact) const noexcept {
    try {
        if (endsWith(artifact.filename().string(), kPartialSuffix)) {
            return false;
        }

        std::error_code ec;
        if (!std::filesystem::is_regular_file(artifact, ec)) {
            return false;
        }

        auto size = std::filesystem::file_size(artifact, ec);
        if (ec || size == 0) {
            LOG_DEBUG("Ignoring empty artifact: " + artifact.string());
            return false;
        }

        if (verifySif_ && !hasSifHeader(artifact)) {
            LOG_WARN("Artifact without SIF header treated as absent: " + artifact.string());
            return false;
        }

        return true;
    } catch (const std::exception& e) {
        LOG_DEBUG("Cannot inspect " + artifact.string() + ": " + e.what());
        return false;
    }
}

ScanResult Scanner::scan() const noexcept {
    ScanResult result;
    
    try {
        std::error_code ec;
        if (!std::filesystem::is_directory(store_, ec)) {
            result.error = ErrorKind::Aggregation;
            result.message = "Store directory does not exist: " + store_.string();
            return result;
        }

        std::filesystem::directory_iterator it(store_, ec);
        if (ec) {
            result.error = ErrorKind::Aggregation;
            result.message = "Cannot read store directory " + store_.string() + ": " + ec.message();
            return result;
        }

        for (const auto& entry : it) {
            std::string name = entry.path().filename().string();
            if (!isArtifactName(name) || !exists(entry.path())) {
                continue;
            }
            ArtifactFile file;
            file.name = name;
            file.path = entry.path();
            file.size = std::filesystem::file_size(entry.path(), ec);
            if (ec) {
                continue;
            }
            result.artifacts.push_back(std::move(file));
            LOG_TRACE("Found artifact: " + name);
        }

        std::sort(result.artifacts.begin(), result.artifacts.end(),
                  [](const ArtifactFile& a, const ArtifactFile& b) { return a.name < b.name; });

        LOG_DEBUG("Scanner found " + std::to_string(result.artifacts.size()) + " artifacts in " + store_.string());
        result.ok = true;
    } catch (const std::exception& e) {
        result.artifacts.clear();
        result.error = ErrorKind::Aggregation;
        result.message = "Scanner error: " + std::string(e.what());
        LOG_ERROR(result.message);
    }
    
    return result;
}

std::filesystem::path Scanner::partialPath(const std::filesystem::path& artifact) {
    auto partial = artifact;
    partial += kPartialSuffix;
    return partial;
}

bool Scanner::hasSifHeader(const std::filesystem::path& file) noexcept {
    try {
        std::ifstream in(file, std::ios::binary);
        if (!in) {
            return false;
        }
        std::array<char, sizeof(kSifMagic) - 1> magic{};
        in.seekg(kSifMagicOffset);
        in.read(magic.data(), magic.size());
        if (in.gcount() != static_cast<std::streamsize>(magic.size())) {
            return false;
        }
        return std::memcmp(magic.data(), kSifMagic, magic.size()) == 0;
    } catch (...) {
        return false;
    }
}

bool Scanner::isArtifactName(const std::string& name) const noexcept {
    return name.size() > namePrefix_.size() + std::strlen(kArtifactSuffix) &&
           name.compare(0, namePrefix_.size(), namePrefix_) == 0 &&
           endsWith(name, kArtifactSuffix);
}

}
