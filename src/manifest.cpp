/*
 * sweprov - Container Artifact Provisioning
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sweprov/manifest.hpp"
#include "sweprov/logger.hpp"
#include <fstream>
#include <sstream>
#include <unordered_set>

namespace sweprov {

namespace {

std::string trim(const std::string& value) {
    const char* ws = " \t\r\n";
    auto begin = value.find_first_not_of(ws);
    if (begin == std::string::npos) {
        return "";
    }
    auto end = value.find_last_not_of(ws);
    return value.substr(begin, end - begin + 1);
}

class Collector {
public:
    void add(const std::string& raw) {
        std::string id = trim(raw);
        if (id.empty()) {
            return;
        }
        if (!seen_.insert(id).second) {
            LOG_WARN("Duplicate instance ignored: " + id);
            ++result_.duplicates;
            return;
        }
        result_.instances.push_back(std::move(id));
    }

    ManifestResult finish(const std::string& source) {
        if (result_.instances.empty()) {
            result_.error = ErrorKind::Configuration;
            result_.message = "No instance ids in " + source;
            return std::move(result_);
        }
        result_.ok = true;
        LOG_DEBUG("Loaded " + std::to_string(result_.instances.size()) + " instances from " + source);
        return std::move(result_);
    }

private:
    ManifestResult result_;
    std::unordered_set<std::string> seen_;
};

}

ManifestResult parseInstanceList(const std::string& csv) {
    Collector collector;
    std::istringstream stream(csv);
    std::string token;
    while (std::getline(stream, token, ',')) {
        collector.add(token);
    }
    return collector.finish("--instances");
}

ManifestResult readManifest(const std::filesystem::path& file) {
    std::ifstream in(file);
    if (!in) {
        ManifestResult result;
        result.error = ErrorKind::Configuration;
        result.message = "Cannot read manifest: " + file.string();
        return result;
    }

    Collector collector;
    std::string line;
    while (std::getline(in, line)) {
        std::string trimmed = trim(line);
        if (trimmed.empty() || trimmed[0] == '#') {
            continue;
        }
        collector.add(trimmed);
    }
    if (in.bad()) {
        ManifestResult result;
        result.error = ErrorKind::Configuration;
        result.message = "I/O error reading manifest: " + file.string();
        return result;
    }
    return collector.finish(file.string());
}

ManifestResult loadInstances(const Config& config) {
    if (!config.manifestFile.empty()) {
        return readManifest(config.manifestFile);
    }
    return parseInstanceList(config.instanceList);
}

}
