/*
 * sweprov - Container Artifact Provisioning
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "sweprov/logger.hpp"
#include "sweprov/types.hpp"

namespace sweprov {

// Snapshot of the process environment, taken once by the entry point.
using Environment = std::map<std::string, std::string>;

enum class DispatchMode : uint8_t {
    Pool = 0,
    Async = 1,
    Sequential = 2
};

struct Config {
    // Remote naming
    std::string registry = "docker.io";
    std::string registryNamespace;
    std::string imagePrefix = "sweb.eval";
    std::string arch = "x86_64";
    std::string tag = "latest";

    // Local layout
    std::filesystem::path storeDirectory = "images";
    std::filesystem::path cacheDirectory;
    std::filesystem::path logDirectory;

    // Work list; exactly one is set after parsing
    std::string instanceList;
    std::filesystem::path manifestFile;

    int concurrencyLimit = 1;
    DispatchMode dispatch = DispatchMode::Pool;

    std::string apptainerExecutable;
    std::string httpProxy;
    std::string httpsProxy;

    bool verifySif = false;
    bool dryRun = false;
    LogLevel logLevel = LogLevel::INFO;

    Environment environment;
};

struct ConfigResult {
    bool ok = false;
    Config config;
    ErrorKind error = ErrorKind::None;
    std::string message;
    bool showHelp = false;
    bool showVersion = false;
    explicit operator bool() const noexcept { return ok; }
};

// Builds the configuration from command line arguments (without argv[0])
// and an environment snapshot. Flags take precedence over the environment.
[[nodiscard]] ConfigResult parseConfig(const std::vector<std::string>& args, const Environment& env);

// Searches each directory of a colon separated PATH for an executable file.
[[nodiscard]] std::string findExecutable(const std::string& name, const std::string& searchPath);

[[nodiscard]] const char* dispatchModeToString(DispatchMode mode) noexcept;
[[nodiscard]] const char* versionString() noexcept;

void printUsage(const char* progName);

}
