/*
 * sweprov - Container Artifact Provisioning
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace sweprov {

struct ProcessSpec {
    std::string program;                        // absolute path or name found on PATH
    std::vector<std::string> args;              // without argv[0]
    std::map<std::string, std::string> env;     // complete child environment
};

struct ProcessResult {
    bool started = false;
    int exitCode = -1;      // valid when started and not signaled
    int signal = 0;
    std::string error;

    [[nodiscard]] bool succeeded() const noexcept { return started && signal == 0 && exitCode == 0; }
};

// Runs a child process to completion with stdin from /dev/null and both
// stdout and stderr appended to outputFile (truncated first).
[[nodiscard]] ProcessResult runProcess(const ProcessSpec& spec, const std::filesystem::path& outputFile) noexcept;

[[nodiscard]] std::string describeCommand(const ProcessSpec& spec);

}
