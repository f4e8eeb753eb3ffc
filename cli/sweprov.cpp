/*
 * sweprov - Benchmark image provisioning tool
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sweprov/config.hpp"
#include "sweprov/fetcher.hpp"
#include "sweprov/logger.hpp"
#include "sweprov/pipeline.hpp"
#include <iostream>
#include <string>
#include <vector>

extern char** environ;

using namespace sweprov;

namespace {

// The only place the process environment is read.
Environment snapshotEnvironment() {
    Environment env;
    for (char** entry = environ; entry && *entry; ++entry) {
        std::string item(*entry);
        auto eq = item.find('=');
        if (eq == std::string::npos || eq == 0) {
            continue;
        }
        env[item.substr(0, eq)] = item.substr(eq + 1);
    }
    return env;
}

}

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);

    try {
        ConfigResult parsed = parseConfig(args, snapshotEnvironment());
        if (parsed.showHelp) {
            printUsage(argv[0]);
            return 0;
        }
        if (parsed.showVersion) {
            std::cout << versionString() << "\n";
            return 0;
        }
        if (!parsed) {
            std::cerr << "Error: " << parsed.message << "\n";
            std::cerr << "Run '" << argv[0] << " --help' for usage.\n";
            return kExitConfigurationError;
        }

        const Config& config = parsed.config;
        Logger::setLevel(config.logLevel);

        ApptainerFetcher fetcher(config);
        Pipeline pipeline(config, fetcher);
        PipelineResult result = pipeline.run();

        if (!result.ok) {
            std::cerr << "Error (" << errorKindToString(result.error) << "): " << result.message << "\n";
        }
        return result.exitCode();

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return kExitAggregationError;
    }
}
