/*
 * sweprov - Container Artifact Provisioning
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sweprov/config.hpp"
#include <iostream>
#include <sstream>
#include <unistd.h>

namespace sweprov {

constexpr const char* VERSION = "0.1.0";

namespace {

std::string envOr(const Environment& env, const char* name, const std::string& defv = "") {
    auto it = env.find(name);
    if (it == env.end() || it->second.empty()) {
        return defv;
    }
    return it->second;
}

bool parseJobs(const std::string& value, int& jobs) {
    try {
        std::size_t pos = 0;
        int parsed = std::stoi(value, &pos);
        if (pos != value.size() || parsed < 1) {
            return false;
        }
        jobs = parsed;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parseDispatch(const std::string& value, DispatchMode& mode) {
    if (value == "pool") { mode = DispatchMode::Pool; return true; }
    if (value == "async") { mode = DispatchMode::Async; return true; }
    if (value == "sequential") { mode = DispatchMode::Sequential; return true; }
    return false;
}

ConfigResult configError(std::string message) {
    ConfigResult result;
    result.ok = false;
    result.error = ErrorKind::Configuration;
    result.message = std::move(message);
    return result;
}

std::string resolveApptainer(const std::string& requested, const Environment& env) {
    const std::string path = envOr(env, "PATH", "/usr/local/bin:/usr/bin:/bin");
    if (!requested.empty()) {
        return findExecutable(requested, path);
    }
    for (const char* candidate : {"apptainer", "singularity"}) {
        std::string found = findExecutable(candidate, path);
        if (!found.empty()) {
            return found;
        }
    }
    return "";
}

}

ConfigResult parseConfig(const std::vector<std::string>& args, const Environment& env) {
    Config config;
    config.environment = env;

    config.registry = envOr(env, "SWEPROV_REGISTRY", config.registry);
    config.registryNamespace = envOr(env, "SWEPROV_REGISTRY_NAMESPACE");
    config.storeDirectory = envOr(env, "EVAL_CONTAINER_IMAGE_PREFIX", config.storeDirectory.string());
    config.httpProxy = envOr(env, "http_proxy");
    config.httpsProxy = envOr(env, "https_proxy");

    std::string cacheDir = envOr(env, "APPTAINER_CACHEDIR");
    std::string logDir;
    std::string apptainer = envOr(env, "APPTAINER_EXECUTABLE");
    std::string jobs = envOr(env, "SWEPROV_JOBS");
    std::string logLevel = envOr(env, "SWEPROV_LOG_LEVEL");

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "-h" || arg == "--help") {
            ConfigResult result;
            result.ok = true;
            result.showHelp = true;
            return result;
        }
        if (arg == "-v" || arg == "--version") {
            ConfigResult result;
            result.ok = true;
            result.showVersion = true;
            return result;
        }
        if (arg == "--verify-sif") {
            config.verifySif = true;
            continue;
        }
        if (arg == "--dry-run") {
            config.dryRun = true;
            continue;
        }

        if (i + 1 >= args.size()) {
            return configError("Missing value for option: " + arg);
        }
        const std::string& value = args[++i];

        if (arg == "--namespace") {
            config.registryNamespace = value;
        } else if (arg == "--registry") {
            config.registry = value;
        } else if (arg == "--arch") {
            config.arch = value;
        } else if (arg == "--tag") {
            config.tag = value;
        } else if (arg == "--prefix") {
            config.imagePrefix = value;
        } else if (arg == "--store") {
            config.storeDirectory = value;
        } else if (arg == "--cache") {
            cacheDir = value;
        } else if (arg == "--log-dir") {
            logDir = value;
        } else if (arg == "-j" || arg == "--jobs") {
            jobs = value;
        } else if (arg == "--instances") {
            config.instanceList = value;
        } else if (arg == "--manifest") {
            config.manifestFile = value;
        } else if (arg == "--dispatch") {
            if (!parseDispatch(value, config.dispatch)) {
                return configError("Invalid dispatch mode: " + value + " (expected pool, async or sequential)");
            }
        } else if (arg == "--apptainer") {
            apptainer = value;
        } else if (arg == "--http-proxy") {
            config.httpProxy = value;
        } else if (arg == "--https-proxy") {
            config.httpsProxy = value;
        } else if (arg == "--log-level") {
            logLevel = value;
        } else {
            return configError("Unknown option: " + arg);
        }
    }

    if (!jobs.empty() && !parseJobs(jobs, config.concurrencyLimit)) {
        return configError("Invalid worker count: " + jobs);
    }

    if (!logLevel.empty()) {
        auto parsed = Logger::parseLevel(logLevel);
        if (parsed) {
            config.logLevel = *parsed;
        } else {
            LOG_WARN("Unknown log level '" + logLevel + "', using INFO");
            config.logLevel = LogLevel::INFO;
        }
    }

    if (config.registryNamespace.empty()) {
        return configError("No registry namespace given (--namespace or SWEPROV_REGISTRY_NAMESPACE)");
    }
    if (config.storeDirectory.empty()) {
        return configError("Store directory must not be empty");
    }
    if (config.instanceList.empty() && config.manifestFile.empty()) {
        return configError("No instances given (--instances or --manifest)");
    }
    if (!config.instanceList.empty() && !config.manifestFile.empty()) {
        return configError("--instances and --manifest are mutually exclusive");
    }

    config.cacheDirectory = cacheDir.empty()
        ? config.storeDirectory.parent_path() / "cache" / "apptainer"
        : std::filesystem::path(cacheDir);
    config.logDirectory = logDir.empty()
        ? std::filesystem::path(envOr(env, "TMPDIR", "/tmp")) / "sweprov-logs"
        : std::filesystem::path(logDir);

    config.apptainerExecutable = resolveApptainer(apptainer, env);
    if (config.apptainerExecutable.empty() && !config.dryRun) {
        if (!apptainer.empty()) {
            return configError("Conversion tool not found or not executable: " + apptainer);
        }
        return configError("Neither apptainer nor singularity found in PATH (use --apptainer)");
    }

    ConfigResult result;
    result.ok = true;
    result.config = std::move(config);
    return result;
}

std::string findExecutable(const std::string& name, const std::string& searchPath) {
    if (name.empty()) {
        return "";
    }

    auto isExecutable = [](const std::filesystem::path& candidate) {
        std::error_code ec;
        return std::filesystem::is_regular_file(candidate, ec) &&
               ::access(candidate.c_str(), X_OK) == 0;
    };

    if (name.find('/') != std::string::npos) {
        return isExecutable(name) ? name : "";
    }

    std::istringstream dirs(searchPath);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) {
            dir = ".";
        }
        auto candidate = std::filesystem::path(dir) / name;
        if (isExecutable(candidate)) {
            return candidate.string();
        }
    }
    return "";
}

const char* dispatchModeToString(DispatchMode mode) noexcept {
    switch (mode) {
        case DispatchMode::Pool: return "pool";
        case DispatchMode::Async: return "async";
        case DispatchMode::Sequential: return "sequential";
        default: return "unknown";
    }
}

const char* versionString() noexcept {
    return VERSION;
}

void printUsage(const char* progName) {
    std::cout << "sweprov - Benchmark Image Provisioning v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " --namespace <ns> (--instances <a,b,...> | --manifest <file>) [options]\n";
    std::cout << "       " << progName << " --help | --version\n\n";
    std::cout << "Pulls one prebuilt image per benchmark instance and converts it into a\n";
    std::cout << "SIF archive under the store directory. Instances already present are skipped.\n\n";
    std::cout << "Options:\n";
    std::cout << "  --namespace <ns>      Registry namespace to pull from (required)\n";
    std::cout << "  --registry <host>     Registry host (default: docker.io)\n";
    std::cout << "  --instances <list>    Comma separated instance ids\n";
    std::cout << "  --manifest <file>     File with one instance id per line\n";
    std::cout << "  --store <dir>         Artifact destination (default: ./images)\n";
    std::cout << "  --cache <dir>         Scratch space for the conversion tool\n";
    std::cout << "  --log-dir <dir>       Failure log directory (default: $TMPDIR/sweprov-logs)\n";
    std::cout << "  -j, --jobs <n>        Concurrent pulls (default: 1)\n";
    std::cout << "  --dispatch <mode>     pool, async or sequential (default: pool)\n";
    std::cout << "  --arch <arch>         Image architecture (default: x86_64)\n";
    std::cout << "  --tag <tag>           Image tag (default: latest)\n";
    std::cout << "  --prefix <prefix>     Image name prefix (default: sweb.eval)\n";
    std::cout << "  --apptainer <path>    Conversion tool (default: apptainer, then singularity)\n";
    std::cout << "  --http-proxy <url>    Proxy forwarded to the conversion tool\n";
    std::cout << "  --https-proxy <url>   Proxy forwarded to the conversion tool\n";
    std::cout << "  --verify-sif          Check the SIF header of existing artifacts\n";
    std::cout << "  --dry-run             Resolve and list work without pulling\n";
    std::cout << "  --log-level <level>   ERROR, WARN, INFO, DEBUG, TRACE\n";
    std::cout << "  -h, --help            Show this help message\n";
    std::cout << "  -v, --version         Show version\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  SWEPROV_REGISTRY_NAMESPACE   Default for --namespace\n";
    std::cout << "  SWEPROV_REGISTRY             Default for --registry\n";
    std::cout << "  SWEPROV_JOBS                 Default for --jobs\n";
    std::cout << "  SWEPROV_LOG_LEVEL            Default for --log-level\n";
    std::cout << "  EVAL_CONTAINER_IMAGE_PREFIX  Default for --store\n";
    std::cout << "  APPTAINER_CACHEDIR           Default for --cache\n";
    std::cout << "  APPTAINER_EXECUTABLE         Default for --apptainer\n";
    std::cout << "  http_proxy, https_proxy      Defaults for the proxy options\n\n";
    std::cout << "Exit status: number of instances still missing (0 = all present),\n";
    std::cout << "254 on configuration errors, 255 if the store cannot be read.\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progName << " --namespace xingyaoww --instances django__django-11099 --store ./images\n";
    std::cout << "  " << progName << " --namespace xingyaoww --manifest lite.txt -j 4\n";
}

}
