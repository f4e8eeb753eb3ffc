/*
 * sweprov - Container Artifact Provisioning
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sweprov/pipeline.hpp"
#include "sweprov/logger.hpp"
#include "sweprov/manifest.hpp"
#include "sweprov/processor.hpp"
#include "sweprov/resolver.hpp"
#include "sweprov/scanner.hpp"
#include <algorithm>

namespace sweprov {

int PipelineResult::exitCode() const noexcept {
    if (!ok) {
        return error == ErrorKind::Aggregation ? kExitAggregationError : kExitConfigurationError;
    }
    return static_cast<int>(std::min<std::size_t>(summary.failed, kExitMaxFailures));
}

Pipeline::Pipeline(const Config& config, Fetcher& fetcher, std::ostream& out)
    : config_(config), fetcher_(fetcher), out_(out) {
}

PipelineResult Pipeline::run() {
    PipelineResult result;
    setThreadName("Main");

    LOG_DEBUG("========================================");
    LOG_DEBUG("Registry:  " + config_.registry + "/" + config_.registryNamespace);
    LOG_DEBUG("Store:     " + config_.storeDirectory.string());
    LOG_DEBUG("Cache:     " + config_.cacheDirectory.string());
    LOG_DEBUG("Logs:      " + config_.logDirectory.string());
    LOG_DEBUG("Workers:   " + std::to_string(config_.concurrencyLimit) + " (" +
              dispatchModeToString(config_.dispatch) + ")");
    LOG_DEBUG("Tool:      " + (config_.apptainerExecutable.empty() ? std::string("(none)") : config_.apptainerExecutable));
    LOG_DEBUG("========================================");

    // Configuration-time failures abort before any work starts
    ManifestResult manifest = loadInstances(config_);
    if (!manifest) {
        result.error = manifest.error;
        result.message = manifest.message;
        return result;
    }

    std::string dirError;
    if (!createDirectories(dirError)) {
        result.error = ErrorKind::Configuration;
        result.message = dirError;
        return result;
    }

    std::vector<WorkItem> items = resolveAll(manifest.instances);
    Scanner scanner(config_.storeDirectory, config_.imagePrefix, config_.verifySif);

    if (config_.dryRun) {
        printPlan(items);
    } else {
        Processor processor(scanner, fetcher_, out_);
        Dispatcher dispatcher([&processor](const WorkItem& item) { return processor.provision(item); },
                              config_.dispatch);
        dispatcher.run(items, config_.concurrencyLimit);
        result.stats = dispatcher.stats();
    }

    // Ground truth is what the store holds now
    Reporter reporter(config_);
    SummaryResult summary = reporter.summarize(scanner, manifest.instances);
    if (!summary) {
        result.error = summary.error;
        result.message = summary.message;
        return result;
    }

    result.summary = std::move(summary.summary);
    reporter.print(result.summary, out_);
    result.ok = true;
    return result;
}

bool Pipeline::createDirectories(std::string& error) noexcept {
    try {
        for (const auto& dir : {config_.storeDirectory, config_.cacheDirectory,
                                config_.cacheDirectory / "tmp", config_.logDirectory}) {
            std::error_code ec;
            std::filesystem::create_directories(dir, ec);
            if (ec) {
                error = "Cannot create directory " + dir.string() + ": " + ec.message();
                return false;
            }
        }
        return true;
    } catch (const std::exception& e) {
        error = "Failed to create directories: " + std::string(e.what());
        return false;
    }
}

std::vector<WorkItem> Pipeline::resolveAll(const std::vector<InstanceId>& instances) {
    std::vector<WorkItem> items;
    items.reserve(instances.size());

    for (const auto& id : instances) {
        ResolveResult resolved = resolve(id, config_);
        if (!resolved) {
            // Counted as failed by the summary; siblings are unaffected
            LOG_ERROR("Skipping instance: " + resolved.message);
            out_ << "    " << id << "  invalid  " << resolved.message << "\n";
            continue;
        }
        LOG_TRACE("Resolved " + id + " -> " + resolved.item.reference.str());
        items.push_back(std::move(resolved.item));
    }

    LOG_INFO("Resolved " + std::to_string(items.size()) + " of " + std::to_string(instances.size()) + " instances");
    return items;
}

void Pipeline::printPlan(const std::vector<WorkItem>& items) {
    out_ << "  Dry run: " << items.size() << " instances\n";
    for (const auto& item : items) {
        out_ << "    " << item.id << "\n";
        out_ << "      pull  " << item.reference.uri() << "\n";
        out_ << "      into  " << item.artifact.string() << "\n";
    }
    out_ << std::flush;
}

}
