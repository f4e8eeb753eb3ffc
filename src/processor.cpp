/*
 * sweprov - Container Artifact Provisioning
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sweprov/processor.hpp"
#include "sweprov/logger.hpp"
#include <chrono>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <unistd.h>

namespace {
std::mutex g_output_mutex;

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&time, &local);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%H:%M:%S", &local);
    return buf;
}

std::string seconds(std::chrono::steady_clock::time_point start) {
    auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << elapsed << "s";
    return oss.str();
}

}

namespace sweprov {

Processor::Processor(const Scanner& scanner, Fetcher& fetcher, std::ostream& progress)
    : scanner_(scanner), fetcher_(fetcher), progress_(progress),
      color_(&progress == &std::cout && ::isatty(STDOUT_FILENO)) {
}

ProvisionResult Processor::provision(const WorkItem& item) noexcept {
    ProvisionResult result;
    LOG_DEBUG("Provisioning " + item.id + " -> " + item.artifact.string());

    try {
        // Step 1: idempotency check against the store
        if (scanner_.exists(item.artifact)) {
            report(item.id, "skipped", "\033[90m");
            removeLog(item.log);
            result.outcome = Outcome::Skipped;
            return result;
        }

        const auto partial = Scanner::partialPath(item.artifact);
        discardPartial(partial);

        report(item.id, "pulling", "\033[33m", item.reference.str());
        auto startTime = std::chrono::steady_clock::now();

        // Step 2: fetch and convert into the partial file
        FetchResult fetched = fetcher_.fetch(item, partial, item.log);

        // Step 3: publish or keep the log
        if (fetched.ok && publish(partial, item.artifact)) {
            removeLog(item.log);
            report(item.id, "done (" + seconds(startTime) + ")", "\033[32m");
            LOG_INFO("Provisioned " + item.id + " -> " + item.artifact.filename().string());
            result.outcome = Outcome::Succeeded;
            return result;
        }

        result.error = fetched.ok ? "conversion produced no usable artifact" : fetched.error;
        discardPartial(partial);
        appendToLog(item.log, result.error);
        report(item.id, "failed (log: " + item.log.string() + ")", "\033[31m");
        LOG_WARN("Provisioning failed for " + item.id + " after " + seconds(startTime) + ": " + result.error);
        result.outcome = Outcome::Failed;
        result.log = item.log;
        return result;
    } catch (const std::exception& e) {
        LOG_ERROR("Exception provisioning " + item.id + ": " + std::string(e.what()));
        result.outcome = Outcome::Failed;
        result.error = e.what();
        result.log = item.log;
        appendToLog(item.log, result.error);
        return result;
    }
}

bool Processor::publish(const std::filesystem::path& partial, const std::filesystem::path& artifact) noexcept {
    std::error_code ec;
    auto size = std::filesystem::file_size(partial, ec);
    if (ec || size == 0) {
        LOG_ERROR("Conversion reported success but left no data: " + partial.string());
        return false;
    }
    if (scanner_.verifiesSif() && !Scanner::hasSifHeader(partial)) {
        LOG_ERROR("Conversion output is not a SIF image: " + partial.string());
        return false;
    }

    // Same directory, so the rename is atomic
    std::filesystem::rename(partial, artifact, ec);
    if (ec) {
        LOG_ERROR("Failed to publish " + artifact.string() + ": " + ec.message());
        return false;
    }
    return true;
}

void Processor::discardPartial(const std::filesystem::path& partial) noexcept {
    std::error_code ec;
    if (std::filesystem::remove(partial, ec)) {
        LOG_DEBUG("Removed stale partial artifact: " + partial.string());
    }
}

void Processor::removeLog(const std::filesystem::path& log) noexcept {
    std::error_code ec;
    std::filesystem::remove(log, ec);
    if (ec) {
        LOG_WARN("Could not remove log " + log.string() + ": " + ec.message());
    }
}

void Processor::appendToLog(const std::filesystem::path& log, const std::string& message) noexcept {
    try {
        std::ofstream file(log, std::ios::app);
        if (file) {
            file << "sweprov: " << message << "\n";
        }
    } catch (...) {
        LOG_WARN("Could not write log: " + log.string());
    }
}

void Processor::report(const InstanceId& id, const std::string& state, const char* colorCode, const std::string& detail) noexcept {
    try {
        std::lock_guard<std::mutex> lock(g_output_mutex);
        progress_ << "    ";
        if (color_) {
            progress_ << "\033[90m" << timestamp() << "\033[0m  " << id << "  " << colorCode << state << "\033[0m";
        } else {
            progress_ << timestamp() << "  " << id << "  " << state;
        }
        if (!detail.empty()) {
            progress_ << "  " << detail;
        }
        progress_ << "\n" << std::flush;
    } catch (...) {
    }
}

}
