/*
 * sweprov - Container Artifact Provisioning
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sweprov/reporter.hpp"
#include "sweprov/logger.hpp"
#include "sweprov/resolver.hpp"
#include <iomanip>
#include <sstream>
#include <unordered_set>

namespace sweprov {

Reporter::Reporter(const Config& config) : config_(config) {
}

SummaryResult Reporter::summarize(const Scanner& scanner, const std::vector<InstanceId>& instances) const noexcept {
    SummaryResult result;

    try {
        ScanResult scan = scanner.scan();
        if (!scan) {
            result.error = ErrorKind::Aggregation;
            result.message = scan.message;
            LOG_ERROR("Cannot summarize: " + scan.message);
            return result;
        }

        std::unordered_set<std::string> present;
        for (const auto& artifact : scan.artifacts) {
            present.insert(artifact.name);
        }

        Summary& summary = result.summary;
        summary.total = instances.size();
        for (const auto& id : instances) {
            ResolveResult resolved = resolve(id, config_);
            if (!resolved) {
                summary.missing.push_back({id, {}, resolved.message});
                continue;
            }
            if (present.count(resolved.item.artifact.filename().string()) > 0) {
                ++summary.successful;
                continue;
            }
            std::error_code ec;
            auto log = std::filesystem::exists(resolved.item.log, ec) ? resolved.item.log : std::filesystem::path();
            summary.missing.push_back({id, log, "not in store"});
        }
        summary.failed = summary.total - summary.successful;
        summary.artifacts = std::move(scan.artifacts);

        result.ok = true;
        return result;
    } catch (const std::exception& e) {
        result.error = ErrorKind::Aggregation;
        result.message = "Summary error: " + std::string(e.what());
        LOG_ERROR(result.message);
        return result;
    }
}

void Reporter::print(const Summary& summary, std::ostream& out) const {
    out << "\n";
    out << "  Provisioning summary\n";
    out << "  ----------------------------------------------------------------\n";
    out << "  Total:       " << summary.total << "\n";
    out << "  Successful:  " << summary.successful << "\n";
    out << "  Failed:      " << summary.failed << "\n";
    out << "\n";

    out << "  Artifacts in " << config_.storeDirectory.string() << " (" << summary.artifacts.size() << "):\n";
    for (const auto& artifact : summary.artifacts) {
        out << "    " << std::left << std::setw(10) << humanSize(artifact.size) << artifact.name << "\n";
    }
    out << std::right;

    if (!summary.missing.empty()) {
        out << "\n  Missing (" << summary.missing.size() << "):\n";
        for (const auto& missing : summary.missing) {
            out << "    " << missing.id;
            if (!missing.log.empty()) {
                out << "  log: " << missing.log.string();
            } else if (!missing.reason.empty()) {
                out << "  (" << missing.reason << ")";
            }
            out << "\n";
        }
    }

    out << "\n  To use these images, set:\n\n";
    out << environmentSnippet();
    out << "\n" << std::flush;
}

std::string Reporter::environmentSnippet() const {
    auto absolute = [](const std::filesystem::path& path) {
        std::error_code ec;
        auto abs = std::filesystem::absolute(path, ec);
        return (ec ? path : abs.lexically_normal()).string();
    };

    const std::string cache = absolute(config_.cacheDirectory);
    std::ostringstream out;
    out << "export RUNTIME=apptainer\n";
    out << "export EVAL_CONTAINER_IMAGE_PREFIX=" << absolute(config_.storeDirectory) << "\n";
    out << "export APPTAINER_CACHEDIR=" << cache << "\n";
    out << "export APPTAINER_TMPDIR=" << absolute(config_.cacheDirectory / "tmp") << "\n";
    return out.str();
}

std::string Reporter::humanSize(std::uintmax_t bytes) {
    static const char* units[] = {"B", "K", "M", "G", "T"};
    double value = static_cast<double>(bytes);
    std::size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < sizeof(units) / sizeof(units[0])) {
        value /= 1024.0;
        ++unit;
    }
    std::ostringstream oss;
    if (unit == 0) {
        oss << bytes << units[unit];
    } else {
        oss << std::fixed << std::setprecision(1) << value << units[unit];
    }
    return oss.str();
}

}
