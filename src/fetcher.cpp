/*
 * sweprov - Container Artifact Provisioning
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sweprov/fetcher.hpp"
#include "sweprov/logger.hpp"

namespace sweprov {

ApptainerFetcher::ApptainerFetcher(const Config& config)
    : executable_(config.apptainerExecutable),
      cacheDirectory_(config.cacheDirectory),
      httpProxy_(config.httpProxy),
      httpsProxy_(config.httpsProxy),
      environment_(config.environment) {
    LOG_DEBUG("ApptainerFetcher using " + executable_ + ", cache: " + cacheDirectory_.string());
}

ProcessSpec ApptainerFetcher::buildCommand(const WorkItem& item, const std::filesystem::path& destination) const {
    ProcessSpec spec;
    spec.program = executable_;
    spec.args = {"pull", "--force", destination.string(), item.reference.uri()};

    spec.env = environment_;
    const std::string tmpDir = (cacheDirectory_ / "tmp").string();
    for (const char* tool : {"APPTAINER", "SINGULARITY"}) {
        const std::string prefix(tool);
        spec.env[prefix + "_CACHEDIR"] = cacheDirectory_.string();
        spec.env[prefix + "_TMPDIR"] = tmpDir;
    }

    if (!httpProxy_.empty()) {
        spec.env["http_proxy"] = httpProxy_;
        spec.env["APPTAINER_HTTP_PROXY"] = httpProxy_;
        spec.env["APPTAINERENV_http_proxy"] = httpProxy_;
    }
    if (!httpsProxy_.empty()) {
        spec.env["https_proxy"] = httpsProxy_;
        spec.env["APPTAINER_HTTPS_PROXY"] = httpsProxy_;
        spec.env["APPTAINERENV_https_proxy"] = httpsProxy_;
    }
    return spec;
}

FetchResult ApptainerFetcher::fetch(const WorkItem& item,
                                    const std::filesystem::path& destination,
                                    const std::filesystem::path& log) noexcept {
    FetchResult result;
    try {
        ProcessSpec spec = buildCommand(item, destination);
        ProcessResult run = runProcess(spec, log);

        if (!run.started) {
            result.error = run.error;
            return result;
        }
        if (run.signal != 0) {
            result.error = run.error;
            return result;
        }
        if (run.exitCode != 0) {
            result.error = "pull exited with status " + std::to_string(run.exitCode);
            return result;
        }

        result.ok = true;
        return result;
    } catch (const std::exception& e) {
        result.error = "Fetch error: " + std::string(e.what());
        return result;
    }
}

}
