/*
 * sweprov - Container Artifact Provisioning
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sweprov/types.hpp"

namespace sweprov {

const char* outcomeToString(Outcome outcome) noexcept {
    switch (outcome) {
        case Outcome::Skipped: return "SKIPPED";
        case Outcome::Succeeded: return "SUCCEEDED";
        case Outcome::Failed: return "FAILED";
        default: return "UNKNOWN";
    }
}

const char* errorKindToString(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::None: return "none";
        case ErrorKind::Configuration: return "configuration error";
        case ErrorKind::Resolution: return "resolution error";
        case ErrorKind::Fetch: return "fetch error";
        case ErrorKind::Aggregation: return "aggregation error";
        default: return "unknown error";
    }
}

}
