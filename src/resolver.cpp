/*
 * sweprov - Container Artifact Provisioning
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sweprov/resolver.hpp"
#include <algorithm>
#include <cctype>

namespace sweprov {

namespace {

constexpr const char* kSeparator = "__";
constexpr const char* kMarker = "_s_";

std::string replaceAll(const std::string& input, const std::string& from, const std::string& to) {
    std::string out;
    out.reserve(input.size() + input.size() / 4);
    std::size_t pos = 0;
    while (true) {
        std::size_t hit = input.find(from, pos);
        if (hit == std::string::npos) {
            out.append(input, pos, std::string::npos);
            break;
        }
        out.append(input, pos, hit - pos);
        out.append(to);
        pos = hit + from.size();
    }
    return out;
}

std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool hasForbiddenCharacter(const std::string& id) {
    return std::any_of(id.begin(), id.end(), [](unsigned char c) {
        return std::isspace(c) || std::iscntrl(c) || c == '/' || c == '\\' || c == ':';
    });
}

ResolveResult resolutionError(const InstanceId& id, std::string message) {
    ResolveResult result;
    result.item.id = id;
    result.error = ErrorKind::Resolution;
    result.message = std::move(message);
    return result;
}

}

std::string ArtifactReference::str() const {
    std::string out;
    if (!registry.empty()) {
        out += registry + "/";
    }
    if (!ns.empty()) {
        out += ns + "/";
    }
    out += repository;
    if (!tag.empty()) {
        out += ":" + tag;
    }
    return out;
}

std::string ArtifactReference::uri() const {
    return "docker://" + str();
}

std::string escapeInstanceId(const std::string& id) {
    return replaceAll(id, kSeparator, kMarker);
}

std::string unescapeInstanceId(const std::string& escaped) {
    return replaceAll(escaped, kMarker, kSeparator);
}

std::string artifactBaseName(const InstanceId& id, const Config& config) {
    return config.imagePrefix + "." + config.arch + "." + escapeInstanceId(id);
}

ResolveResult resolve(const InstanceId& id, const Config& config) {
    if (id.empty()) {
        return resolutionError(id, "Empty instance id");
    }
    if (hasForbiddenCharacter(id)) {
        return resolutionError(id, "Instance id contains whitespace, a path separator or ':': " + id);
    }

    const std::string escaped = escapeInstanceId(id);
    // Ids that already contain the marker would collide with an escaped id
    if (unescapeInstanceId(escaped) != id) {
        return resolutionError(id, "Instance id is ambiguous under the naming scheme (contains \"" +
                                   std::string(kMarker) + "\"): " + id);
    }

    ResolveResult result;
    result.ok = true;
    result.item.id = id;

    result.item.reference.registry = config.registry;
    result.item.reference.ns = config.registryNamespace;
    // Registries only accept lowercase repository names
    result.item.reference.repository = toLowerCopy(config.imagePrefix + "." + config.arch + "." + escaped);
    result.item.reference.tag = config.tag;

    result.item.artifact = config.storeDirectory / (artifactBaseName(id, config) + ".sif");
    result.item.log = config.logDirectory / (id + ".log");
    return result;
}

}
