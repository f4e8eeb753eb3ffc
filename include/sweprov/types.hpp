#pragma once
#include <cstdint>
#include <filesystem>
#include <string>

namespace sweprov {

// Opaque benchmark instance identifier, e.g. "django__django-11099".
using InstanceId = std::string;

// Terminal result of provisioning one instance in the current run.
enum class Outcome : std::uint8_t { Skipped, Succeeded, Failed };

enum class ErrorKind : std::uint8_t {
    None = 0,
    Configuration,
    Resolution,
    Fetch,
    Aggregation
};

struct ArtifactReference {
    std::string registry;      // may be empty
    std::string ns;
    std::string repository;
    std::string tag;

    // registry/ns/repository:tag
    [[nodiscard]] std::string str() const;
    // docker://registry/ns/repository:tag
    [[nodiscard]] std::string uri() const;
};

struct WorkItem {
    InstanceId id;
    ArtifactReference reference;
    std::filesystem::path artifact;
    std::filesystem::path log;
};

struct ProvisionResult {
    Outcome outcome = Outcome::Failed;
    std::filesystem::path log;  // set only for Failed
    std::string error;
};

const char* outcomeToString(Outcome outcome) noexcept;
const char* errorKindToString(ErrorKind kind) noexcept;

} // namespace sweprov
