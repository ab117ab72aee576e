#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "common/enums.hpp"

namespace pkgsnap {

// Name -> version, as reported by a backend's listing command.
using PackageListing = std::map<std::string, std::string>;

struct PackageDetails {
    std::optional<std::string> description;
    std::optional<std::vector<std::string>> dependencies;
};

struct PackageRecord {
    std::string name;
    std::string version;
    std::optional<std::string> description;
    std::optional<std::vector<std::string>> dependencies;
};

struct SystemMetadata {
    std::string hostname;

    std::string osName;
    std::string osRelease;
    std::string kernelVersion;
    std::string machine;

    std::string distributionId;
    std::string distributionName;
    std::string distributionVersion;
    std::string distributionCodename;

    std::string runtimeVersion;
    std::string runtimeImplementation;

    int cpuCount = 0;
    std::string cpuArchitecture;
};

struct PackageSnapshot {
    std::string timestamp;
    PackageManagerKind packageManager = PackageManagerKind::Unknown;
    SystemMetadata metadata;
    // std::map keeps packages sorted by name for every renderer.
    std::map<std::string, PackageRecord> packages;
};

} // namespace pkgsnap
