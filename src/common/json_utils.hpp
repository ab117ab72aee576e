#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace pkgsnap {

inline std::string toKindString(PackageManagerKind kind)
{
    switch (kind) {
    case PackageManagerKind::Apt:
        return "apt";
    case PackageManagerKind::Yum:
        return "yum";
    case PackageManagerKind::Pacman:
        return "pacman";
    case PackageManagerKind::Zypper:
        return "zypper";
    case PackageManagerKind::Unknown:
        return "unknown";
    }
    return "unknown";
}

inline PackageManagerKind parseKindString(const std::string &value)
{
    if (value == "apt") {
        return PackageManagerKind::Apt;
    }
    if (value == "yum") {
        return PackageManagerKind::Yum;
    }
    if (value == "pacman") {
        return PackageManagerKind::Pacman;
    }
    if (value == "zypper") {
        return PackageManagerKind::Zypper;
    }
    return PackageManagerKind::Unknown;
}

inline std::string toFormatString(OutputFormat format)
{
    switch (format) {
    case OutputFormat::Text:
        return "text";
    case OutputFormat::Json:
        return "json";
    }
    return "text";
}

inline void to_json(nlohmann::json &j, const PackageManagerKind &kind)
{
    j = toKindString(kind);
}

inline void from_json(const nlohmann::json &j, PackageManagerKind &kind)
{
    if (j.is_string()) {
        kind = parseKindString(j.get<std::string>());
    } else {
        kind = PackageManagerKind::Unknown;
    }
}

inline void to_json(nlohmann::json &j, const SystemMetadata &metadata)
{
    j = nlohmann::json{
        {"hostname", metadata.hostname},
        {"os_name", metadata.osName},
        {"os_release", metadata.osRelease},
        {"kernel_version", metadata.kernelVersion},
        {"machine", metadata.machine},
        {"distribution_id", metadata.distributionId},
        {"distribution_name", metadata.distributionName},
        {"distribution_version", metadata.distributionVersion},
        {"distribution_codename", metadata.distributionCodename},
        {"runtime_version", metadata.runtimeVersion},
        {"runtime_implementation", metadata.runtimeImplementation},
        {"cpu_count", metadata.cpuCount},
        {"cpu_architecture", metadata.cpuArchitecture}
    };
}

inline void from_json(const nlohmann::json &j, SystemMetadata &metadata)
{
    metadata.hostname = j.value("hostname", "");
    metadata.osName = j.value("os_name", "");
    metadata.osRelease = j.value("os_release", "");
    metadata.kernelVersion = j.value("kernel_version", "");
    metadata.machine = j.value("machine", "");
    metadata.distributionId = j.value("distribution_id", "");
    metadata.distributionName = j.value("distribution_name", "");
    metadata.distributionVersion = j.value("distribution_version", "");
    metadata.distributionCodename = j.value("distribution_codename", "");
    metadata.runtimeVersion = j.value("runtime_version", "");
    metadata.runtimeImplementation = j.value("runtime_implementation", "");
    metadata.cpuCount = j.value("cpu_count", 0);
    metadata.cpuArchitecture = j.value("cpu_architecture", "");
}

// The name is the key of the enclosing "packages" object, so it is not
// repeated inside the record.
inline void to_json(nlohmann::json &j, const PackageRecord &record)
{
    j = nlohmann::json{{"version", record.version}};
    if (record.description.has_value()) {
        j["description"] = *record.description;
    }
    if (record.dependencies.has_value()) {
        j["dependencies"] = *record.dependencies;
    }
}

inline void from_json(const nlohmann::json &j, PackageRecord &record)
{
    record.version = j.value("version", "");
    if (j.contains("description") && j.at("description").is_string()) {
        record.description = j.at("description").get<std::string>();
    } else {
        record.description.reset();
    }
    if (j.contains("dependencies") && j.at("dependencies").is_array()) {
        record.dependencies = j.at("dependencies").get<std::vector<std::string>>();
    } else {
        record.dependencies.reset();
    }
}

inline void to_json(nlohmann::json &j, const PackageSnapshot &snapshot)
{
    nlohmann::json packages = nlohmann::json::object();
    for (const auto &[name, record] : snapshot.packages) {
        packages[name] = record;
    }

    j = nlohmann::json{
        {"metadata", snapshot.metadata},
        {"timestamp", snapshot.timestamp},
        {"package_manager", snapshot.packageManager},
        {"packages", packages}
    };
}

inline void from_json(const nlohmann::json &j, PackageSnapshot &snapshot)
{
    if (j.contains("metadata") && j.at("metadata").is_object()) {
        snapshot.metadata = j.at("metadata").get<SystemMetadata>();
    } else {
        snapshot.metadata = SystemMetadata{};
    }
    snapshot.timestamp = j.value("timestamp", "");
    if (j.contains("package_manager")) {
        snapshot.packageManager = j.at("package_manager").get<PackageManagerKind>();
    } else {
        snapshot.packageManager = PackageManagerKind::Unknown;
    }

    snapshot.packages.clear();
    if (j.contains("packages") && j.at("packages").is_object()) {
        for (const auto &[name, value] : j.at("packages").items()) {
            PackageRecord record = value.get<PackageRecord>();
            record.name = name;
            snapshot.packages.emplace(name, std::move(record));
        }
    }
}

} // namespace pkgsnap
