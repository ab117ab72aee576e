#pragma once

#include <string>
#include <vector>

#include "common/enums.hpp"

namespace pkgsnap {

// Distribution identity as published in /etc/os-release.
struct DistributionIdentity {
    std::string id;
    // ID_LIKE tokens, most specific first.
    std::vector<std::string> idLike;
};

// Map a distribution identity to exactly one package manager. ID is checked
// before ID_LIKE so a derivative is classified by its own name when possible.
PackageManagerKind detectFromIdentity(const DistributionIdentity &identity);

class ManagerDetector {
public:
    virtual ~ManagerDetector() = default;
    virtual PackageManagerKind detect() const = 0;
};

// Reads the identity of the running host.
class HostManagerDetector : public ManagerDetector {
public:
    explicit HostManagerDetector(std::string osReleasePath = "/etc/os-release");

    PackageManagerKind detect() const override;

    DistributionIdentity readIdentity() const;

private:
    std::string m_osReleasePath;
};

// Always reports the same kind; used for test mode and PKGSNAP_FORCE_MANAGER.
class FixedManagerDetector : public ManagerDetector {
public:
    explicit FixedManagerDetector(PackageManagerKind kind);

    PackageManagerKind detect() const override;

private:
    PackageManagerKind m_kind;
};

} // namespace pkgsnap
