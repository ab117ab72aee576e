#pragma once

#include <QString>

#include "common/models.hpp"

namespace pkgsnap {

// Value recorded for any host fact that cannot be determined.
inline constexpr const char *kUnknownFact = "unknown";

/**
 * Collect host facts for a snapshot:
 * - hostname, kernel identification (uname)
 * - distribution identity (os-release)
 * - Qt runtime version and build ABI, CPU count and architecture
 *
 * Never fails; unavailable facts are recorded as kUnknownFact (cpuCount 0).
 */
SystemMetadata collectSystemMetadata(const QString &osReleasePath = QStringLiteral("/etc/os-release"));

} // namespace pkgsnap
