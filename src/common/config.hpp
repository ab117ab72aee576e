#pragma once

#include <chrono>
#include <optional>

#include "common/enums.hpp"

namespace pkgsnap {

constexpr std::chrono::milliseconds kDefaultCommandTimeout{120000};

// Settings taken from the environment. Command-line flags are applied on top
// by the CLI.
struct RunConfig {
    bool traceEnabled = false;
    // Set when PKGSNAP_FORCE_MANAGER names a known kind; skips host detection.
    std::optional<PackageManagerKind> forcedManager;
    std::chrono::milliseconds commandTimeout = kDefaultCommandTimeout;
};

// Reads PKGSNAP_TRACE, PKGSNAP_FORCE_MANAGER and PKGSNAP_COMMAND_TIMEOUT_MS.
// Malformed values fall back to the defaults.
RunConfig loadRunConfig();

} // namespace pkgsnap
