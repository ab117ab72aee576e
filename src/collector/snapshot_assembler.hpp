#pragma once

#include <cstddef>
#include <functional>
#include <optional>

#include <QDateTime>

#include "collector/package_backend.hpp"
#include "common/command_runner.hpp"
#include "common/models.hpp"

namespace pkgsnap {

// processed runs 1..total, once per detail fetch.
using ProgressCallback = std::function<void(std::size_t processed, std::size_t total)>;

struct AssemblyOptions {
    bool detailed = false;
    // Dry runs never report progress.
    bool dryRun = false;
    ProgressCallback progress;
    // Capture time; the current local time when unset.
    std::optional<QDateTime> capturedAt;
};

// Timestamp format stored in snapshots: "yyyy-MM-dd HH:mm:ss".
QString formatSnapshotTimestamp(const QDateTime &capturedAt);

class SnapshotAssembler {
public:
    SnapshotAssembler(const PackageBackend &backend, CommandRunner &runner);

    /**
     * Combine a package listing with host metadata into a PackageSnapshot.
     *
     * Versions are always copied; descriptions and dependencies are fetched
     * per package only when options.detailed is set.
     *
     * Throws EmptyInventoryError when listing is empty.
     */
    PackageSnapshot assemble(const PackageListing &listing,
                             const SystemMetadata &metadata,
                             const AssemblyOptions &options) const;

private:
    const PackageBackend &m_backend;
    CommandRunner &m_runner;
};

} // namespace pkgsnap
