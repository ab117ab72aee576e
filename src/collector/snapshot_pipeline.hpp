#pragma once

#include <cstddef>
#include <string>

#include <QString>

#include "collector/manager_detector.hpp"
#include "collector/snapshot_assembler.hpp"
#include "common/command_runner.hpp"
#include "common/models.hpp"

namespace pkgsnap {

struct PipelineOptions {
    OutputFormat format = OutputFormat::Text;
    bool compressed = false;
    bool detailed = false;
    // Collect and render a preview but write nothing.
    bool dryRun = false;
    bool validate = true;
    // Empty selects packages_<timestamp>.<ext> in the working directory.
    QString outputPath;
};

struct PipelineResult {
    PackageManagerKind packageManager = PackageManagerKind::Unknown;
    std::size_t packageCount = 0;
    QString outputPath;
    bool written = false;
    // Only meaningful when written and validation was requested.
    bool validated = false;
    // Rendered sample, filled for dry runs.
    std::string preview;
};

/**
 * One snapshot run: detect the package manager, check its tools, list
 * packages, optionally fetch details, assemble, then write and validate (or
 * preview for dry runs).
 *
 * Every SnapshotError except detail-fetch failures propagates to the caller.
 */
class SnapshotPipeline {
public:
    SnapshotPipeline(const ManagerDetector &detector, CommandRunner &runner);

    PipelineResult run(const PipelineOptions &options,
                       const ProgressCallback &progress = {}) const;

private:
    const ManagerDetector &m_detector;
    CommandRunner &m_runner;
};

} // namespace pkgsnap
