#include "collector/snapshot_pipeline.hpp"

#include <QDateTime>
#include <QUuid>

#include "collector/metadata_collector.hpp"
#include "collector/package_backend.hpp"
#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "output/snapshot_validator.hpp"
#include "output/snapshot_writer.hpp"

namespace pkgsnap {

SnapshotPipeline::SnapshotPipeline(const ManagerDetector &detector, CommandRunner &runner)
    : m_detector(detector)
    , m_runner(runner)
{
}

PipelineResult SnapshotPipeline::run(const PipelineOptions &options,
                                     const ProgressCallback &progress) const
{
    const logging::CorrelationScope corr(
        QUuid::createUuid().toString(QUuid::WithoutBraces));

    PipelineResult result;
    result.packageManager = m_detector.detect();

    const PackageBackend &backend = backendFor(result.packageManager);
    for (const QString &tool : backend.requiredTools()) {
        if (!m_runner.hasExecutable(tool)) {
            throw MissingToolError(tool.toStdString());
        }
    }

    const PackageListing listing = backend.listPackages(m_runner);
    const SystemMetadata metadata = collectSystemMetadata();

    const QDateTime capturedAt = QDateTime::currentDateTime();
    AssemblyOptions assembly;
    assembly.detailed = options.detailed;
    assembly.dryRun = options.dryRun;
    assembly.progress = progress;
    assembly.capturedAt = capturedAt;

    const SnapshotAssembler assembler(backend, m_runner);
    const PackageSnapshot snapshot = assembler.assemble(listing, metadata, assembly);
    result.packageCount = snapshot.packages.size();
    result.outputPath =
        resolveOutputPath(options.outputPath, capturedAt, options.format, options.compressed);

    const SnapshotWriter writer;
    if (options.dryRun) {
        result.preview = writer.preview(snapshot, options.format);
        PKGSNAP_LOG_INFO(QStringLiteral("SnapshotPipeline"),
                         QStringLiteral("run"),
                         QStringLiteral("dry_run_complete"),
                         QStringLiteral("test_mode"),
                         QStringLiteral("preview"),
                         pkgsnap::logging::defaultWho(),
                         QString(),
                         nlohmann::json{{"packages", result.packageCount},
                                        {"target", result.outputPath.toStdString()}});
        return result;
    }

    writer.write(result.outputPath, snapshot, options.format, options.compressed);
    result.written = true;

    if (options.validate) {
        result.validated =
            validateSnapshotFile(result.outputPath, options.format, options.compressed);
    }

    PKGSNAP_LOG_INFO(QStringLiteral("SnapshotPipeline"),
                     QStringLiteral("run"),
                     QStringLiteral("snapshot_run_complete"),
                     QStringLiteral("snapshot_run"),
                     QStringLiteral("pipeline"),
                     pkgsnap::logging::defaultWho(),
                     QString(),
                     nlohmann::json{{"backend", toKindString(result.packageManager)},
                                    {"packages", result.packageCount},
                                    {"path", result.outputPath.toStdString()},
                                    {"validated", result.validated}});
    return result;
}

} // namespace pkgsnap
