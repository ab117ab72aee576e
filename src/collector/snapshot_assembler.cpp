#include "collector/snapshot_assembler.hpp"

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace pkgsnap {

QString formatSnapshotTimestamp(const QDateTime &capturedAt)
{
    return capturedAt.toString(QStringLiteral("yyyy-MM-dd HH:mm:ss"));
}

SnapshotAssembler::SnapshotAssembler(const PackageBackend &backend, CommandRunner &runner)
    : m_backend(backend)
    , m_runner(runner)
{
}

PackageSnapshot SnapshotAssembler::assemble(const PackageListing &listing,
                                            const SystemMetadata &metadata,
                                            const AssemblyOptions &options) const
{
    if (listing.empty()) {
        PKGSNAP_LOG_ERROR(QStringLiteral("SnapshotAssembler"),
                          QStringLiteral("assemble"),
                          QStringLiteral("empty_inventory"),
                          QStringLiteral("snapshot_run"),
                          QStringLiteral("listing_check"),
                          pkgsnap::logging::defaultWho(),
                          QString(),
                          nlohmann::json{{"backend", toKindString(m_backend.kind())}});
        throw EmptyInventoryError();
    }

    PackageSnapshot snapshot;
    snapshot.timestamp =
        formatSnapshotTimestamp(options.capturedAt.value_or(QDateTime::currentDateTime()))
            .toStdString();
    snapshot.packageManager = m_backend.kind();
    snapshot.metadata = metadata;

    const bool reportProgress = options.detailed && !options.dryRun && options.progress;
    const std::size_t total = listing.size();
    std::size_t processed = 0;

    for (const auto &[name, version] : listing) {
        PackageRecord record;
        record.name = name;
        record.version = version;

        if (options.detailed) {
            PackageDetails details = m_backend.fetchDetails(m_runner, name);
            record.description = std::move(details.description);
            record.dependencies = std::move(details.dependencies);

            ++processed;
            if (reportProgress) {
                options.progress(processed, total);
            }
        }

        snapshot.packages.emplace(name, std::move(record));
    }

    PKGSNAP_LOG_INFO(QStringLiteral("SnapshotAssembler"),
                     QStringLiteral("assemble"),
                     QStringLiteral("snapshot_assembled"),
                     QStringLiteral("snapshot_run"),
                     options.detailed ? QStringLiteral("detail_enrichment")
                                      : QStringLiteral("versions_only"),
                     pkgsnap::logging::defaultWho(),
                     QString(),
                     nlohmann::json{{"backend", toKindString(snapshot.packageManager)},
                                    {"packages", snapshot.packages.size()},
                                    {"timestamp", snapshot.timestamp}});
    return snapshot;
}

} // namespace pkgsnap
