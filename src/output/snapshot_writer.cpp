#include "output/snapshot_writer.hpp"

#include <iterator>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <QSaveFile>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "output/gzip_codec.hpp"

namespace pkgsnap {

namespace {

QString extensionFor(OutputFormat format, bool compressed)
{
    QString ext = format == OutputFormat::Json ? QStringLiteral(".json")
                                               : QStringLiteral(".txt");
    if (compressed) {
        ext += QStringLiteral(".gz");
    }
    return ext;
}

std::string joinList(const std::vector<std::string> &items)
{
    std::string joined;
    for (const auto &item : items) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += item;
    }
    return joined;
}

void writeMetadataBlock(std::ostringstream &out, const SystemMetadata &metadata)
{
    out << "Hostname: " << metadata.hostname << "\n";
    out << "OS: " << metadata.osName << "\n";
    out << "OS release: " << metadata.osRelease << "\n";
    out << "Kernel version: " << metadata.kernelVersion << "\n";
    out << "Machine: " << metadata.machine << "\n";
    out << "Distribution: " << metadata.distributionId << "\n";
    out << "Distribution name: " << metadata.distributionName << "\n";
    out << "Distribution version: " << metadata.distributionVersion << "\n";
    out << "Distribution codename: " << metadata.distributionCodename << "\n";
    out << "Runtime version: " << metadata.runtimeVersion << "\n";
    out << "Runtime implementation: " << metadata.runtimeImplementation << "\n";
    out << "CPU count: " << metadata.cpuCount << "\n";
    out << "CPU architecture: " << metadata.cpuArchitecture << "\n";
}

void checkPersistable(const PackageSnapshot &snapshot)
{
    if (snapshot.packages.empty()) {
        throw WriteError("Refusing to write a snapshot without packages");
    }
    if (snapshot.packageManager == PackageManagerKind::Unknown
        || snapshot.packageManager == PackageManagerKind::Zypper) {
        throw WriteError("Refusing to write a snapshot for unsupported package manager "
                         + toKindString(snapshot.packageManager));
    }
}

// QSaveFile stages into a uniquely named sibling and only replaces the
// destination on commit(); an uncommitted file is discarded on destruction.
void writeAtomically(const QString &path, const QByteArray &payload)
{
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        throw WriteError("Cannot open " + path.toStdString() + " for writing: "
                         + file.errorString().toStdString());
    }
    if (file.write(payload) != payload.size()) {
        throw WriteError("Short write to " + path.toStdString() + ": "
                         + file.errorString().toStdString());
    }
    if (!file.commit()) {
        throw WriteError("Cannot move staged file into " + path.toStdString() + ": "
                         + file.errorString().toStdString());
    }
}

} // namespace

QString defaultSnapshotFileName(const QDateTime &capturedAt, OutputFormat format,
                                bool compressed)
{
    return QStringLiteral("packages_")
        + capturedAt.toString(QStringLiteral("yyyy-MM-dd_HH-mm-ss"))
        + extensionFor(format, compressed);
}

QString resolveOutputPath(const QString &requested, const QDateTime &capturedAt,
                          OutputFormat format, bool compressed)
{
    if (requested.isEmpty()) {
        return defaultSnapshotFileName(capturedAt, format, compressed);
    }
    if (compressed && !requested.endsWith(QStringLiteral(".gz"))) {
        return requested + QStringLiteral(".gz");
    }
    return requested;
}

std::string renderText(const PackageSnapshot &snapshot)
{
    std::ostringstream out;
    writeMetadataBlock(out, snapshot.metadata);
    out << "\n";
    out << "Snapshot taken at: " << snapshot.timestamp << "\n";
    out << "Package manager: " << toKindString(snapshot.packageManager) << "\n";
    out << "\n";

    for (const auto &[name, record] : snapshot.packages) {
        out << name << " (" << record.version << ")\n";
        if (record.description.has_value()) {
            out << "  Description: " << *record.description << "\n";
        }
        if (record.dependencies.has_value()) {
            const std::string deps = joinList(*record.dependencies);
            out << "  Depends: " << (deps.empty() ? "(none)" : deps) << "\n";
        }
    }
    return out.str();
}

std::string renderJson(const PackageSnapshot &snapshot)
{
    const nlohmann::json payload = snapshot;
    // Package descriptions are not guaranteed to be valid UTF-8.
    return payload.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";
}

QByteArray SnapshotWriter::render(const PackageSnapshot &snapshot, OutputFormat format) const
{
    const std::string rendered =
        format == OutputFormat::Json ? renderJson(snapshot) : renderText(snapshot);
    return QByteArray::fromStdString(rendered);
}

void SnapshotWriter::write(const QString &path, const PackageSnapshot &snapshot,
                           OutputFormat format, bool compressed) const
{
    checkPersistable(snapshot);

    try {
        QByteArray payload = render(snapshot, format);
        if (compressed) {
            payload = gzipCompress(payload);
        }
        writeAtomically(path, payload);
    } catch (const WriteError &ex) {
        PKGSNAP_LOG_ERROR(QStringLiteral("SnapshotWriter"),
                          QStringLiteral("write"),
                          QStringLiteral("snapshot_write_failed"),
                          QStringLiteral("snapshot_run"),
                          QStringLiteral("atomic_rename"),
                          pkgsnap::logging::defaultWho(),
                          QString(),
                          nlohmann::json{{"path", path.toStdString()},
                                         {"error", ex.what()}});
        throw;
    } catch (const std::exception &ex) {
        PKGSNAP_LOG_ERROR(QStringLiteral("SnapshotWriter"),
                          QStringLiteral("write"),
                          QStringLiteral("snapshot_render_failed"),
                          QStringLiteral("snapshot_run"),
                          QStringLiteral("render"),
                          pkgsnap::logging::defaultWho(),
                          QString(),
                          nlohmann::json{{"path", path.toStdString()},
                                         {"error", ex.what()}});
        throw WriteError("Failed to render snapshot for " + path.toStdString() + ": "
                         + ex.what());
    }

    PKGSNAP_LOG_INFO(QStringLiteral("SnapshotWriter"),
                     QStringLiteral("write"),
                     QStringLiteral("snapshot_written"),
                     QStringLiteral("snapshot_run"),
                     QStringLiteral("atomic_rename"),
                     pkgsnap::logging::defaultWho(),
                     QString(),
                     nlohmann::json{{"path", path.toStdString()},
                                    {"format", toFormatString(format)},
                                    {"compressed", compressed},
                                    {"packages", snapshot.packages.size()}});
}

std::string SnapshotWriter::preview(const PackageSnapshot &snapshot, OutputFormat format,
                                    std::size_t maxPackages) const
{
    PackageSnapshot sample = snapshot;
    if (sample.packages.size() > maxPackages) {
        auto cut = sample.packages.begin();
        std::advance(cut, static_cast<std::ptrdiff_t>(maxPackages));
        sample.packages.erase(cut, sample.packages.end());
    }

    std::string rendered = render(sample, format).toStdString();
    if (snapshot.packages.size() > maxPackages) {
        rendered += "... (" + std::to_string(snapshot.packages.size() - maxPackages)
            + " more packages)\n";
    }
    return rendered;
}

} // namespace pkgsnap
