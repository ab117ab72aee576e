#pragma once

#include <cstddef>
#include <string>

#include <QByteArray>
#include <QDateTime>
#include <QString>

#include "common/models.hpp"

namespace pkgsnap {

// "packages_YYYY-MM-DD_HH-MM-SS.txt|.json", plus ".gz" when compressed.
QString defaultSnapshotFileName(const QDateTime &capturedAt, OutputFormat format,
                                bool compressed);

// requested when given (with ".gz" appended if compression is on and it is
// missing), otherwise defaultSnapshotFileName().
QString resolveOutputPath(const QString &requested, const QDateTime &capturedAt,
                          OutputFormat format, bool compressed);

std::string renderText(const PackageSnapshot &snapshot);
std::string renderJson(const PackageSnapshot &snapshot);

class SnapshotWriter {
public:
    /**
     * Render snapshot and persist it at path.
     *
     * The full rendering (compressed if requested) is written to a uniquely
     * named sibling of path and renamed over path only once complete, so
     * path never holds a partial file and no existing file besides path is
     * touched. On failure the staged file is removed and WriteError is thrown.
     */
    void write(const QString &path, const PackageSnapshot &snapshot,
               OutputFormat format, bool compressed) const;

    // Rendering of the snapshot limited to its first maxPackages packages.
    // Touches no file.
    std::string preview(const PackageSnapshot &snapshot, OutputFormat format,
                        std::size_t maxPackages = 10) const;

private:
    QByteArray render(const PackageSnapshot &snapshot, OutputFormat format) const;
};

} // namespace pkgsnap
