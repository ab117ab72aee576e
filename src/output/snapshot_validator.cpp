#include "output/snapshot_validator.hpp"

#include <exception>
#include <utility>

#include <QFile>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "output/gzip_codec.hpp"

namespace pkgsnap {

namespace {

bool reject(const QString &path, const char *reason)
{
    PKGSNAP_LOG_WARN(QStringLiteral("SnapshotValidator"),
                     QStringLiteral("validateSnapshotFile"),
                     QStringLiteral("snapshot_invalid"),
                     QStringLiteral("post_write_check"),
                     QStringLiteral("reread"),
                     pkgsnap::logging::defaultWho(),
                     QString(),
                     nlohmann::json{{"path", path.toStdString()}, {"reason", reason}});
    return false;
}

bool isWellFormedJson(const QByteArray &content)
{
    const nlohmann::json parsed = nlohmann::json::parse(
        content.constBegin(), content.constEnd(), nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return false;
    }

    const auto packages = parsed.find("packages");
    return packages != parsed.end() && packages->is_object() && !packages->empty();
}

} // namespace

bool validateSnapshotFile(const QString &path, OutputFormat format, bool compressed)
{
    try {
        QFile file(path);
        if (!file.exists()) {
            return reject(path, "missing");
        }
        if (!file.open(QIODevice::ReadOnly)) {
            return reject(path, "unreadable");
        }

        QByteArray content = file.readAll();
        if (file.error() != QFileDevice::NoError) {
            return reject(path, "read_error");
        }

        if (compressed) {
            auto inflated = gzipDecompress(content);
            if (!inflated.has_value()) {
                return reject(path, "bad_gzip_stream");
            }
            content = std::move(*inflated);
        }

        if (format == OutputFormat::Json) {
            if (!isWellFormedJson(content)) {
                return reject(path, "malformed_json");
            }
        } else if (content.trimmed().isEmpty()) {
            return reject(path, "empty_text");
        }
    } catch (const std::exception &ex) {
        PKGSNAP_LOG_WARN(QStringLiteral("SnapshotValidator"),
                         QStringLiteral("validateSnapshotFile"),
                         QStringLiteral("snapshot_validation_error"),
                         QStringLiteral("post_write_check"),
                         QStringLiteral("reread"),
                         pkgsnap::logging::defaultWho(),
                         QString(),
                         nlohmann::json{{"path", path.toStdString()},
                                        {"error", ex.what()}});
        return false;
    }

    PKGSNAP_LOG_DEBUG(QStringLiteral("SnapshotValidator"),
                      QStringLiteral("validateSnapshotFile"),
                      QStringLiteral("snapshot_valid"),
                      QStringLiteral("post_write_check"),
                      QStringLiteral("reread"),
                      pkgsnap::logging::defaultWho(),
                      QString(),
                      nlohmann::json{{"path", path.toStdString()},
                                     {"format", toFormatString(format)},
                                     {"compressed", compressed}});
    return true;
}

} // namespace pkgsnap
