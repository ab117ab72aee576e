#include "common/os_release.hpp"

#include <QFile>
#include <QStringList>

namespace pkgsnap {

namespace {

QString unquote(const QString &value)
{
    if (value.size() >= 2) {
        const QChar first = value.front();
        if ((first == QChar('"') || first == QChar('\'')) && value.back() == first) {
            QString inner = value.mid(1, value.size() - 2);
            if (first == QChar('"')) {
                inner.replace(QStringLiteral("\\\""), QStringLiteral("\""));
                inner.replace(QStringLiteral("\\\\"), QStringLiteral("\\"));
            }
            return inner;
        }
    }
    return value;
}

} // namespace

OsReleaseFields parseOsRelease(const QString &content)
{
    OsReleaseFields fields;
    const QStringList lines = content.split(QChar('\n'));
    for (const QString &rawLine : lines) {
        const QString line = rawLine.trimmed();
        if (line.isEmpty() || line.startsWith(QChar('#'))) {
            continue;
        }

        const int eq = line.indexOf(QChar('='));
        if (eq <= 0) {
            continue;
        }

        const QString key = line.left(eq).trimmed();
        const QString value = unquote(line.mid(eq + 1).trimmed());
        fields[key.toStdString()] = value.toStdString();
    }
    return fields;
}

std::optional<OsReleaseFields> readOsRelease(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        return std::nullopt;
    }
    return parseOsRelease(QString::fromUtf8(file.readAll()));
}

} // namespace pkgsnap
