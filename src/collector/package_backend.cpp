#include "collector/package_backend.hpp"

#include <QRegularExpression>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace pkgsnap {

namespace {

const QRegularExpression &labelPattern()
{
    // "Depends On      : glibc" / "Summary     : text" / "Depends: libc6"
    static const QRegularExpression pattern(
        QStringLiteral(R"(^([A-Za-z][A-Za-z0-9 _-]*?)\s*:(?:\s(.*)|$))"));
    return pattern;
}

std::vector<std::string> splitList(const QString &value, QChar separator)
{
    const QStringList parts = separator.isNull()
        ? value.split(QRegularExpression(QStringLiteral("\\s+")), Qt::SkipEmptyParts)
        : value.split(separator, Qt::SkipEmptyParts);

    std::vector<std::string> items;
    items.reserve(parts.size());
    for (const QString &part : parts) {
        const QString trimmed = part.trimmed();
        if (!trimmed.isEmpty()) {
            items.push_back(trimmed.toStdString());
        }
    }
    return items;
}

std::optional<std::string> toOptionalString(const std::optional<QString> &value)
{
    if (!value.has_value() || value->isEmpty()) {
        return std::nullopt;
    }
    return value->toStdString();
}

std::string commandLine(const QString &program, const QStringList &arguments)
{
    return (QStringList{program} + arguments).join(QChar(' ')).toStdString();
}

} // namespace

PackageListing parseListingOutput(const QString &output, QChar separator,
                                  const QString &program)
{
    PackageListing listing;

    const QStringList lines = output.split(QChar('\n'));
    int lineNumber = 0;
    for (const QString &rawLine : lines) {
        ++lineNumber;
        QString line = rawLine;
        if (line.endsWith(QChar('\r'))) {
            line.chop(1);
        }
        if (line.trimmed().isEmpty()) {
            continue;
        }

        const QStringList fields = separator.isNull()
            ? line.split(QRegularExpression(QStringLiteral("\\s+")), Qt::SkipEmptyParts)
            : line.split(separator);

        const auto malformed = [&](const std::string &reason) {
            return ExternalCommandError(
                program.toStdString(), 0,
                "Unexpected output from " + program.toStdString() + " at line "
                    + std::to_string(lineNumber) + " (" + reason + "): '"
                    + line.toStdString() + "'");
        };

        if (fields.size() != 2) {
            throw malformed("expected two fields");
        }

        const std::string name = fields.at(0).trimmed().toStdString();
        const std::string version = fields.at(1).trimmed().toStdString();
        if (name.empty() || version.empty()) {
            throw malformed("empty field");
        }

        if (!listing.emplace(name, version).second) {
            throw malformed("duplicate package " + name);
        }
    }

    return listing;
}

std::optional<QString> findLabelledField(const QString &output, const QString &label,
                                         bool joinContinuations)
{
    const QStringList lines = output.split(QChar('\n'));
    for (int i = 0; i < lines.size(); ++i) {
        const QRegularExpressionMatch match = labelPattern().match(lines.at(i));
        if (!match.hasMatch() || match.captured(1).trimmed() != label) {
            continue;
        }

        QString value = match.captured(2).trimmed();
        if (joinContinuations) {
            for (int j = i + 1; j < lines.size(); ++j) {
                const QString &next = lines.at(j);
                if (next.isEmpty() || !next.at(0).isSpace()) {
                    break;
                }
                value += QChar(' ') + next.trimmed();
            }
        }
        return value;
    }
    return std::nullopt;
}

PackageListing PackageBackend::listPackages(CommandRunner &runner) const
{
    const QString program = listProgram();
    const QStringList arguments = listArguments();

    PKGSNAP_LOG_INFO(QStringLiteral("PackageBackend"),
                     QStringLiteral("listPackages"),
                     QStringLiteral("list_packages"),
                     QStringLiteral("snapshot_run"),
                     QStringLiteral("native_query"),
                     pkgsnap::logging::defaultWho(),
                     QString(),
                     nlohmann::json{{"backend", toKindString(kind())},
                                    {"program", program.toStdString()}});

    const CommandResult result = runner.run(program, arguments);
    if (!result.started) {
        throw ExternalCommandError(program.toStdString(), -1,
                                   "Failed to start " + commandLine(program, arguments)
                                       + ": " + result.standardError.toStdString());
    }
    if (result.timedOut) {
        throw ExternalCommandError(program.toStdString(), -1,
                                   "Timed out running " + commandLine(program, arguments),
                                   true);
    }
    if (!result.succeeded()) {
        std::string message = "Failed to list " + toKindString(kind()) + " packages: "
            + commandLine(program, arguments) + " exited with code "
            + std::to_string(result.exitCode);
        if (!result.standardError.isEmpty()) {
            message += " (" + result.standardError.toStdString() + ")";
        }
        throw ExternalCommandError(program.toStdString(), result.exitCode, message);
    }

    PackageListing listing = parseListingOutput(result.standardOutput, listSeparator(), program);

    PKGSNAP_LOG_INFO(QStringLiteral("PackageBackend"),
                     QStringLiteral("listPackages"),
                     QStringLiteral("list_packages_complete"),
                     QStringLiteral("snapshot_run"),
                     QStringLiteral("native_query"),
                     pkgsnap::logging::defaultWho(),
                     QString(),
                     nlohmann::json{{"backend", toKindString(kind())},
                                    {"packages", listing.size()}});
    return listing;
}

PackageDetails PackageBackend::fetchDetails(CommandRunner &runner,
                                            const std::string &name) const
{
    const QString program = detailProgram();
    const CommandResult result =
        runner.run(program, detailArguments(QString::fromStdString(name)));

    if (!result.succeeded()) {
        PKGSNAP_LOG_WARN(QStringLiteral("PackageBackend"),
                         QStringLiteral("fetchDetails"),
                         QStringLiteral("detail_fetch_failed"),
                         QStringLiteral("detail_enrichment"),
                         QStringLiteral("best_effort"),
                         pkgsnap::logging::defaultWho(),
                         QString(),
                         nlohmann::json{{"package", name},
                                        {"program", program.toStdString()},
                                        {"exitCode", result.exitCode},
                                        {"timedOut", result.timedOut}});
        return {};
    }

    return parseDetails(result.standardOutput);
}

// Apt

PackageManagerKind AptBackend::kind() const
{
    return PackageManagerKind::Apt;
}

QStringList AptBackend::requiredTools() const
{
    return {QStringLiteral("dpkg-query")};
}

QString AptBackend::listProgram() const
{
    return QStringLiteral("dpkg-query");
}

QStringList AptBackend::listArguments() const
{
    return {QStringLiteral("-W"), QStringLiteral("-f=${Package}\t${Version}\n")};
}

QChar AptBackend::listSeparator() const
{
    return QChar('\t');
}

QString AptBackend::detailProgram() const
{
    return QStringLiteral("apt-cache");
}

QStringList AptBackend::detailArguments(const QString &name) const
{
    return {QStringLiteral("show"), name};
}

PackageDetails AptBackend::parseDetails(const QString &output) const
{
    PackageDetails details;
    auto description = findLabelledField(output, QStringLiteral("Description"));
    if (!description.has_value()) {
        description = findLabelledField(output, QStringLiteral("Description-en"));
    }
    details.description = toOptionalString(description);

    if (const auto depends = findLabelledField(output, QStringLiteral("Depends"))) {
        details.dependencies = splitList(*depends, QChar(','));
    }
    return details;
}

// Yum

PackageManagerKind YumBackend::kind() const
{
    return PackageManagerKind::Yum;
}

QStringList YumBackend::requiredTools() const
{
    return {QStringLiteral("rpm")};
}

QString YumBackend::listProgram() const
{
    return QStringLiteral("rpm");
}

QStringList YumBackend::listArguments() const
{
    return {QStringLiteral("-qa"), QStringLiteral("--queryformat=%{NAME}\t%{VERSION}\n")};
}

QChar YumBackend::listSeparator() const
{
    return QChar('\t');
}

QString YumBackend::detailProgram() const
{
    return QStringLiteral("rpm");
}

QStringList YumBackend::detailArguments(const QString &name) const
{
    return {QStringLiteral("-qi"), name};
}

PackageDetails YumBackend::parseDetails(const QString &output) const
{
    PackageDetails details;
    details.description = toOptionalString(findLabelledField(output, QStringLiteral("Summary")));
    if (const auto requirements = findLabelledField(output, QStringLiteral("Requires"))) {
        details.dependencies = splitList(*requirements, QChar(','));
    }
    return details;
}

// Pacman

PackageManagerKind PacmanBackend::kind() const
{
    return PackageManagerKind::Pacman;
}

QStringList PacmanBackend::requiredTools() const
{
    return {QStringLiteral("pacman")};
}

QString PacmanBackend::listProgram() const
{
    return QStringLiteral("pacman");
}

QStringList PacmanBackend::listArguments() const
{
    return {QStringLiteral("-Q")};
}

QChar PacmanBackend::listSeparator() const
{
    return QChar();
}

QString PacmanBackend::detailProgram() const
{
    return QStringLiteral("pacman");
}

QStringList PacmanBackend::detailArguments(const QString &name) const
{
    return {QStringLiteral("-Qi"), name};
}

PackageDetails PacmanBackend::parseDetails(const QString &output) const
{
    PackageDetails details;
    details.description =
        toOptionalString(findLabelledField(output, QStringLiteral("Description")));

    if (const auto depends = findLabelledField(output, QStringLiteral("Depends On"), true)) {
        if (depends->trimmed() == QStringLiteral("None")) {
            details.dependencies = std::vector<std::string>{};
        } else {
            details.dependencies = splitList(*depends, QChar());
        }
    }
    return details;
}

const PackageBackend &backendFor(PackageManagerKind kind)
{
    static const AptBackend apt;
    static const YumBackend yum;
    static const PacmanBackend pacman;

    switch (kind) {
    case PackageManagerKind::Apt:
        return apt;
    case PackageManagerKind::Yum:
        return yum;
    case PackageManagerKind::Pacman:
        return pacman;
    case PackageManagerKind::Zypper:
        throw UnsupportedBackendError(
            "Package manager zypper is detected but not supported");
    case PackageManagerKind::Unknown:
        break;
    }
    throw UnsupportedBackendError("No supported package manager detected");
}

} // namespace pkgsnap
