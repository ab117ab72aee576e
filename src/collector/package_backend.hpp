#pragma once

#include <optional>
#include <string>

#include <QChar>
#include <QString>
#include <QStringList>

#include "common/command_runner.hpp"
#include "common/models.hpp"

namespace pkgsnap {

/**
 * Operations a native package manager supports: enumerate installed packages
 * and fetch per-package details.
 *
 * Concrete backends only describe their commands and field labels; running
 * the commands and parsing the output is shared.
 */
class PackageBackend {
public:
    virtual ~PackageBackend() = default;

    virtual PackageManagerKind kind() const = 0;

    // Executables that must be on PATH before listing starts.
    virtual QStringList requiredTools() const = 0;

    // Runs the listing command. Throws ExternalCommandError on a failed
    // command, a malformed line or a duplicate package name.
    PackageListing listPackages(CommandRunner &runner) const;

    // Best-effort: any command failure yields an empty PackageDetails.
    PackageDetails fetchDetails(CommandRunner &runner, const std::string &name) const;

protected:
    virtual QString listProgram() const = 0;
    virtual QStringList listArguments() const = 0;
    // A null separator splits on any run of whitespace.
    virtual QChar listSeparator() const = 0;

    virtual QString detailProgram() const = 0;
    virtual QStringList detailArguments(const QString &name) const = 0;
    virtual PackageDetails parseDetails(const QString &output) const = 0;
};

class AptBackend final : public PackageBackend {
public:
    PackageManagerKind kind() const override;
    QStringList requiredTools() const override;

protected:
    QString listProgram() const override;
    QStringList listArguments() const override;
    QChar listSeparator() const override;
    QString detailProgram() const override;
    QStringList detailArguments(const QString &name) const override;
    PackageDetails parseDetails(const QString &output) const override;
};

class YumBackend final : public PackageBackend {
public:
    PackageManagerKind kind() const override;
    QStringList requiredTools() const override;

protected:
    QString listProgram() const override;
    QStringList listArguments() const override;
    QChar listSeparator() const override;
    QString detailProgram() const override;
    QStringList detailArguments(const QString &name) const override;
    PackageDetails parseDetails(const QString &output) const override;
};

class PacmanBackend final : public PackageBackend {
public:
    PackageManagerKind kind() const override;
    QStringList requiredTools() const override;

protected:
    QString listProgram() const override;
    QStringList listArguments() const override;
    QChar listSeparator() const override;
    QString detailProgram() const override;
    QStringList detailArguments(const QString &name) const override;
    PackageDetails parseDetails(const QString &output) const override;
};

// Registry lookup. Throws UnsupportedBackendError for Zypper and Unknown.
const PackageBackend &backendFor(PackageManagerKind kind);

// Parse "<name><sep><version>" lines. Empty lines are skipped; any other line
// that does not yield exactly two non-empty fields, and any repeated name,
// throws ExternalCommandError naming program.
PackageListing parseListingOutput(const QString &output, QChar separator,
                                  const QString &program);

// First value of "Label : value" in output, with any amount of padding
// before the colon. With joinContinuations, following indented lines that are
// not themselves labelled are appended (pacman wraps long lists that way).
std::optional<QString> findLabelledField(const QString &output, const QString &label,
                                         bool joinContinuations = false);

} // namespace pkgsnap
