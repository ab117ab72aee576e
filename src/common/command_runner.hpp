#pragma once

#include <chrono>

#include <QString>
#include <QStringList>

#include "common/config.hpp"

namespace pkgsnap {

struct CommandResult {
    // False when the program could not be started at all.
    bool started = false;
    bool timedOut = false;
    // False when the process crashed or was killed.
    bool exitedNormally = false;
    int exitCode = -1;
    QString standardOutput;
    QString standardError;

    bool succeeded() const
    {
        return started && !timedOut && exitedNormally && exitCode == 0;
    }
};

// Seam between the backends and the host's process table. Tests substitute a
// scripted implementation.
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    virtual CommandResult run(const QString &program,
                              const QStringList &arguments) = 0;

    // True when program resolves to an executable on PATH.
    virtual bool hasExecutable(const QString &program) const = 0;
};

// Runs commands with QProcess, each bounded by the configured timeout.
class ProcessCommandRunner : public CommandRunner {
public:
    explicit ProcessCommandRunner(
        std::chrono::milliseconds timeout = kDefaultCommandTimeout);

    CommandResult run(const QString &program,
                      const QStringList &arguments) override;
    bool hasExecutable(const QString &program) const override;

    std::chrono::milliseconds timeout() const
    {
        return m_timeout;
    }

private:
    std::chrono::milliseconds m_timeout;
};

} // namespace pkgsnap
