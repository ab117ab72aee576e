#include "common/command_runner.hpp"

#include <QProcess>
#include <QProcessEnvironment>
#include <QStandardPaths>

#include "common/logging.hpp"

namespace pkgsnap {

ProcessCommandRunner::ProcessCommandRunner(std::chrono::milliseconds timeout)
    : m_timeout(timeout)
{
}

CommandResult ProcessCommandRunner::run(const QString &program,
                                        const QStringList &arguments)
{
    CommandResult result;

    QProcess process;
    // Parsers depend on untranslated field labels.
    QProcessEnvironment env = QProcessEnvironment::systemEnvironment();
    env.insert(QStringLiteral("LC_ALL"), QStringLiteral("C"));
    process.setProcessEnvironment(env);

    process.start(program, arguments);
    if (!process.waitForStarted()) {
        result.standardError = process.errorString();
        return result;
    }
    result.started = true;

    process.closeWriteChannel();

    const bool finished = process.waitForFinished(static_cast<int>(m_timeout.count()));
    if (!finished && process.state() != QProcess::NotRunning) {
        result.timedOut = true;
        process.kill();
        process.waitForFinished();
        result.standardError = QStringLiteral("timed out after %1 ms").arg(m_timeout.count());
        PKGSNAP_LOG_WARN(QStringLiteral("CommandRunner"),
                         QStringLiteral("run"),
                         QStringLiteral("command_timed_out"),
                         QStringLiteral("subprocess"),
                         QStringLiteral("qprocess_kill"),
                         pkgsnap::logging::defaultWho(),
                         QString(),
                         nlohmann::json{{"program", program.toStdString()},
                                        {"timeoutMs", m_timeout.count()}});
        return result;
    }

    result.exitedNormally = process.exitStatus() == QProcess::NormalExit;
    result.exitCode = result.exitedNormally ? process.exitCode() : -1;
    result.standardOutput = QString::fromUtf8(process.readAllStandardOutput());
    result.standardError = QString::fromUtf8(process.readAllStandardError()).trimmed();

    PKGSNAP_LOG_DEBUG(QStringLiteral("CommandRunner"),
                      QStringLiteral("run"),
                      QStringLiteral("command_finished"),
                      QStringLiteral("subprocess"),
                      QStringLiteral("qprocess"),
                      pkgsnap::logging::defaultWho(),
                      QString(),
                      nlohmann::json{{"program", program.toStdString()},
                                     {"args", arguments.join(QChar(' ')).toStdString()},
                                     {"exitCode", result.exitCode},
                                     {"bytes", result.standardOutput.size()}});
    return result;
}

bool ProcessCommandRunner::hasExecutable(const QString &program) const
{
    return !QStandardPaths::findExecutable(program).isEmpty();
}

} // namespace pkgsnap
