#include <vector>

#include <QByteArray>
#include <QCoreApplication>
#include <QStringList>

#include "cli/SnapshotCli.hpp"
#include "common/config.hpp"
#include "common/logging.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("pkgsnap"));

    bool traceFlag = false;
    QStringList filteredArgs;
    filteredArgs.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        const QString arg = QString::fromLocal8Bit(argv[i]);
        if (arg == QStringLiteral("--trace") || arg == QStringLiteral("-trace")) {
            traceFlag = true;
            continue;
        }
        filteredArgs.push_back(arg);
    }
    if (pkgsnap::SnapshotCli::requestsTestMode(filteredArgs)) {
        // Test mode leaves nothing on disk, log files included.
        pkgsnap::logging::setFileLoggingEnabled(false);
    }

    pkgsnap::RunConfig config = pkgsnap::loadRunConfig();
    config.traceEnabled = config.traceEnabled || traceFlag;
    pkgsnap::logging::initLogging(QStringLiteral("pkgsnap"), config.traceEnabled);

    // CLI entry point: delegate to SnapshotCli for argument parsing and output.
    pkgsnap::SnapshotCli cli(config);
    std::vector<QByteArray> localArgs;
    std::vector<char *> rawArgs;
    for (const QString &arg : filteredArgs) {
        localArgs.push_back(arg.toLocal8Bit());
    }
    for (auto &arg : localArgs) {
        rawArgs.push_back(arg.data());
    }
    return cli.run(static_cast<int>(rawArgs.size()), rawArgs.data());
}
